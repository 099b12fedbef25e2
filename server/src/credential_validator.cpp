/*
 * 설명: 자격 증명 본문 디코딩과 필수 필드 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_validator_test.cpp
 */
#include "tokengw/credential_validator.hpp"

#include <nlohmann/json.hpp>

namespace tokengw {

namespace {
GatewayFailure Malformed() { return GatewayFailure{ErrorKind::kMalformedRequest, std::string(kMalformedRequestMessage)}; }
}  // namespace

std::optional<ClientCredentials> ValidateCredentials(std::string_view body, GatewayFailure& failure) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    failure = Malformed();
    return std::nullopt;
  }

  ClientCredentials credentials;
  for (auto [key, dest] : {std::pair{"client_id", &credentials.client_id},
                           std::pair{"client_secret", &credentials.client_secret}}) {
    auto it = parsed.find(key);
    if (it == parsed.end() || it->is_null()) {
      continue;
    }
    if (!it->is_string()) {
      failure = Malformed();
      return std::nullopt;
    }
    *dest = it->get<std::string>();
  }

  if (credentials.client_id.empty() || credentials.client_secret.empty()) {
    failure = GatewayFailure{ErrorKind::kMissingCredential, std::string(kMissingCredentialMessage)};
    return std::nullopt;
  }
  return credentials;
}

}  // namespace tokengw
