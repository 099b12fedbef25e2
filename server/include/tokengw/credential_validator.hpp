/*
 * 설명: /token 요청 본문을 클라이언트 자격 증명으로 해석하고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_validator_test.cpp
 */
#pragma once

#include <optional>
#include <string_view>

#include "tokengw/errors.hpp"
#include "tokengw/token_models.hpp"

namespace tokengw {

inline constexpr std::string_view kMalformedRequestMessage = "Invalid request format";
inline constexpr std::string_view kMissingCredentialMessage = "Client ID and Client Secret are required";

std::optional<ClientCredentials> ValidateCredentials(std::string_view body, GatewayFailure& failure);

}  // namespace tokengw
