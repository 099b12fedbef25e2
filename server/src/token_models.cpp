/*
 * 설명: 토큰 요청/응답의 생성과 JSON 인코딩/디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_models_test.cpp
 */
#include "tokengw/token_models.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

#include "tokengw/random_id.hpp"

namespace tokengw {

namespace {
// 키가 없거나 null이면 true(기본값 유지), 타입이 다르면 false.
bool ReadString(const nlohmann::json& object, const char* key, std::string& dest) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  dest = it->get<std::string>();
  return true;
}

bool ReadInt(const nlohmann::json& object, const char* key, int& dest) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    return false;
  }
  // int 범위를 벗어나면 잘라 내지 않고 형식 오류로 본다.
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return false;
    }
    dest = static_cast<int>(value);
    return true;
  }
  auto value = it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return false;
  }
  dest = static_cast<int>(value);
  return true;
}

void ReadTimestamp(const nlohmann::json& object, std::chrono::system_clock::time_point& dest) {
  auto it = object.find("timestamp");
  if (it == object.end() || !it->is_string()) {
    return;
  }
  if (auto parsed = FromIsoString(it->get<std::string>())) {
    dest = *parsed;
  }
}

std::optional<nlohmann::json> ParseObject(const std::string& data, std::string& error_message) {
  auto parsed = nlohmann::json::parse(data, nullptr, false);
  if (parsed.is_discarded()) {
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!parsed.is_object()) {
    error_message = "JSON 객체가 아닙니다";
    return std::nullopt;
  }
  return parsed;
}
}  // namespace

TokenRequest MakeTokenRequest(const ClientCredentials& credentials) {
  return TokenRequest{GenerateRequestId(), credentials.client_id, credentials.client_secret,
                      std::chrono::system_clock::now()};
}

TokenResponse MakeTokenResponse(const std::string& request_id, const std::string& access_token,
                                const std::string& token_type, const std::string& scope, int expires_in) {
  TokenResponse response;
  response.request_id = request_id;
  response.access_token = access_token;
  response.token_type = token_type;
  response.scope = scope;
  response.expires_in = expires_in;
  response.timestamp = std::chrono::system_clock::now();
  return response;
}

TokenResponse MakeErrorResponse(const std::string& request_id, const std::string& error_message) {
  TokenResponse response;
  response.request_id = request_id;
  response.error = error_message;
  response.timestamp = std::chrono::system_clock::now();
  return response;
}

nlohmann::json ToJson(const TokenRequest& request) {
  return {{"request_id", request.request_id},
          {"client_id", request.client_id},
          {"client_secret", request.client_secret},
          {"timestamp", ToIsoString(request.timestamp)}};
}

nlohmann::json ToJson(const TokenResponse& response) {
  nlohmann::json j;
  j["request_id"] = response.request_id;
  j["access_token"] = response.access_token;
  j["token_type"] = response.token_type;
  j["expires_in"] = response.expires_in;
  if (!response.scope.empty()) {
    j["scope"] = response.scope;
  }
  if (!response.error.empty()) {
    j["error"] = response.error;
  }
  j["timestamp"] = ToIsoString(response.timestamp);
  return j;
}

std::optional<TokenRequest> ParseTokenRequest(const std::string& data, std::string& error_message) {
  auto object = ParseObject(data, error_message);
  if (!object) {
    return std::nullopt;
  }
  TokenRequest request;
  if (!ReadString(*object, "request_id", request.request_id) ||
      !ReadString(*object, "client_id", request.client_id) ||
      !ReadString(*object, "client_secret", request.client_secret)) {
    error_message = "필드 형식이 올바르지 않습니다";
    return std::nullopt;
  }
  ReadTimestamp(*object, request.timestamp);
  return request;
}

std::optional<TokenResponse> ParseTokenResponse(const std::string& data, std::string& error_message) {
  auto object = ParseObject(data, error_message);
  if (!object) {
    return std::nullopt;
  }
  TokenResponse response;
  if (!ReadString(*object, "request_id", response.request_id) ||
      !ReadString(*object, "access_token", response.access_token) ||
      !ReadString(*object, "token_type", response.token_type) ||
      !ReadInt(*object, "expires_in", response.expires_in) ||
      !ReadString(*object, "scope", response.scope) ||
      !ReadString(*object, "error", response.error)) {
    error_message = "필드 형식이 올바르지 않습니다";
    return std::nullopt;
  }
  ReadTimestamp(*object, response.timestamp);
  return response;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

// 초 단위까지만 해석한다. 소수초와 오프셋은 무시한다.
std::optional<std::chrono::system_clock::time_point> FromIsoString(const std::string& value) {
  std::tm tm{};
  std::istringstream iss(value);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}  // namespace tokengw
