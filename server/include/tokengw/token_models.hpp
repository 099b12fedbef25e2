/*
 * 설명: 토큰 요청/응답 메시지 모델과 JSON 직렬화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_models_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tokengw {

struct ClientCredentials {
  std::string client_id;
  std::string client_secret;
};

struct TokenRequest {
  std::string request_id;
  std::string client_id;
  std::string client_secret;
  std::chrono::system_clock::time_point timestamp;
};

struct TokenResponse {
  std::string request_id;
  std::string access_token;
  std::string token_type;
  int expires_in{0};
  std::string scope;
  std::string error;
  std::chrono::system_clock::time_point timestamp;

  bool Failed() const { return !error.empty(); }
};

TokenRequest MakeTokenRequest(const ClientCredentials& credentials);
TokenResponse MakeTokenResponse(const std::string& request_id, const std::string& access_token,
                                const std::string& token_type, const std::string& scope, int expires_in);
TokenResponse MakeErrorResponse(const std::string& request_id, const std::string& error_message);

nlohmann::json ToJson(const TokenRequest& request);
nlohmann::json ToJson(const TokenResponse& response);

std::optional<TokenRequest> ParseTokenRequest(const std::string& data, std::string& error_message);
std::optional<TokenResponse> ParseTokenResponse(const std::string& data, std::string& error_message);

std::string ToIsoString(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> FromIsoString(const std::string& value);

}  // namespace tokengw
