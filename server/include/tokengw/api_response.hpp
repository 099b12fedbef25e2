/*
 * 설명: /token 응답 본문과 오류 분류별 HTTP 매핑을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/response_body_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "tokengw/errors.hpp"

namespace tokengw {

inline constexpr std::string_view kSourceCache = "cache";
inline constexpr std::string_view kSourceIdp = "idp";

inline constexpr std::string_view kJsonContentType = "application/json";
inline constexpr std::string_view kTextContentType = "text/plain; charset=utf-8";

struct GatewayReply {
  unsigned status{200};
  std::string content_type;
  std::string body;
};

nlohmann::json MakeTokenPayload(std::string_view access_token, std::string_view token_type, std::string_view source);
nlohmann::json MakeErrorPayload(std::string_view message);

GatewayReply MakeTokenReply(std::string_view access_token, std::string_view token_type, std::string_view source);
GatewayReply MakeJsonErrorReply(unsigned status, std::string_view message);
GatewayReply MakeTextReply(unsigned status, std::string_view text);

// 실패 분류를 HTTP 상태와 본문으로 변환한다. 400 계열은 JSON, 그 외는 텍스트.
GatewayReply MapFailure(const GatewayFailure& failure);

}  // namespace tokengw
