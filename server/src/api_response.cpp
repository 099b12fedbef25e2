/*
 * 설명: 토큰/오류 응답 본문을 생성하고 오류 분류를 상태 코드로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/response_body_test.cpp
 */
#include "tokengw/api_response.hpp"

namespace tokengw {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMalformedRequest:
      return "malformed_request";
    case ErrorKind::kMissingCredential:
      return "missing_credential";
    case ErrorKind::kUpstreamTimeout:
      return "upstream_timeout";
    case ErrorKind::kUpstreamUnavailable:
      return "upstream_unavailable";
    case ErrorKind::kSerializationFailure:
      return "serialization_failure";
    case ErrorKind::kUpstreamRejected:
      return "upstream_rejected";
  }
  return "unknown";
}

nlohmann::json MakeTokenPayload(std::string_view access_token, std::string_view token_type, std::string_view source) {
  return {{"access_token", access_token}, {"token_type", token_type}, {"source", source}};
}

nlohmann::json MakeErrorPayload(std::string_view message) { return {{"error", message}}; }

GatewayReply MakeTokenReply(std::string_view access_token, std::string_view token_type, std::string_view source) {
  return GatewayReply{200, std::string(kJsonContentType), MakeTokenPayload(access_token, token_type, source).dump()};
}

GatewayReply MakeJsonErrorReply(unsigned status, std::string_view message) {
  return GatewayReply{status, std::string(kJsonContentType), MakeErrorPayload(message).dump()};
}

GatewayReply MakeTextReply(unsigned status, std::string_view text) {
  return GatewayReply{status, std::string(kTextContentType), std::string(text)};
}

GatewayReply MapFailure(const GatewayFailure& failure) {
  switch (failure.kind) {
    case ErrorKind::kMalformedRequest:
    case ErrorKind::kMissingCredential:
    case ErrorKind::kUpstreamRejected:
      return MakeJsonErrorReply(400, failure.message);
    case ErrorKind::kUpstreamTimeout:
      return MakeTextReply(504, "Request timed out");
    case ErrorKind::kSerializationFailure:
      return MakeTextReply(500, failure.message.empty() ? "Failed to process response" : failure.message);
    case ErrorKind::kUpstreamUnavailable:
      break;
  }
  return MakeTextReply(500, "Failed to process request");
}

}  // namespace tokengw
