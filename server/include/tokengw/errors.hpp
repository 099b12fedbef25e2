/*
 * 설명: 게이트웨이 전반에서 사용하는 오류 분류와 실패 정보를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/response_body_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tokengw {

enum class ErrorKind {
  kMalformedRequest,
  kMissingCredential,
  kUpstreamTimeout,
  kUpstreamUnavailable,
  kSerializationFailure,
  kUpstreamRejected,
};

struct GatewayFailure {
  ErrorKind kind{ErrorKind::kUpstreamUnavailable};
  std::string message;
};

std::string_view ErrorKindName(ErrorKind kind);

// 전송 계층(버스 바인딩) 오류. no_responders는 요청을 받을 구독자가 없을 때 설정된다.
class BusError : public std::runtime_error {
 public:
  BusError(const std::string& message, bool no_responders = false)
      : std::runtime_error(message), no_responders(no_responders) {}
  bool no_responders;
};

// 난수원(OpenSSL RAND_bytes) 실패. 요청 ID와 인박스 이름을 만들 수 없다.
class RandomSourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class IdpError : public std::runtime_error {
 public:
  IdpError(const std::string& message, unsigned status = 0) : std::runtime_error(message), status(status) {}
  unsigned status;
};

}  // namespace tokengw
