/*
 * 설명: NATS 텍스트 프로토콜의 명령 인코딩과 증분 파서.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/nats_protocol_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tokengw/config.hpp"

namespace tokengw {

struct NatsEvent {
  enum class Type { kInfo, kMsg, kPing, kPong, kOk, kErr };

  Type type{Type::kOk};
  std::string subject;
  std::uint64_t sid{0};
  std::string reply_to;
  // MSG 본문, INFO JSON, -ERR 메시지.
  std::string payload;
  // HMSG 헤더 블록과 "NATS/1.0 <code>" 상태 코드. 헤더가 없으면 0.
  std::string headers;
  int status{0};
};

constexpr std::size_t kDefaultNatsMaxPayload = 1024 * 1024;

// 수신 바이트를 누적하면서 완성된 서버 명령을 꺼낸다. 프로토콜 위반 시 BusError.
// HMSG는 type kMsg로 꺼내며 headers/status가 채워진다.
class NatsProtocolParser {
 public:
  std::vector<NatsEvent> Feed(std::string_view chunk);
  std::size_t Buffered() const { return buffer_.size(); }

  // 서버 INFO의 max_payload. 이보다 큰 MSG/HMSG는 BusError.
  void SetMaxPayload(std::size_t max_payload) { max_payload_ = max_payload; }
  std::size_t MaxPayload() const { return max_payload_; }

 private:
  NatsEvent ParseControlLine(const std::string& line);
  void ExpectBody(std::size_t header_size, std::size_t total_size);

  std::string buffer_;
  std::optional<NatsEvent> pending_msg_;
  std::size_t pending_size_{0};
  std::size_t pending_header_size_{0};
  std::size_t max_payload_{kDefaultNatsMaxPayload};
};

// "NATS/1.0 503" 같은 헤더 첫 줄에서 상태 코드를 읽는다. 없으면 0.
int ParseHeaderStatus(const std::string& headers);

struct NatsEndpoint {
  std::string host;
  std::string port{"4222"};
  std::string user;
  std::string password;
};

// nats://[user:pass@]host[:port] 형식. 잘못된 URL은 BusError.
NatsEndpoint ParseNatsUrl(const std::string& url);

std::string EncodeConnect(const NatsSettings& settings, const NatsEndpoint& endpoint, const std::string& client_name);
std::string EncodePub(const std::string& subject, const std::string& reply_to, const std::string& payload);
std::string EncodeSub(const std::string& subject, const std::string& queue_group, std::uint64_t sid);
std::string EncodeUnsub(std::uint64_t sid);

}  // namespace tokengw
