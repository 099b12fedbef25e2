/*
 * 설명: 발행/구독/큐 그룹/회신 인박스를 제공하는 메시지 전송 계층 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/in_process_bus_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace tokengw {

struct BusMessage {
  std::string subject;
  std::string reply_to;
  std::string data;
  // 전송 계층 상태. 0은 일반 메시지, kNoRespondersStatus는 회신 주제에 대한 응답자 없음 통지.
  int status{0};
};

constexpr int kNoRespondersStatus = 503;

using MessageHandler = std::function<void(const BusMessage&)>;

// 모든 구현은 스레드 안전해야 한다. 핸들러는 구현의 콜백 스레드에서 호출된다.
class MessageBus {
 public:
  virtual ~MessageBus() = default;

  virtual bool IsConnected() const = 0;

  // 실패 시 BusError를 던진다.
  virtual void Publish(const std::string& subject, const std::string& reply_to, const std::string& data) = 0;

  // queue_group이 비어 있지 않으면 같은 그룹의 구독자 중 하나에게만 전달된다.
  virtual std::uint64_t Subscribe(const std::string& subject, const std::string& queue_group,
                                  MessageHandler handler) = 0;
  virtual void Unsubscribe(std::uint64_t sid) = 0;

  virtual std::string NewInbox() = 0;
  virtual std::size_t SubscriptionCount() const = 0;
};

// 토큰 단위 주제 매칭. '*'는 토큰 하나, '>'는 나머지 전부(마지막 토큰에서만).
bool SubjectMatches(const std::string& pattern, const std::string& subject);

}  // namespace tokengw
