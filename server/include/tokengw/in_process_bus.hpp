/*
 * 설명: 단일 프로세스 안에서 동작하는 메시지 브로커. 테스트와 inproc 전송 모드에서 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/in_process_bus_test.cpp
 */
#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/thread_pool.hpp>

#include "tokengw/message_bus.hpp"
#include "tokengw/observability.hpp"

namespace tokengw {

class InProcessBus : public MessageBus {
 public:
  // observability가 없으면 기본 로거(stdout, info)로 핸들러 예외를 남긴다.
  explicit InProcessBus(std::size_t callback_threads = 4, std::shared_ptr<Observability> observability = nullptr);
  ~InProcessBus() override;

  bool IsConnected() const override;
  void Publish(const std::string& subject, const std::string& reply_to, const std::string& data) override;
  std::uint64_t Subscribe(const std::string& subject, const std::string& queue_group,
                          MessageHandler handler) override;
  void Unsubscribe(std::uint64_t sid) override;
  std::string NewInbox() override;
  std::size_t SubscriptionCount() const override;

  // 이후 Publish는 BusError를 던진다.
  void Close();
  std::uint64_t DeliveredCount() const { return delivered_.load(); }

 private:
  struct Subscription {
    std::string subject;
    std::string queue_group;
    std::shared_ptr<MessageHandler> handler;
  };

  void Deliver(std::shared_ptr<MessageHandler> handler, BusMessage message);

  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool callbacks_;
  mutable std::mutex mutex_;
  std::map<std::uint64_t, Subscription> subscriptions_;
  std::unordered_map<std::string, std::size_t> round_robin_;
  std::uint64_t next_sid_{1};
  std::atomic<bool> closed_{false};
  std::atomic<std::uint64_t> delivered_{0};
};

}  // namespace tokengw
