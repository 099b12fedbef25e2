/*
 * 설명: 프로세스 내부 브로커의 구독 관리, 큐 그룹 분배, 비동기 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/in_process_bus_test.cpp
 */
#include "tokengw/in_process_bus.hpp"

#include <vector>

#include <boost/asio/post.hpp>

#include "tokengw/errors.hpp"
#include "tokengw/random_id.hpp"

namespace tokengw {

namespace {
constexpr const char* kComponent = "inproc-bus";
}  // namespace

InProcessBus::InProcessBus(std::size_t callback_threads, std::shared_ptr<Observability> observability)
    : observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      callbacks_(callback_threads) {}

InProcessBus::~InProcessBus() {
  Close();
  callbacks_.stop();
  callbacks_.join();
}

bool InProcessBus::IsConnected() const { return !closed_; }

void InProcessBus::Publish(const std::string& subject, const std::string& reply_to, const std::string& data) {
  if (closed_) {
    throw BusError("버스가 닫혔습니다");
  }
  std::vector<std::shared_ptr<MessageHandler>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // 큐 그룹별 후보를 모은 뒤 라운드로빈으로 하나만 고른다.
    std::map<std::string, std::vector<std::shared_ptr<MessageHandler>>> groups;
    for (const auto& [sid, sub] : subscriptions_) {
      if (!SubjectMatches(sub.subject, subject)) {
        continue;
      }
      if (sub.queue_group.empty()) {
        targets.push_back(sub.handler);
      } else {
        groups[sub.queue_group].push_back(sub.handler);
      }
    }
    for (auto& [group, members] : groups) {
      auto& cursor = round_robin_[group];
      targets.push_back(members[cursor % members.size()]);
      ++cursor;
    }
  }

  if (targets.empty()) {
    if (!reply_to.empty()) {
      throw BusError("응답할 구독자가 없습니다: " + subject, true);
    }
    return;
  }
  for (auto& handler : targets) {
    Deliver(std::move(handler), BusMessage{subject, reply_to, data});
  }
}

std::uint64_t InProcessBus::Subscribe(const std::string& subject, const std::string& queue_group,
                                      MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto sid = next_sid_++;
  subscriptions_.emplace(sid, Subscription{subject, queue_group, std::make_shared<MessageHandler>(std::move(handler))});
  return sid;
}

void InProcessBus::Unsubscribe(std::uint64_t sid) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.erase(sid);
}

std::string InProcessBus::NewInbox() { return "_INBOX." + RandomHex(11); }

std::size_t InProcessBus::SubscriptionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

void InProcessBus::Close() { closed_ = true; }

void InProcessBus::Deliver(std::shared_ptr<MessageHandler> handler, BusMessage message) {
  boost::asio::post(callbacks_, [this, handler = std::move(handler), message = std::move(message)]() {
    delivered_.fetch_add(1);
    try {
      (*handler)(message);
    } catch (const std::exception& ex) {
      observability_->Log(LogLevel::kError, kComponent, "bus.handler_failed", message.subject + ": " + ex.what());
    }
  });
}

}  // namespace tokengw
