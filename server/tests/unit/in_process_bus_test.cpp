#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "tokengw/errors.hpp"
#include "tokengw/in_process_bus.hpp"

namespace {

using namespace std::chrono_literals;

class Inbox {
 public:
  void Push(const tokengw::BusMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
    cv_.notify_all();
  }

  bool WaitFor(std::size_t count, std::chrono::milliseconds timeout = 2s) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return messages_.size() >= count; });
  }

  std::vector<tokengw::BusMessage> Messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<tokengw::BusMessage> messages_;
};

TEST(InProcessBusTest, DeliversToPlainSubscribersWithReplySubject) {
  tokengw::InProcessBus bus;
  Inbox first;
  Inbox second;
  bus.Subscribe("token.request", "", [&](const tokengw::BusMessage& m) { first.Push(m); });
  bus.Subscribe("token.*", "", [&](const tokengw::BusMessage& m) { second.Push(m); });

  bus.Publish("token.request", "_INBOX.abc", "payload");
  ASSERT_TRUE(first.WaitFor(1));
  ASSERT_TRUE(second.WaitFor(1));
  auto message = first.Messages().front();
  EXPECT_EQ(message.subject, "token.request");
  EXPECT_EQ(message.reply_to, "_INBOX.abc");
  EXPECT_EQ(message.data, "payload");
}

TEST(InProcessBusTest, QueueGroupDeliversEachMessageOnce) {
  tokengw::InProcessBus bus;
  std::atomic<int> a{0};
  std::atomic<int> b{0};
  Inbox all;
  bus.Subscribe("token.request", "workers", [&](const tokengw::BusMessage& m) {
    a.fetch_add(1);
    all.Push(m);
  });
  bus.Subscribe("token.request", "workers", [&](const tokengw::BusMessage& m) {
    b.fetch_add(1);
    all.Push(m);
  });

  for (int i = 0; i < 10; ++i) {
    bus.Publish("token.request", "", std::to_string(i));
  }
  ASSERT_TRUE(all.WaitFor(10));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(a.load() + b.load(), 10);
  EXPECT_EQ(a.load(), 5);
  EXPECT_EQ(b.load(), 5);
}

TEST(InProcessBusTest, RequestWithoutRespondersFailsFast) {
  tokengw::InProcessBus bus;
  try {
    bus.Publish("token.request", "_INBOX.x", "{}");
    FAIL() << "BusError expected";
  } catch (const tokengw::BusError& ex) {
    EXPECT_TRUE(ex.no_responders);
  }
  EXPECT_NO_THROW(bus.Publish("token.request", "", "{}"));
}

TEST(InProcessBusTest, UnsubscribeStopsDelivery) {
  tokengw::InProcessBus bus;
  Inbox inbox;
  auto sid = bus.Subscribe("a.b", "", [&](const tokengw::BusMessage& m) { inbox.Push(m); });
  EXPECT_EQ(bus.SubscriptionCount(), 1u);
  bus.Unsubscribe(sid);
  EXPECT_EQ(bus.SubscriptionCount(), 0u);
  bus.Publish("a.b", "", "x");
  EXPECT_FALSE(inbox.WaitFor(1, 50ms));
}

TEST(InProcessBusTest, ClosedBusRejectsPublish) {
  tokengw::InProcessBus bus;
  EXPECT_TRUE(bus.IsConnected());
  bus.Close();
  EXPECT_FALSE(bus.IsConnected());
  EXPECT_THROW(bus.Publish("a", "", "x"), tokengw::BusError);
}

TEST(InProcessBusTest, InboxesAreUnique) {
  tokengw::InProcessBus bus;
  auto a = bus.NewInbox();
  auto b = bus.NewInbox();
  EXPECT_NE(a, b);
  EXPECT_EQ(a.rfind("_INBOX.", 0), 0u);
}

TEST(InProcessBusTest, HandlerExceptionIsLoggedThroughObservability) {
  std::ostringstream log;
  auto observability = std::make_shared<tokengw::Observability>(tokengw::LogLevel::kInfo, &log);
  {
    tokengw::InProcessBus bus(2, observability);
    bus.Subscribe("a.b", "", [](const tokengw::BusMessage&) { throw std::runtime_error("handler broke"); });
    bus.Publish("a.b", "", "x");
  }
  // 소멸자가 콜백 스레드를 join하므로 이 시점에는 기록이 끝나 있다.
  EXPECT_NE(log.str().find("bus.handler_failed"), std::string::npos) << log.str();
  EXPECT_NE(log.str().find("a.b: handler broke"), std::string::npos);
}

TEST(SubjectMatchTest, WildcardsFollowTokenRules) {
  EXPECT_TRUE(tokengw::SubjectMatches("token.request", "token.request"));
  EXPECT_TRUE(tokengw::SubjectMatches("token.*", "token.request"));
  EXPECT_FALSE(tokengw::SubjectMatches("token.*", "token.request.extra"));
  EXPECT_TRUE(tokengw::SubjectMatches("token.>", "token.request.extra"));
  EXPECT_FALSE(tokengw::SubjectMatches("token.>", "token"));
  EXPECT_FALSE(tokengw::SubjectMatches("token.request", "token.reply"));
}

}  // namespace
