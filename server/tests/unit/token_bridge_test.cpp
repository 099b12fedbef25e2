#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "tokengw/errors.hpp"
#include "tokengw/idp_client.hpp"
#include "tokengw/in_process_bus.hpp"
#include "tokengw/token_bridge.hpp"
#include "tokengw/token_worker.hpp"

namespace {

using namespace std::chrono_literals;

class FixedIssuer : public tokengw::TokenIssuer {
 public:
  tokengw::IssuedToken Issue(const tokengw::ClientCredentials& credentials, const std::string& /*scope*/) override {
    if (credentials.client_secret == "wrong") {
      throw tokengw::IdpError("invalid_client");
    }
    tokengw::IssuedToken token;
    token.access_token = "abc-" + credentials.client_id;
    token.token_type = "Bearer";
    token.expires_in = 3600;
    return token;
  }
};

// 인박스 핸들러를 호출자 스레드에서 직접 부르는 버스.
class ScriptedBus : public tokengw::MessageBus {
 public:
  bool IsConnected() const override { return true; }
  void Publish(const std::string& /*subject*/, const std::string& reply_to, const std::string& /*data*/) override {
    ++published;
    if (answer_no_responders && inbox_handler) {
      inbox_handler(tokengw::BusMessage{reply_to, "", "", tokengw::kNoRespondersStatus});
    }
  }
  std::uint64_t Subscribe(const std::string& /*subject*/, const std::string& /*queue_group*/,
                          tokengw::MessageHandler handler) override {
    inbox_handler = std::move(handler);
    return ++subscribed;
  }
  void Unsubscribe(std::uint64_t /*sid*/) override { ++unsubscribed; }
  std::string NewInbox() override {
    if (fail_random) {
      throw tokengw::RandomSourceError("RAND_bytes 실패");
    }
    return "_INBOX.scripted";
  }
  std::size_t SubscriptionCount() const override { return subscribed - unsubscribed; }

  tokengw::MessageHandler inbox_handler;
  bool answer_no_responders{false};
  bool fail_random{false};
  int published{0};
  std::uint64_t subscribed{0};
  std::uint64_t unsubscribed{0};
};

class TokenBridgeTest : public ::testing::Test {
 protected:
  void StartWorker() {
    worker_ = std::make_unique<tokengw::TokenWorker>(bus_, std::make_shared<FixedIssuer>(),
                                                     tokengw::TokenWorkerOptions{}, nullptr);
    worker_->Start();
  }

  // 요청 주제에 응답 함수를 직접 붙인다.
  void Respond(std::function<void(const tokengw::BusMessage&)> handler) {
    bus_->Subscribe("token.request", "token-workers", std::move(handler));
  }

  std::string RequestIdOf(const tokengw::BusMessage& message) {
    std::string error;
    auto request = tokengw::ParseTokenRequest(message.data, error);
    return request ? request->request_id : std::string{};
  }

  std::shared_ptr<tokengw::InProcessBus> bus_ = std::make_shared<tokengw::InProcessBus>();
  tokengw::TokenBridge bridge_{bus_, tokengw::BridgeConfig{}};
  std::unique_ptr<tokengw::TokenWorker> worker_;
};

TEST_F(TokenBridgeTest, ReturnsCorrelatedToken) {
  StartWorker();
  tokengw::GatewayFailure failure;
  auto response = bridge_.RequestToken("svc-a", "secret", 2s, failure);
  ASSERT_TRUE(response.has_value()) << failure.message;
  EXPECT_EQ(response->access_token, "abc-svc-a");
  EXPECT_EQ(response->token_type, "Bearer");
  EXPECT_EQ(bridge_.PendingCount(), 0u);
  EXPECT_EQ(bus_->SubscriptionCount(), 1u);
}

TEST_F(TokenBridgeTest, SilentWorkerTimesOutWithoutLeaking) {
  Respond([](const tokengw::BusMessage&) {});
  tokengw::GatewayFailure failure;
  auto started = std::chrono::steady_clock::now();
  auto response = bridge_.RequestToken("svc-a", "secret", 100ms, failure);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kUpstreamTimeout);
  EXPECT_GE(elapsed, 100ms);
  EXPECT_LT(elapsed, 2s);
  EXPECT_EQ(bridge_.PendingCount(), 0u);
  // 남은 구독은 응답하지 않는 워커 하나뿐이다.
  EXPECT_EQ(bus_->SubscriptionCount(), 1u);
}

TEST_F(TokenBridgeTest, NoRespondersIsUnavailable) {
  tokengw::GatewayFailure failure;
  auto response = bridge_.RequestToken("svc-a", "secret", 1s, failure);
  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kUpstreamUnavailable);
  EXPECT_EQ(bridge_.PendingCount(), 0u);
  EXPECT_EQ(bus_->SubscriptionCount(), 0u);
}

TEST(TokenBridgeTransportTest, NoRespondersNoticeOnInboxIsUnavailable) {
  auto bus = std::make_shared<ScriptedBus>();
  bus->answer_no_responders = true;
  tokengw::TokenBridge bridge(bus, tokengw::BridgeConfig{});
  tokengw::GatewayFailure failure;
  auto started = std::chrono::steady_clock::now();
  auto response = bridge.RequestToken("svc-a", "secret", 5s, failure);
  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kUpstreamUnavailable);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
  EXPECT_EQ(bridge.PendingCount(), 0u);
  EXPECT_EQ(bus->SubscriptionCount(), 0u);
}

TEST(TokenBridgeTransportTest, RandomSourceFailureIsSerializationFailure) {
  auto bus = std::make_shared<ScriptedBus>();
  bus->fail_random = true;
  tokengw::TokenBridge bridge(bus, tokengw::BridgeConfig{});
  tokengw::GatewayFailure failure;
  std::optional<tokengw::TokenResponse> response;
  EXPECT_NO_THROW(response = bridge.RequestToken("svc-a", "secret", 1s, failure));
  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kSerializationFailure);
  EXPECT_EQ(failure.message, "Failed to process request");
  EXPECT_EQ(bus->subscribed, 0u);
  EXPECT_EQ(bus->published, 0);
  EXPECT_EQ(bridge.PendingCount(), 0u);
}

TEST_F(TokenBridgeTest, ClosedBusIsUnavailable) {
  StartWorker();
  bus_->Close();
  tokengw::GatewayFailure failure;
  EXPECT_FALSE(bridge_.RequestToken("svc-a", "secret", 1s, failure).has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kUpstreamUnavailable);
}

TEST_F(TokenBridgeTest, WorkerErrorIsRejectedVerbatim) {
  StartWorker();
  tokengw::GatewayFailure failure;
  auto response = bridge_.RequestToken("svc-a", "wrong", 2s, failure);
  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kUpstreamRejected);
  EXPECT_EQ(failure.message, "invalid_client");
}

TEST_F(TokenBridgeTest, UndecodableReplyIsSerializationFailure) {
  Respond([this](const tokengw::BusMessage& message) { bus_->Publish(message.reply_to, "", "<<not json>>"); });
  tokengw::GatewayFailure failure;
  auto response = bridge_.RequestToken("svc-a", "secret", 2s, failure);
  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kSerializationFailure);
  EXPECT_EQ(failure.message, "Failed to process response");
}

TEST_F(TokenBridgeTest, ReplyForAnotherRequestIsIgnored) {
  Respond([this](const tokengw::BusMessage& message) {
    auto stray = tokengw::MakeTokenResponse("someone-else", "stray", "Bearer", "", 60);
    bus_->Publish(message.reply_to, "", tokengw::ToJson(stray).dump());
    std::this_thread::sleep_for(20ms);
    auto real = tokengw::MakeTokenResponse(RequestIdOf(message), "mine", "Bearer", "", 60);
    bus_->Publish(message.reply_to, "", tokengw::ToJson(real).dump());
  });
  tokengw::GatewayFailure failure;
  auto response = bridge_.RequestToken("svc-a", "secret", 2s, failure);
  ASSERT_TRUE(response.has_value()) << failure.message;
  EXPECT_EQ(response->access_token, "mine");
}

TEST_F(TokenBridgeTest, ConcurrentRequestsStayCorrelated) {
  StartWorker();
  std::vector<std::thread> threads;
  std::atomic<int> correct{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i]() {
      tokengw::GatewayFailure failure;
      auto id = "svc-" + std::to_string(i);
      auto response = bridge_.RequestToken(id, "secret", 2s, failure);
      if (response && response->access_token == "abc-" + id) {
        correct.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(correct.load(), 8);
  EXPECT_EQ(bridge_.PendingCount(), 0u);
}

}  // namespace
