/*
 * 설명: 요청 ID 상관, 인박스 구독, promise/future 기반 대기와 결과 분류를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_bridge_test.cpp, server/tests/it/gateway_flow_it_test.cpp
 */
#include "tokengw/token_bridge.hpp"

#include <atomic>
#include <future>

namespace tokengw {

namespace {
constexpr const char* kComponent = "token-bridge";

struct ReplyOutcome {
  std::optional<TokenResponse> response;
  std::string decode_error;
  bool no_responders{false};
};

// 첫 번째 상관 응답만 promise에 기록한다.
struct ReplySlot {
  std::promise<ReplyOutcome> promise;
  std::atomic<bool> fulfilled{false};

  void Fulfil(ReplyOutcome outcome) {
    if (!fulfilled.exchange(true)) {
      promise.set_value(std::move(outcome));
    }
  }
};
}  // namespace

// 인박스 구독과 상관 항목을 스코프 종료 시 해제한다.
class TokenBridge::PendingGuard {
 public:
  PendingGuard(TokenBridge& bridge, std::string request_id, const std::string& inbox)
      : bridge_(bridge), request_id_(std::move(request_id)) {
    std::lock_guard<std::mutex> lock(bridge_.mutex_);
    bridge_.pending_[request_id_] = inbox;
  }
  PendingGuard(const PendingGuard&) = delete;
  PendingGuard& operator=(const PendingGuard&) = delete;

  ~PendingGuard() {
    if (sid_ != 0) {
      bridge_.bus_->Unsubscribe(sid_);
    }
    std::lock_guard<std::mutex> lock(bridge_.mutex_);
    bridge_.pending_.erase(request_id_);
  }

  void SetSubscription(std::uint64_t sid) { sid_ = sid; }

 private:
  TokenBridge& bridge_;
  std::string request_id_;
  std::uint64_t sid_{0};
};

TokenBridge::TokenBridge(std::shared_ptr<MessageBus> bus, BridgeConfig config,
                         std::shared_ptr<Observability> observability)
    : bus_(std::move(bus)), config_(std::move(config)), observability_(std::move(observability)) {}

std::optional<TokenResponse> TokenBridge::RequestToken(const std::string& client_id, const std::string& client_secret,
                                                       std::chrono::milliseconds timeout, GatewayFailure& failure) {
  auto log = [this, &client_id](LogLevel level, const char* name, const std::string& request_id,
                                const std::string& message) {
    if (!observability_) {
      return;
    }
    LogContext ctx;
    ctx.level = level;
    ctx.component = kComponent;
    ctx.name = name;
    ctx.client_id = client_id;
    ctx.request_id = request_id;
    ctx.message = message;
    observability_->Log(ctx);
  };

  TokenRequest request;
  std::string payload;
  std::string inbox;
  try {
    request = MakeTokenRequest(ClientCredentials{client_id, client_secret});
    payload = ToJson(request).dump();
    inbox = bus_->NewInbox();
  } catch (const RandomSourceError& ex) {
    log(LogLevel::kError, "token.request.id_failed", request.request_id, ex.what());
    failure = GatewayFailure{ErrorKind::kSerializationFailure, "Failed to process request"};
    return std::nullopt;
  } catch (const nlohmann::json::exception& ex) {
    log(LogLevel::kError, "token.request.encode_failed", request.request_id, ex.what());
    failure = GatewayFailure{ErrorKind::kSerializationFailure, "Failed to process request"};
    return std::nullopt;
  }

  auto slot = std::make_shared<ReplySlot>();
  auto future = slot->promise.get_future();
  PendingGuard guard(*this, request.request_id, inbox);

  try {
    auto sid = bus_->Subscribe(inbox, "", [slot, request_id = request.request_id](const BusMessage& message) {
      ReplyOutcome outcome;
      if (message.status == kNoRespondersStatus) {
        outcome.no_responders = true;
        slot->Fulfil(std::move(outcome));
        return;
      }
      outcome.response = ParseTokenResponse(message.data, outcome.decode_error);
      if (outcome.response && !outcome.response->request_id.empty() && outcome.response->request_id != request_id) {
        return;
      }
      slot->Fulfil(std::move(outcome));
    });
    guard.SetSubscription(sid);
    bus_->Publish(config_.request_subject, inbox, payload);
  } catch (const BusError& ex) {
    log(LogLevel::kError, "token.request.unavailable", request.request_id, ex.what());
    failure = GatewayFailure{ErrorKind::kUpstreamUnavailable, ex.what()};
    return std::nullopt;
  }

  log(LogLevel::kDebug, "token.request.sent", request.request_id, config_.request_subject);

  if (future.wait_for(timeout) != std::future_status::ready) {
    log(LogLevel::kWarn, "token.request.timeout", request.request_id,
        std::to_string(timeout.count()) + "ms 안에 응답이 없습니다");
    failure = GatewayFailure{ErrorKind::kUpstreamTimeout, "Request timed out"};
    return std::nullopt;
  }

  ReplyOutcome outcome = future.get();
  if (outcome.no_responders) {
    log(LogLevel::kError, "token.request.unavailable", request.request_id, "no responders");
    failure = GatewayFailure{ErrorKind::kUpstreamUnavailable,
                             "응답할 구독자가 없습니다: " + config_.request_subject};
    return std::nullopt;
  }
  if (!outcome.response) {
    log(LogLevel::kError, "token.response.decode_failed", request.request_id, outcome.decode_error);
    failure = GatewayFailure{ErrorKind::kSerializationFailure, "Failed to process response"};
    return std::nullopt;
  }
  if (outcome.response->Failed()) {
    log(LogLevel::kWarn, "token.response.rejected", request.request_id, outcome.response->error);
    failure = GatewayFailure{ErrorKind::kUpstreamRejected, outcome.response->error};
    return std::nullopt;
  }
  return outcome.response;
}

std::size_t TokenBridge::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace tokengw
