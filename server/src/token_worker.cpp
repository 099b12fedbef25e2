/*
 * 설명: 토큰 요청 디코딩, IDP 호출, 성공/오류 회신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_worker_test.cpp
 */
#include "tokengw/token_worker.hpp"

#include <condition_variable>

#include "tokengw/errors.hpp"

namespace tokengw {

namespace {
constexpr const char* kComponent = "token-worker";
}  // namespace

struct TokenWorker::HandlerGate {
  std::mutex mutex;
  std::condition_variable idle;
  bool open{false};
  std::size_t in_flight{0};
};

TokenWorker::TokenWorker(std::shared_ptr<MessageBus> bus, std::shared_ptr<TokenIssuer> issuer,
                         TokenWorkerOptions options, std::shared_ptr<Observability> observability)
    : bus_(std::move(bus)), issuer_(std::move(issuer)), options_(std::move(options)),
      observability_(std::move(observability)), gate_(std::make_shared<HandlerGate>()) {}

TokenWorker::~TokenWorker() { Stop(); }

void TokenWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sid_ != 0) {
    return;
  }
  {
    std::lock_guard<std::mutex> gate_lock(gate_->mutex);
    gate_->open = true;
  }
  auto gate = gate_;
  try {
    sid_ = bus_->Subscribe(options_.subject, options_.queue_group, [this, gate](const BusMessage& message) {
      {
        std::lock_guard<std::mutex> gate_lock(gate->mutex);
        if (!gate->open) {
          return;
        }
        ++gate->in_flight;
      }
      struct Leave {
        HandlerGate& gate;
        ~Leave() {
          std::lock_guard<std::mutex> gate_lock(gate.mutex);
          --gate.in_flight;
          gate.idle.notify_all();
        }
      } leave{*gate};
      HandleMessage(message);
    });
  } catch (const BusError&) {
    std::lock_guard<std::mutex> gate_lock(gate_->mutex);
    gate_->open = false;
    throw;
  }
  if (observability_) {
    observability_->Log(LogLevel::kInfo, kComponent, "worker.subscribed",
                        options_.subject + " (queue " + options_.queue_group + ")");
  }
}

void TokenWorker::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sid_ == 0) {
    return;
  }
  bus_->Unsubscribe(sid_);
  sid_ = 0;
  std::unique_lock<std::mutex> gate_lock(gate_->mutex);
  gate_->open = false;
  gate_->idle.wait(gate_lock, [this]() { return gate_->in_flight == 0; });
}

void TokenWorker::HandleMessage(const BusMessage& message) {
  handled_.fetch_add(1);
  std::string error_message;
  auto request = ParseTokenRequest(message.data, error_message);
  if (!request) {
    if (observability_) {
      observability_->Log(LogLevel::kError, kComponent, "worker.request_invalid", error_message);
    }
    Reply(message, MakeErrorResponse("", "Invalid request format"));
    return;
  }

  LogContext ctx;
  ctx.component = kComponent;
  ctx.client_id = request->client_id;
  ctx.request_id = request->request_id;
  if (observability_) {
    ctx.name = "worker.request_received";
    observability_->Log(ctx);
  }

  IssuedToken token;
  try {
    token = issuer_->Issue(ClientCredentials{request->client_id, request->client_secret}, options_.scope);
  } catch (const IdpError& ex) {
    if (observability_) {
      ctx.level = LogLevel::kError;
      ctx.name = "worker.idp_failed";
      ctx.message = ex.what();
      observability_->Log(ctx);
    }
    Reply(message, MakeErrorResponse(request->request_id, ex.what()));
    return;
  }

  Reply(message, MakeTokenResponse(request->request_id, token.access_token, token.token_type, token.scope,
                                   token.expires_in));
  if (observability_) {
    ctx.name = "worker.token_sent";
    observability_->Log(ctx);
  }
}

void TokenWorker::Reply(const BusMessage& message, const TokenResponse& response) {
  if (message.reply_to.empty()) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, kComponent, "worker.no_reply_subject", message.subject);
    }
    return;
  }
  try {
    bus_->Publish(message.reply_to, "",
                  ToJson(response).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  } catch (const BusError& ex) {
    if (observability_) {
      observability_->Log(LogLevel::kError, kComponent, "worker.reply_failed", ex.what());
    }
  }
}

}  // namespace tokengw
