/*
 * 설명: 큐 그룹으로 token.request를 소비하고 IDP 결과를 회신 인박스로 돌려주는 워커.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_worker_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "tokengw/idp_client.hpp"
#include "tokengw/message_bus.hpp"
#include "tokengw/observability.hpp"

namespace tokengw {

struct TokenWorkerOptions {
  std::string subject{"token.request"};
  std::string queue_group{"token-workers"};
  // IDP에 요청할 scope. 비어 있으면 보내지 않는다.
  std::string scope{"openid profile"};
};

class TokenWorker {
 public:
  TokenWorker(std::shared_ptr<MessageBus> bus, std::shared_ptr<TokenIssuer> issuer, TokenWorkerOptions options,
              std::shared_ptr<Observability> observability);
  ~TokenWorker();

  void Start();
  // 구독을 해제하고 진행 중인 HandleMessage가 끝날 때까지 기다린다. 반환 후에는
  // 버스 콜백이 이 객체에 접근하지 않는다. 핸들러 안에서 호출하면 안 된다.
  void Stop();

  void HandleMessage(const BusMessage& message);
  std::uint64_t HandledCount() const { return handled_.load(); }

 private:
  struct HandlerGate;

  void Reply(const BusMessage& message, const TokenResponse& response);

  std::shared_ptr<MessageBus> bus_;
  std::shared_ptr<TokenIssuer> issuer_;
  TokenWorkerOptions options_;
  std::shared_ptr<Observability> observability_;
  std::mutex mutex_;
  std::uint64_t sid_{0};
  // 버스 콜백이 공유한다. 워커가 먼저 소멸해도 콜백은 닫힌 게이트만 본다.
  std::shared_ptr<HandlerGate> gate_;
  std::atomic<std::uint64_t> handled_{0};
};

}  // namespace tokengw
