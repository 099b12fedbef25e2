/*
 * 설명: 캐시 미스를 메시지 버스 요청/응답으로 변환하고 제한 시간 안에 상관된 응답을 기다린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_bridge_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "tokengw/errors.hpp"
#include "tokengw/message_bus.hpp"
#include "tokengw/observability.hpp"
#include "tokengw/token_models.hpp"

namespace tokengw {

struct BridgeConfig {
  // 워커 큐 그룹이 구독하는 요청 주제.
  std::string request_subject{"token.request"};
};

class TokenBridge {
 public:
  TokenBridge(std::shared_ptr<MessageBus> bus, BridgeConfig config,
              std::shared_ptr<Observability> observability = nullptr);

  // 요청 하나를 보내고 timeout까지 기다린다. 재시도하지 않는다.
  // 실패 시 std::nullopt와 함께 failure에 UpstreamTimeout/UpstreamUnavailable/
  // SerializationFailure/UpstreamRejected 중 하나를 채운다.
  std::optional<TokenResponse> RequestToken(const std::string& client_id, const std::string& client_secret,
                                            std::chrono::milliseconds timeout, GatewayFailure& failure);

  // 응답 또는 타임아웃을 기다리는 중인 상관 항목 수.
  std::size_t PendingCount() const;

 private:
  class PendingGuard;

  std::shared_ptr<MessageBus> bus_;
  BridgeConfig config_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> pending_;
};

}  // namespace tokengw
