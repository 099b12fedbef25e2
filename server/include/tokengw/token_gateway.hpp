/*
 * 설명: 검증 → 캐시 조회 → 브리지 호출 → 캐시 채움 → 응답 순서로 /token 요청을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/gateway_flow_it_test.cpp, server/tests/e2e/token_http_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "tokengw/api_response.hpp"
#include "tokengw/observability.hpp"
#include "tokengw/token_bridge.hpp"
#include "tokengw/token_cache.hpp"

namespace tokengw {

struct GatewayConfig {
  // 브리지 응답 대기 한도.
  std::chrono::milliseconds request_timeout{std::chrono::seconds(5)};
  // 일반적인 60분 토큰보다 짧게 잡아 만료된 토큰을 내주지 않는다.
  std::chrono::milliseconds cache_ttl{std::chrono::minutes(55)};
};

struct TokenHttpRequest {
  std::string body;
  bool skip_cache{false};
  std::string trace_id;
};

class TokenGateway {
 public:
  TokenGateway(std::shared_ptr<ExpiringTokenCache> cache, std::shared_ptr<TokenBridge> bridge,
               GatewayConfig config, std::shared_ptr<Observability> observability);

  GatewayReply HandleTokenRequest(const TokenHttpRequest& request);

  const GatewayConfig& GetConfig() const { return config_; }

 private:
  std::shared_ptr<ExpiringTokenCache> cache_;
  std::shared_ptr<TokenBridge> bridge_;
  GatewayConfig config_;
  std::shared_ptr<Observability> observability_;
};

// skip_cache 쿼리 값이 "1" 또는 "true"인지 확인한다.
bool ParseSkipCache(const std::string& query);

}  // namespace tokengw
