/*
 * 설명: /token 요청 상태 기계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/gateway_flow_it_test.cpp, server/tests/e2e/token_http_flow_test.cpp
 */
#include "tokengw/token_gateway.hpp"

#include <unordered_map>

#include "tokengw/credential_validator.hpp"

namespace tokengw {

namespace {
constexpr const char* kComponent = "front-door";
constexpr const char* kDefaultTokenType = "Bearer";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    } else if (!pair.empty()) {
      params.emplace(pair, std::string{});
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}
}  // namespace

bool ParseSkipCache(const std::string& query) {
  auto params = ParseQueryParams(query);
  auto it = params.find("skip_cache");
  return it != params.end() && (it->second == "1" || it->second == "true");
}

TokenGateway::TokenGateway(std::shared_ptr<ExpiringTokenCache> cache, std::shared_ptr<TokenBridge> bridge,
                           GatewayConfig config, std::shared_ptr<Observability> observability)
    : cache_(std::move(cache)), bridge_(std::move(bridge)), config_(config),
      observability_(std::move(observability)) {}

GatewayReply TokenGateway::HandleTokenRequest(const TokenHttpRequest& request) {
  auto log = [this, &request](LogLevel level, const char* name, const std::string& client_id,
                              const std::string& message) {
    if (!observability_) {
      return;
    }
    LogContext ctx;
    ctx.level = level;
    ctx.component = kComponent;
    ctx.name = name;
    ctx.trace_id = request.trace_id;
    if (!client_id.empty()) {
      ctx.client_id = client_id;
    }
    ctx.message = message;
    observability_->Log(ctx);
  };

  GatewayFailure failure;
  auto credentials = ValidateCredentials(request.body, failure);
  if (!credentials) {
    log(LogLevel::kWarn, "token.validate_failed", "", failure.message);
    return MapFailure(failure);
  }

  if (!request.skip_cache) {
    if (auto token = cache_->Get(credentials->client_id)) {
      if (observability_) {
        observability_->RecordCacheHit();
      }
      log(LogLevel::kInfo, "token.cache_hit", credentials->client_id, "캐시된 토큰을 반환합니다");
      return MakeTokenReply(*token, kDefaultTokenType, kSourceCache);
    }
    if (observability_) {
      observability_->RecordCacheMiss();
    }
  }

  auto response = bridge_->RequestToken(credentials->client_id, credentials->client_secret,
                                        config_.request_timeout, failure);
  if (!response) {
    if (observability_) {
      observability_->RecordUpstreamFailure(failure.kind);
    }
    log(LogLevel::kError, "token.upstream_failed", credentials->client_id,
        std::string(ErrorKindName(failure.kind)) + ": " + failure.message);
    return MapFailure(failure);
  }

  if (!request.skip_cache) {
    cache_->Set(credentials->client_id, response->access_token, config_.cache_ttl);
    log(LogLevel::kInfo, "token.cached", credentials->client_id, "토큰을 캐시에 저장했습니다");
  }

  return MakeTokenReply(response->access_token, response->token_type, kSourceIdp);
}

}  // namespace tokengw
