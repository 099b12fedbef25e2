/*
 * 설명: 게이트웨이/워커 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tokengw {

// 환경 변수 조회 함수. 테스트에서 대체할 수 있다.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

EnvLookup ProcessEnv();

struct NatsSettings {
  std::string url{"nats://localhost:4222"};
  std::string user;
  std::string password;
  std::string token;
};

struct AppConfig {
  unsigned short port{8080};
  // "nats": 외부 브로커, "inproc": 프로세스 내부 브로커 + 시뮬레이션 워커.
  std::string transport{"nats"};
  NatsSettings nats;
  std::size_t request_timeout_ms{5000};
  std::size_t cache_ttl_seconds{3300};
  std::size_t cache_sweep_interval_seconds{60};
  std::string token_subject{"token.request"};
  std::size_t bridge_threads{16};
  // 0이면 하드웨어 스레드 수를 사용한다.
  std::size_t io_threads{0};
  std::string log_level{"info"};
};

struct WorkerConfig {
  NatsSettings nats;
  std::string token_subject{"token.request"};
  std::string queue_group{"token-workers"};
  std::string idp_url{"https://idp.example.com"};
  std::string idp_token_path{"/realms/phoenix/protocol/openid-connect/token"};
  std::string idp_scope{"openid profile"};
  std::size_t idp_timeout_seconds{10};
  std::string worker_name{"Token Worker"};
  bool simulate_idp{false};
  std::string log_level{"info"};
};

// 기본값 → JSON 파일(path가 비어 있지 않을 때) → 환경 변수 순으로 덮어쓴다.
// 파일을 읽지 못하거나 값이 잘못되면 ConfigError를 던진다.
AppConfig LoadAppConfig(const std::string& path, const EnvLookup& env = ProcessEnv());
WorkerConfig LoadWorkerConfig(const std::string& path, const EnvLookup& env = ProcessEnv());

}  // namespace tokengw
