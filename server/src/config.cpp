/*
 * 설명: JSON 설정 파일과 환경 변수에서 게이트웨이/워커 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "tokengw/config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

#include "tokengw/errors.hpp"

namespace tokengw {

namespace {
std::size_t ParseUnsigned(const std::string& value, const char* key) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size() || value.front() == '-') {
      throw ConfigError(std::string(key) + " 값이 숫자가 아닙니다: " + value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(std::string(key) + " 값이 숫자가 아닙니다: " + value);
  }
}

unsigned short ParsePort(const std::string& value, const char* key) {
  auto parsed = ParseUnsigned(value, key);
  if (parsed > std::numeric_limits<unsigned short>::max()) {
    throw ConfigError(std::string(key) + " 포트 범위를 벗어났습니다: " + value);
  }
  return static_cast<unsigned short>(parsed);
}

bool ParseBool(const std::string& value) { return value == "1" || value == "true" || value == "yes"; }

nlohmann::json ReadConfigFile(const std::string& path) {
  if (path.empty()) {
    return nlohmann::json::object();
  }
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("설정 파일을 열 수 없습니다: " + path);
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw ConfigError("설정 파일 형식이 올바르지 않습니다: " + path);
  }
  return parsed;
}

template <typename T>
void ReadField(const nlohmann::json& object, const char* key, T& dest) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return;
  }
  try {
    dest = it->get<T>();
  } catch (const nlohmann::json::exception&) {
    throw ConfigError(std::string("설정 키 형식이 올바르지 않습니다: ") + key);
  }
}

void ReadNats(const nlohmann::json& file, NatsSettings& nats) {
  auto it = file.find("nats");
  if (it == file.end() || !it->is_object()) {
    return;
  }
  ReadField(*it, "url", nats.url);
  ReadField(*it, "username", nats.user);
  ReadField(*it, "password", nats.password);
  ReadField(*it, "token", nats.token);
}

void ApplyNatsEnv(const EnvLookup& env, NatsSettings& nats) {
  if (auto v = env("NATS_URL")) {
    nats.url = *v;
  }
  if (auto v = env("NATS_USER")) {
    nats.user = *v;
  }
  if (auto v = env("NATS_PASS")) {
    nats.password = *v;
  }
  if (auto v = env("NATS_TOKEN")) {
    nats.token = *v;
  }
}
}  // namespace

EnvLookup ProcessEnv() {
  return [](const char* key) -> std::optional<std::string> {
    const char* val = std::getenv(key);
    if (val == nullptr || *val == '\0') {
      return std::nullopt;
    }
    return std::string{val};
  };
}

AppConfig LoadAppConfig(const std::string& path, const EnvLookup& env) {
  AppConfig cfg;
  auto file = ReadConfigFile(path);
  ReadField(file, "port", cfg.port);
  ReadField(file, "transport", cfg.transport);
  ReadField(file, "logLevel", cfg.log_level);
  ReadField(file, "requestTimeoutMs", cfg.request_timeout_ms);
  ReadField(file, "cacheTtlSeconds", cfg.cache_ttl_seconds);
  ReadField(file, "cacheSweepIntervalSeconds", cfg.cache_sweep_interval_seconds);
  ReadField(file, "tokenSubject", cfg.token_subject);
  ReadField(file, "bridgeThreads", cfg.bridge_threads);
  ReadField(file, "ioThreads", cfg.io_threads);
  ReadNats(file, cfg.nats);

  if (auto v = env("SERVER_PORT")) {
    cfg.port = ParsePort(*v, "SERVER_PORT");
  }
  if (auto v = env("TRANSPORT")) {
    cfg.transport = *v;
  }
  if (auto v = env("LOG_LEVEL")) {
    cfg.log_level = *v;
  }
  if (auto v = env("REQUEST_TIMEOUT_MS")) {
    cfg.request_timeout_ms = ParseUnsigned(*v, "REQUEST_TIMEOUT_MS");
  }
  if (auto v = env("CACHE_TTL_SECONDS")) {
    cfg.cache_ttl_seconds = ParseUnsigned(*v, "CACHE_TTL_SECONDS");
  }
  if (auto v = env("CACHE_SWEEP_INTERVAL_SECONDS")) {
    cfg.cache_sweep_interval_seconds = ParseUnsigned(*v, "CACHE_SWEEP_INTERVAL_SECONDS");
  }
  if (auto v = env("TOKEN_SUBJECT")) {
    cfg.token_subject = *v;
  }
  if (auto v = env("BRIDGE_THREADS")) {
    cfg.bridge_threads = ParseUnsigned(*v, "BRIDGE_THREADS");
  }
  if (auto v = env("IO_THREADS")) {
    cfg.io_threads = ParseUnsigned(*v, "IO_THREADS");
  }
  ApplyNatsEnv(env, cfg.nats);

  if (cfg.transport != "nats" && cfg.transport != "inproc") {
    throw ConfigError("지원하지 않는 TRANSPORT: " + cfg.transport);
  }
  if (cfg.request_timeout_ms == 0 || cfg.cache_sweep_interval_seconds == 0 || cfg.bridge_threads == 0) {
    throw ConfigError("REQUEST_TIMEOUT_MS, CACHE_SWEEP_INTERVAL_SECONDS, BRIDGE_THREADS는 0보다 커야 합니다");
  }
  return cfg;
}

WorkerConfig LoadWorkerConfig(const std::string& path, const EnvLookup& env) {
  WorkerConfig cfg;
  auto file = ReadConfigFile(path);
  ReadField(file, "tokenSubject", cfg.token_subject);
  ReadField(file, "queue", cfg.queue_group);
  ReadField(file, "workerName", cfg.worker_name);
  ReadField(file, "simulateIdp", cfg.simulate_idp);
  ReadField(file, "logLevel", cfg.log_level);
  ReadNats(file, cfg.nats);
  if (auto idp = file.find("idp"); idp != file.end() && idp->is_object()) {
    ReadField(*idp, "url", cfg.idp_url);
    ReadField(*idp, "tokenPath", cfg.idp_token_path);
    ReadField(*idp, "scope", cfg.idp_scope);
    ReadField(*idp, "timeoutSeconds", cfg.idp_timeout_seconds);
  }

  ApplyNatsEnv(env, cfg.nats);
  if (auto v = env("TOKEN_SUBJECT")) {
    cfg.token_subject = *v;
  }
  if (auto v = env("WORKER_QUEUE")) {
    cfg.queue_group = *v;
  }
  if (auto v = env("IDP_URL")) {
    cfg.idp_url = *v;
  }
  if (auto v = env("IDP_TOKEN_PATH")) {
    cfg.idp_token_path = *v;
  }
  if (auto v = env("IDP_SCOPE")) {
    cfg.idp_scope = *v;
  }
  if (auto v = env("IDP_TIMEOUT_SECONDS")) {
    cfg.idp_timeout_seconds = ParseUnsigned(*v, "IDP_TIMEOUT_SECONDS");
  }
  if (auto v = env("SIMULATE_IDP")) {
    cfg.simulate_idp = ParseBool(*v);
  }
  if (auto v = env("LOG_LEVEL")) {
    cfg.log_level = *v;
  }
  // 워커 이름에 파드 이름이나 지정 접미사를 붙여 브로커에서 구분한다.
  if (auto v = env("WORKER_NAME")) {
    cfg.worker_name += "-" + *v;
  } else if (auto pod = env("POD_NAME")) {
    cfg.worker_name += "-" + *pod;
  }
  return cfg;
}

}  // namespace tokengw
