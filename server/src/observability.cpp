/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "tokengw/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tokengw {

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

Observability::Observability(LogLevel threshold, std::ostream* sink)
    : threshold_(threshold), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordCacheHit() { cache_hits_.fetch_add(1); }

void Observability::RecordCacheMiss() { cache_misses_.fetch_add(1); }

void Observability::RecordUpstreamFailure(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUpstreamTimeout:
      upstream_timeouts_.fetch_add(1);
      break;
    case ErrorKind::kUpstreamRejected:
      upstream_rejected_.fetch_add(1);
      break;
    case ErrorKind::kUpstreamUnavailable:
    case ErrorKind::kSerializationFailure:
      upstream_unavailable_.fetch_add(1);
      break;
    default:
      break;
  }
}

MetricsSnapshot Observability::Snapshot(std::uint64_t cache_entries, std::uint64_t pending_requests) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.cache_hits = cache_hits_.load();
  snapshot.cache_misses = cache_misses_.load();
  snapshot.upstream_timeouts = upstream_timeouts_.load();
  snapshot.upstream_unavailable = upstream_unavailable_.load();
  snapshot.upstream_rejected = upstream_rejected_.load();
  snapshot.cache_entries = cache_entries;
  snapshot.pending_requests = pending_requests;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["component"] = ctx.component;
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.client_id) {
    log_json["clientId"] = *ctx.client_id;
  }
  if (ctx.request_id) {
    log_json["requestId"] = *ctx.request_id;
  }
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  log_json["latencyMs"] = ctx.latency_ms;
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::Log(LogLevel level, std::string_view component, std::string_view name,
                        std::string_view message) const {
  LogContext ctx;
  ctx.level = level;
  ctx.component = std::string(component);
  ctx.name = std::string(name);
  ctx.message = std::string(message);
  Log(ctx);
}

}  // namespace tokengw
