/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "tokengw/errors.hpp"

namespace tokengw {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string component;
  std::string name;
  std::string trace_id;
  std::optional<std::string> client_id;
  std::optional<std::string> request_id;
  std::optional<unsigned> status;
  long latency_ms{0};
  std::string message;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};
  std::uint64_t upstream_timeouts{0};
  std::uint64_t upstream_unavailable{0};
  std::uint64_t upstream_rejected{0};
  std::uint64_t cache_entries{0};
  std::uint64_t pending_requests{0};
};

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordCacheHit();
  void RecordCacheMiss();
  void RecordUpstreamFailure(ErrorKind kind);
  MetricsSnapshot Snapshot(std::uint64_t cache_entries, std::uint64_t pending_requests) const;

  bool Enabled(LogLevel level) const { return level >= threshold_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, std::string_view component, std::string_view name, std::string_view message) const;

 private:
  LogLevel threshold_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> cache_misses_{0};
  std::atomic<std::uint64_t> upstream_timeouts_{0};
  std::atomic<std::uint64_t> upstream_unavailable_{0};
  std::atomic<std::uint64_t> upstream_rejected_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace tokengw
