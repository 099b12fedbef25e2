/*
 * 설명: 클라이언트 ID별 토큰을 만료 시각과 함께 보관하는 동시성 캐시와 주기적 정리 타이머.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_cache_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace tokengw {

using CacheClock = std::function<std::chrono::steady_clock::time_point()>;

class ExpiringTokenCache : public std::enable_shared_from_this<ExpiringTokenCache> {
 public:
  ExpiringTokenCache(boost::asio::io_context& ioc, std::chrono::milliseconds sweep_interval,
                     CacheClock clock = [] { return std::chrono::steady_clock::now(); });

  std::optional<std::string> Get(const std::string& key) const;
  void Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl);
  void Delete(const std::string& key);
  void Clear();

  // 만료된 항목을 모두 제거하고 제거한 개수를 반환한다.
  std::size_t SweepExpired();
  std::size_t Size() const;

  void Start();
  void Stop();

 private:
  struct Entry {
    std::string value;
    std::chrono::steady_clock::time_point expires_at;
  };

  void ArmTimer();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  std::chrono::milliseconds sweep_interval_;
  CacheClock clock_;
  std::unordered_map<std::string, Entry> entries_;
  mutable std::shared_mutex mutex_;
  std::mutex timer_mutex_;
  std::atomic<bool> running_{false};
};

}  // namespace tokengw
