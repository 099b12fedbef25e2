/*
 * 설명: 만료 캐시의 조회/저장/삭제와 주기적 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_cache_test.cpp
 */
#include "tokengw/token_cache.hpp"

namespace tokengw {

ExpiringTokenCache::ExpiringTokenCache(boost::asio::io_context& ioc, std::chrono::milliseconds sweep_interval,
                                       CacheClock clock)
    : timer_(ioc), sweep_interval_(sweep_interval), clock_(std::move(clock)) {}

std::optional<std::string> ExpiringTokenCache::Get(const std::string& key) const {
  auto now = clock_();
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (now >= it->second.expires_at) {
    return std::nullopt;
  }
  return it->second.value;
}

void ExpiringTokenCache::Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  Entry entry{value, clock_() + ttl};
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_[key] = std::move(entry);
}

void ExpiringTokenCache::Delete(const std::string& key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.erase(key);
}

void ExpiringTokenCache::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

std::size_t ExpiringTokenCache::SweepExpired() {
  auto now = clock_();
  std::size_t removed = 0;
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now >= it->second.expires_at) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t ExpiringTokenCache::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

void ExpiringTokenCache::Start() {
  if (running_.exchange(true)) {
    return;
  }
  std::lock_guard<std::mutex> lock(timer_mutex_);
  ArmTimer();
}

void ExpiringTokenCache::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_.cancel();
}

// timer_mutex_를 잡은 상태에서 호출한다.
void ExpiringTokenCache::ArmTimer() {
  timer_.expires_after(sweep_interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void ExpiringTokenCache::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  SweepExpired();
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (running_) {
    ArmTimer();
  }
}

}  // namespace tokengw
