#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "tokengw/token_cache.hpp"

namespace {

using namespace std::chrono_literals;

struct ManualClock {
  std::shared_ptr<std::chrono::steady_clock::time_point> now =
      std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

  tokengw::CacheClock Source() const {
    auto current = now;
    return [current]() { return *current; };
  }
  void Advance(std::chrono::milliseconds delta) { *now += delta; }
};

TEST(TokenCacheTest, ReturnsValueUntilExpiry) {
  boost::asio::io_context ioc;
  ManualClock clock;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 1s, clock.Source());

  cache->Set("client-a", "token-a", 100ms);
  clock.Advance(99ms);
  auto value = cache->Get("client-a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "token-a");

  clock.Advance(1ms);
  EXPECT_FALSE(cache->Get("client-a").has_value());
  EXPECT_FALSE(cache->Get("unknown").has_value());
}

TEST(TokenCacheTest, ExpiredEntriesStayUntilSwept) {
  boost::asio::io_context ioc;
  ManualClock clock;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 1s, clock.Source());

  cache->Set("short", "t1", 10ms);
  cache->Set("long", "t2", 10min);
  clock.Advance(20ms);

  EXPECT_EQ(cache->Size(), 2u);
  EXPECT_EQ(cache->SweepExpired(), 1u);
  EXPECT_EQ(cache->Size(), 1u);
  EXPECT_TRUE(cache->Get("long").has_value());
}

TEST(TokenCacheTest, OverwriteReplacesValueAndExpiry) {
  boost::asio::io_context ioc;
  ManualClock clock;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 1s, clock.Source());

  cache->Set("client-a", "old", 50ms);
  cache->Set("client-a", "new", 500ms);
  clock.Advance(100ms);

  auto value = cache->Get("client-a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "new");
  EXPECT_EQ(cache->Size(), 1u);
}

TEST(TokenCacheTest, DeleteAndClearRemoveEntries) {
  boost::asio::io_context ioc;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 1s);

  cache->Set("a", "1", 1min);
  cache->Set("b", "2", 1min);
  cache->Delete("a");
  cache->Delete("missing");
  EXPECT_FALSE(cache->Get("a").has_value());
  EXPECT_EQ(cache->Size(), 1u);

  cache->Clear();
  EXPECT_EQ(cache->Size(), 0u);
}

TEST(TokenCacheTest, SweepTimerEvictsWithoutReads) {
  boost::asio::io_context ioc;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 20ms);
  cache->Set("client-a", "token-a", 1ms);
  cache->Start();
  std::thread runner([&ioc]() { ioc.run(); });

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (cache->Size() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(cache->Size(), 0u);

  cache->Stop();
  runner.join();
}

TEST(TokenCacheTest, StopIsIdempotentAndHaltsTimer) {
  boost::asio::io_context ioc;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 10ms);
  cache->Start();
  cache->Start();
  cache->Stop();
  cache->Stop();
  // 취소된 타이머만 남으므로 run()이 곧바로 반환되어야 한다.
  ioc.run_for(1s);
  EXPECT_TRUE(ioc.stopped());
}

TEST(TokenCacheTest, ConcurrentAccessKeepsConsistentState) {
  boost::asio::io_context ioc;
  auto cache = std::make_shared<tokengw::ExpiringTokenCache>(ioc, 1s);
  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 500; ++i) {
        std::string key = "client-" + std::to_string(i % 16);
        std::string value = "token-" + std::to_string(i % 16);
        cache->Set(key, value, 1min);
        if (auto got = cache->Get(key); got && *got != value) {
          mismatches.fetch_add(1);
        }
        if ((i + t) % 7 == 0) {
          cache->Delete(key);
        }
        cache->SweepExpired();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
  EXPECT_LE(cache->Size(), 16u);
}

}  // namespace
