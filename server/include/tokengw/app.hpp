/*
 * 설명: 게이트웨이 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_http_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "tokengw/config.hpp"
#include "tokengw/message_bus.hpp"
#include "tokengw/observability.hpp"
#include "tokengw/token_bridge.hpp"
#include "tokengw/token_cache.hpp"
#include "tokengw/token_gateway.hpp"

namespace tokengw {

class Listener;
class InProcessBus;
class NatsBus;
class TokenWorker;

class ServerApp {
 public:
  // bus가 주어지면 그대로 사용하고, 없으면 config.transport에 따라 만든다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<MessageBus> bus = nullptr,
                     std::shared_ptr<Observability> observability = nullptr);
  ~ServerApp();

  // 리스너와 io 스레드를 띄우고 바로 반환한다.
  void Start();
  // Start 후 SIGINT/SIGTERM까지 대기한 뒤 Stop한다.
  void Run();
  void Stop();

  // port 0으로 시작한 경우 실제로 바인드된 포트.
  unsigned short BoundPort() const;

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ExpiringTokenCache> GetCache() { return cache_; }
  std::shared_ptr<TokenBridge> GetBridge() { return bridge_; }
  std::shared_ptr<TokenGateway> GetGateway() { return gateway_; }
  std::shared_ptr<MessageBus> GetBus() { return bus_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::thread_pool bridge_pool_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MessageBus> bus_;
  std::shared_ptr<NatsBus> nats_bus_;
  std::shared_ptr<InProcessBus> inproc_bus_;
  std::shared_ptr<TokenWorker> embedded_worker_;
  std::shared_ptr<ExpiringTokenCache> cache_;
  std::shared_ptr<TokenBridge> bridge_;
  std::shared_ptr<TokenGateway> gateway_;
  std::vector<std::thread> workers_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
};

}  // namespace tokengw
