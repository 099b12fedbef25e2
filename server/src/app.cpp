/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_http_flow_test.cpp
 */
#include "tokengw/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <future>

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "tokengw/http_session.hpp"
#include "tokengw/idp_client.hpp"
#include "tokengw/in_process_bus.hpp"
#include "tokengw/nats_bus.hpp"
#include "tokengw/token_worker.hpp"

namespace tokengw {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<TokenGateway> gateway, std::shared_ptr<ExpiringTokenCache> cache,
           std::shared_ptr<TokenBridge> bridge, std::shared_ptr<Observability> observability,
           boost::asio::thread_pool& bridge_pool)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), gateway_(std::move(gateway)), cache_(std::move(cache)),
        bridge_(std::move(bridge)), observability_(std::move(observability)), bridge_pool_(bridge_pool) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    port_ = acceptor_.local_endpoint().port();
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->gateway_, self->cache_, self->bridge_,
                                          self->observability_, self->bridge_pool_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<TokenGateway> gateway_;
  std::shared_ptr<ExpiringTokenCache> cache_;
  std::shared_ptr<TokenBridge> bridge_;
  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool& bridge_pool_;
  unsigned short port_{0};
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<MessageBus> bus,
                     std::shared_ptr<Observability> observability)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)),
      bridge_pool_(std::max<std::size_t>(1, config.bridge_threads)), observability_(std::move(observability)),
      bus_(std::move(bus)) {
  if (!observability_) {
    observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  }

  if (!bus_) {
    if (config_.transport == "inproc") {
      // 브로커 없이 개발할 때: 같은 프로세스의 시뮬레이션 워커가 요청을 처리한다.
      inproc_bus_ = std::make_shared<InProcessBus>(4, observability_);
      bus_ = inproc_bus_;
      TokenWorkerOptions options;
      options.subject = config_.token_subject;
      embedded_worker_ = std::make_shared<TokenWorker>(bus_, std::make_shared<SimulatedIssuer>(), options,
                                                       observability_);
    } else {
      nats_bus_ = std::make_shared<NatsBus>(config_.nats, "token-gateway", observability_);
      bus_ = nats_bus_;
    }
  }

  cache_ = std::make_shared<ExpiringTokenCache>(ioc_, std::chrono::seconds(config_.cache_sweep_interval_seconds));
  bridge_ = std::make_shared<TokenBridge>(bus_, BridgeConfig{config_.token_subject}, observability_);
  GatewayConfig gateway_config;
  gateway_config.request_timeout = std::chrono::milliseconds(config_.request_timeout_ms);
  gateway_config.cache_ttl = std::chrono::seconds(config_.cache_ttl_seconds);
  gateway_ = std::make_shared<TokenGateway>(cache_, bridge_, gateway_config, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return;
  }
  if (nats_bus_) {
    nats_bus_->Connect();
    observability_->Log(LogLevel::kInfo, "app", "nats", "connected to " + nats_bus_->ConnectedUrl());
  }
  if (embedded_worker_) {
    embedded_worker_->Start();
  }

  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, gateway_, cache_, bridge_, observability_, bridge_pool_);
  listener_->Run();
  cache_->Start();
  running_ = true;
  RunWorkers();
  observability_->Log(LogLevel::kInfo, "app", "start", "listening on port " + std::to_string(BoundPort()));
}

void ServerApp::Run() {
  Start();
  std::promise<int> stop_signal;
  auto stopped = stop_signal.get_future();
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([&stop_signal](const boost::system::error_code& ec, int signal_number) {
    stop_signal.set_value(ec ? 0 : signal_number);
  });
  int signal_number = stopped.get();
  observability_->Log(LogLevel::kInfo, "app", "signal", "received signal " + std::to_string(signal_number));
  Stop();
}

void ServerApp::RunWorkers() {
  std::size_t thread_count = config_.io_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  // 브리지 응답 게시와 캐시 정리 타이머가 HTTP 처리와 겹칠 수 있도록 최소 두 개를 둔다.
  thread_count = std::max<std::size_t>(2, thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return;
  }
  running_ = false;
  cache_->Stop();
  if (listener_) {
    listener_->Stop();
  }
  bridge_pool_.join();
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  // 워커가 진행 중인 발급을 마친 뒤에 버스를 닫는다.
  if (embedded_worker_) {
    embedded_worker_->Stop();
  }
  if (inproc_bus_) {
    inproc_bus_->Close();
  }
  if (nats_bus_) {
    nats_bus_->Close();
  }
  observability_->Log(LogLevel::kInfo, "app", "stop", "server stopped");
}

unsigned short ServerApp::BoundPort() const { return listener_ ? listener_->Port() : config_.port; }

}  // namespace tokengw
