/*
 * 설명: 토큰 워커 진입점. NATS 큐 그룹으로 요청을 받아 IDP(또는 시뮬레이션)에서 토큰을 발급한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_worker_test.cpp
 */
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "tokengw/config.hpp"
#include "tokengw/idp_client.hpp"
#include "tokengw/nats_bus.hpp"
#include "tokengw/observability.hpp"
#include "tokengw/token_worker.hpp"

int main(int argc, char** argv) {
  using namespace tokengw;
  std::string config_path;
  if (argc > 1) {
    config_path = argv[1];
  } else if (const char* env_path = std::getenv("TOKEN_WORKER_CONFIG")) {
    config_path = env_path;
  }

  try {
    WorkerConfig config = LoadWorkerConfig(config_path);
    auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));

    auto bus = std::make_shared<NatsBus>(config.nats, config.worker_name, observability);
    bus->Connect();
    observability->Log(LogLevel::kInfo, "worker", "nats", "connected to " + bus->ConnectedUrl());

    std::shared_ptr<TokenIssuer> issuer;
    if (config.simulate_idp) {
      issuer = std::make_shared<SimulatedIssuer>();
      observability->Log(LogLevel::kWarn, "worker", "idp", "using simulated token issuer");
    } else {
      IdpClientConfig idp_config;
      idp_config.base_url = config.idp_url;
      idp_config.token_path = config.idp_token_path;
      idp_config.timeout = std::chrono::seconds(config.idp_timeout_seconds);
      issuer = std::make_shared<IdpClient>(idp_config);
    }

    TokenWorkerOptions options;
    options.subject = config.token_subject;
    options.queue_group = config.queue_group;
    options.scope = config.idp_scope;
    TokenWorker worker(bus, issuer, options, observability);
    worker.Start();
    observability->Log(LogLevel::kInfo, "worker", "start",
                       config.worker_name + " listening on " + options.subject + " (" + options.queue_group + ")");

    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        observability->Log(LogLevel::kInfo, "worker", "signal", "received signal " + std::to_string(signal_number));
      }
    });
    ioc.run();

    worker.Stop();
    bus->Close();
  } catch (const std::exception& ex) {
    std::cerr << "워커 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
