/*
 * 설명: NATS 서버에 TCP로 연결하는 MessageBus 구현. 재연결은 하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/nats_protocol_test.cpp, server/tests/unit/nats_bus_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "tokengw/config.hpp"
#include "tokengw/message_bus.hpp"
#include "tokengw/nats_protocol.hpp"
#include "tokengw/observability.hpp"

namespace tokengw {

class NatsBus : public MessageBus {
 public:
  NatsBus(NatsSettings settings, std::string client_name, std::shared_ptr<Observability> observability,
          std::size_t callback_threads = 4);
  ~NatsBus() override;

  NatsBus(const NatsBus&) = delete;
  NatsBus& operator=(const NatsBus&) = delete;

  // INFO/CONNECT/PING/PONG 핸드셰이크까지 동기로 수행한다. 실패 시 BusError.
  // CONNECT는 headers/no_responders를 켜므로 구독자가 없는 요청은 회신 인박스에
  // status가 kNoRespondersStatus인 BusMessage로 통지된다.
  void Connect();
  void Close();

  bool IsConnected() const override;
  void Publish(const std::string& subject, const std::string& reply_to, const std::string& data) override;
  std::uint64_t Subscribe(const std::string& subject, const std::string& queue_group,
                          MessageHandler handler) override;
  void Unsubscribe(std::uint64_t sid) override;
  std::string NewInbox() override;
  std::size_t SubscriptionCount() const override;

  const std::string& ConnectedUrl() const { return settings_.url; }

 private:
  struct Subscription {
    std::string subject;
    std::string queue_group;
    std::shared_ptr<MessageHandler> handler;
  };

  void Handshake(const NatsEndpoint& endpoint);
  void ReadInfo(const std::string& info_json);
  void DoRead();
  void OnRead(const boost::system::error_code& ec, std::size_t bytes_transferred);
  void HandleEvent(NatsEvent event);
  void Send(std::string frame);
  void WriteNext();
  void OnWrite(const boost::system::error_code& ec);
  void MarkDisconnected(const std::string& reason);

  NatsSettings settings_;
  std::string client_name_;
  std::shared_ptr<Observability> observability_;
  boost::asio::io_context ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::ip::tcp::socket socket_;
  std::array<char, 8192> read_buffer_{};
  NatsProtocolParser parser_;
  std::deque<std::string> send_queue_;
  bool writing_{false};
  std::thread io_thread_;
  boost::asio::thread_pool callbacks_;
  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, Subscription> subscriptions_;
  std::uint64_t next_sid_{1};
  std::atomic<std::size_t> max_payload_{kDefaultNatsMaxPayload};
  std::atomic<bool> connected_{false};
  std::atomic<bool> closed_{false};
};

}  // namespace tokengw
