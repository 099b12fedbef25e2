/*
 * 설명: NATS 연결 핸드셰이크, 수신 루프, 쓰기 큐, 구독 디스패치를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "tokengw/nats_bus.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <nlohmann/json.hpp>

#include "tokengw/errors.hpp"
#include "tokengw/random_id.hpp"

namespace tokengw {

namespace {
constexpr const char* kComponent = "nats";

std::string ReadLine(boost::asio::ip::tcp::socket& socket, boost::asio::streambuf& buffer) {
  boost::system::error_code ec;
  auto n = boost::asio::read_until(socket, buffer, "\r\n", ec);
  if (ec) {
    throw BusError("NATS 핸드셰이크 수신 실패: " + ec.message());
  }
  std::string line(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_begin(buffer.data()) + n);
  buffer.consume(n);
  return line;
}
}  // namespace

NatsBus::NatsBus(NatsSettings settings, std::string client_name, std::shared_ptr<Observability> observability,
                 std::size_t callback_threads)
    : settings_(std::move(settings)), client_name_(std::move(client_name)),
      observability_(std::move(observability)), ioc_(1), strand_(boost::asio::make_strand(ioc_)),
      work_guard_(boost::asio::make_work_guard(ioc_)), socket_(strand_), callbacks_(callback_threads) {}

NatsBus::~NatsBus() { Close(); }

void NatsBus::Connect() {
  if (closed_) {
    throw BusError("닫힌 NATS 연결은 다시 사용할 수 없습니다");
  }
  auto endpoint = ParseNatsUrl(settings_.url);
  boost::asio::ip::tcp::resolver resolver{ioc_};
  boost::system::error_code ec;
  auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
  if (ec) {
    throw BusError("NATS 호스트 해석 실패 (" + endpoint.host + "): " + ec.message());
  }
  boost::asio::connect(socket_, results, ec);
  if (ec) {
    throw BusError("NATS 연결 실패 (" + settings_.url + "): " + ec.message());
  }

  Handshake(endpoint);
  connected_ = true;
  if (observability_) {
    observability_->Log(LogLevel::kInfo, kComponent, "nats.connected", settings_.url);
  }

  io_thread_ = std::thread([this]() { ioc_.run(); });
  boost::asio::post(strand_, [this]() { DoRead(); });
}

void NatsBus::Handshake(const NatsEndpoint& endpoint) {
  boost::asio::streambuf buffer;
  NatsProtocolParser handshake_parser;
  auto events = handshake_parser.Feed(ReadLine(socket_, buffer));
  if (events.empty() || events.front().type != NatsEvent::Type::kInfo) {
    throw BusError("NATS 서버가 INFO로 시작하지 않았습니다");
  }
  ReadInfo(events.front().payload);

  auto hello = EncodeConnect(settings_, endpoint, client_name_) + "PING\r\n";
  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(hello), ec);
  if (ec) {
    throw BusError("NATS CONNECT 전송 실패: " + ec.message());
  }

  while (true) {
    for (auto& event : handshake_parser.Feed(ReadLine(socket_, buffer))) {
      switch (event.type) {
        case NatsEvent::Type::kPong:
          parser_ = NatsProtocolParser{};
          parser_.SetMaxPayload(max_payload_);
          return;
        case NatsEvent::Type::kErr:
          throw BusError("NATS 서버가 연결을 거부했습니다: " + event.payload);
        case NatsEvent::Type::kInfo:
          ReadInfo(event.payload);
          break;
        default:
          break;
      }
    }
  }
}

void NatsBus::ReadInfo(const std::string& info_json) {
  auto info = nlohmann::json::parse(info_json, nullptr, false);
  if (info.is_object() && info.contains("max_payload") && info["max_payload"].is_number_unsigned()) {
    max_payload_ = info["max_payload"].get<std::size_t>();
    parser_.SetMaxPayload(max_payload_);
  }
}

void NatsBus::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  connected_ = false;
  boost::asio::post(strand_, [this]() {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  });
  work_guard_.reset();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  ioc_.stop();
  callbacks_.stop();
  callbacks_.join();
}

bool NatsBus::IsConnected() const { return connected_; }

void NatsBus::Publish(const std::string& subject, const std::string& reply_to, const std::string& data) {
  if (!connected_) {
    throw BusError("NATS 연결이 없습니다");
  }
  if (data.size() > max_payload_) {
    throw BusError("메시지가 서버 max_payload를 초과합니다");
  }
  Send(EncodePub(subject, reply_to, data));
}

std::uint64_t NatsBus::Subscribe(const std::string& subject, const std::string& queue_group, MessageHandler handler) {
  if (!connected_) {
    throw BusError("NATS 연결이 없습니다");
  }
  std::uint64_t sid = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sid = next_sid_++;
    subscriptions_.emplace(
        sid, Subscription{subject, queue_group, std::make_shared<MessageHandler>(std::move(handler))});
  }
  Send(EncodeSub(subject, queue_group, sid));
  return sid;
}

void NatsBus::Unsubscribe(std::uint64_t sid) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscriptions_.erase(sid) == 0) {
      return;
    }
  }
  if (connected_) {
    Send(EncodeUnsub(sid));
  }
}

std::string NatsBus::NewInbox() { return "_INBOX." + RandomHex(11); }

std::size_t NatsBus::SubscriptionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

void NatsBus::DoRead() {
  socket_.async_read_some(
      boost::asio::buffer(read_buffer_),
      boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec, std::size_t n) {
        OnRead(ec, n);
      }));
}

void NatsBus::OnRead(const boost::system::error_code& ec, std::size_t bytes_transferred) {
  if (ec) {
    MarkDisconnected(ec.message());
    return;
  }
  try {
    for (auto& event : parser_.Feed(std::string_view(read_buffer_.data(), bytes_transferred))) {
      HandleEvent(std::move(event));
    }
  } catch (const std::exception& ex) {
    MarkDisconnected(ex.what());
    boost::system::error_code ignored;
    socket_.close(ignored);
    return;
  }
  DoRead();
}

void NatsBus::HandleEvent(NatsEvent event) {
  switch (event.type) {
    case NatsEvent::Type::kMsg: {
      std::shared_ptr<MessageHandler> handler;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(event.sid);
        if (it == subscriptions_.end()) {
          return;
        }
        handler = it->second.handler;
      }
      BusMessage message{event.subject, event.reply_to, std::move(event.payload), event.status};
      boost::asio::post(callbacks_, [this, handler, message = std::move(message)]() {
        try {
          (*handler)(message);
        } catch (const std::exception& ex) {
          if (observability_) {
            observability_->Log(LogLevel::kError, kComponent, "nats.handler_failed", ex.what());
          }
        }
      });
      return;
    }
    case NatsEvent::Type::kPing:
      Send("PONG\r\n");
      return;
    case NatsEvent::Type::kInfo:
      ReadInfo(event.payload);
      return;
    case NatsEvent::Type::kErr:
      if (observability_) {
        observability_->Log(LogLevel::kError, kComponent, "nats.server_error", event.payload);
      }
      return;
    case NatsEvent::Type::kPong:
    case NatsEvent::Type::kOk:
      return;
  }
}

void NatsBus::Send(std::string frame) {
  boost::asio::post(strand_, [this, frame = std::move(frame)]() mutable {
    send_queue_.push_back(std::move(frame));
    if (!writing_) {
      WriteNext();
    }
  });
}

void NatsBus::WriteNext() {
  if (send_queue_.empty() || !connected_) {
    writing_ = false;
    return;
  }
  writing_ = true;
  boost::asio::async_write(socket_, boost::asio::buffer(send_queue_.front()),
                           boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec,
                                                                      std::size_t /*bytes_transferred*/) {
                             OnWrite(ec);
                           }));
}

void NatsBus::OnWrite(const boost::system::error_code& ec) {
  if (!send_queue_.empty()) {
    send_queue_.pop_front();
  }
  if (ec) {
    writing_ = false;
    MarkDisconnected(ec.message());
    return;
  }
  WriteNext();
}

void NatsBus::MarkDisconnected(const std::string& reason) {
  if (!connected_.exchange(false)) {
    return;
  }
  send_queue_.clear();
  if (observability_) {
    observability_->Log(LogLevel::kWarn, kComponent, "nats.disconnected", reason);
  }
}

}  // namespace tokengw
