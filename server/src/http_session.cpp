/*
 * 설명: HTTP 요청을 읽고 경로별로 분기하며 /token 처리는 브리지 스레드 풀에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_http_flow_test.cpp
 */
#include "tokengw/http_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

namespace tokengw {

namespace {
constexpr const char* kServerName = "token-gateway";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<TokenGateway> gateway,
                         std::shared_ptr<ExpiringTokenCache> cache, std::shared_ptr<TokenBridge> bridge,
                         std::shared_ptr<Observability> observability, boost::asio::thread_pool& bridge_pool)
    : stream_(std::move(socket)), gateway_(std::move(gateway)), cache_(std::move(cache)),
      bridge_(std::move(bridge)), observability_(std::move(observability)), bridge_pool_(bridge_pool) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (path == "/health") {
    if (req_.method() != http::verb::get && req_.method() != http::verb::head) {
      return SendReply(MakeTextReply(405, "Method not allowed"));
    }
    return SendReply(MakeTextReply(200, "OK"));
  }

  if (path == "/token") {
    if (req_.method() != http::verb::post) {
      return SendReply(MakeTextReply(405, "Method not allowed"));
    }
    return HandleToken(query);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(cache_->Size(), bridge_->PendingCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"cache",
                         {{"hits", snapshot.cache_hits},
                          {"misses", snapshot.cache_misses},
                          {"entries", snapshot.cache_entries}}},
                        {"upstream",
                         {{"timeouts", snapshot.upstream_timeouts},
                          {"unavailable", snapshot.upstream_unavailable},
                          {"rejected", snapshot.upstream_rejected},
                          {"pending", snapshot.pending_requests}}}};
    return SendReply(GatewayReply{200, std::string(kJsonContentType), data.dump()});
  }

  SendReply(MakeJsonErrorReply(404, "Not found"));
}

// 브리지 대기가 io 스레드를 막지 않도록 전용 풀에서 처리하고 결과는 연결의 실행기로 되돌린다.
void HttpSession::HandleToken(const std::string& query) {
  TokenHttpRequest request{req_.body(), ParseSkipCache(query), trace_id_};
  auto self = shared_from_this();
  boost::asio::post(bridge_pool_, [self, request = std::move(request)]() {
    GatewayReply reply = self->gateway_->HandleTokenRequest(request);
    boost::asio::post(self->stream_.get_executor(),
                      [self, reply = std::move(reply)]() { self->SendReply(reply); });
  });
}

void HttpSession::SendReply(const GatewayReply& reply) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(static_cast<boost::beast::http::status>(reply.status));
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, reply.content_type);
  res->body() = reply.body;
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  auto status = res->result_int();
  if (status >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx;
  ctx.component = "http";
  ctx.name = std::string(req_.method_string()) + " " + std::string(req_.target());
  ctx.trace_id = trace_id_;
  ctx.status = status;
  ctx.latency_ms = latency;
  observability_->Log(ctx);

  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace tokengw
