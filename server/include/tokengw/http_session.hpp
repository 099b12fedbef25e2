/*
 * 설명: HTTP 연결을 처리하고 /health, /token, /metrics 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_http_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "tokengw/api_response.hpp"
#include "tokengw/observability.hpp"
#include "tokengw/token_bridge.hpp"
#include "tokengw/token_cache.hpp"
#include "tokengw/token_gateway.hpp"

namespace tokengw {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<TokenGateway> gateway,
              std::shared_ptr<ExpiringTokenCache> cache, std::shared_ptr<TokenBridge> bridge,
              std::shared_ptr<Observability> observability, boost::asio::thread_pool& bridge_pool);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleToken(const std::string& query);
  void SendReply(const GatewayReply& reply);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<TokenGateway> gateway_;
  std::shared_ptr<ExpiringTokenCache> cache_;
  std::shared_ptr<TokenBridge> bridge_;
  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool& bridge_pool_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace tokengw
