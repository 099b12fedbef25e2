/*
 * 설명: Boost.Beast(HTTP/HTTPS)로 IDP 토큰 엔드포인트를 호출하고 응답을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idp_client_test.cpp
 */
#include "tokengw/idp_client.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>

#include "tokengw/errors.hpp"

namespace tokengw {

namespace http = boost::beast::http;

namespace {
template <typename T>
inline constexpr bool kIsSslStream = false;
template <typename Next>
inline constexpr bool kIsSslStream<boost::beast::ssl_stream<Next>> = true;

// 연결 → (TLS 핸드셰이크) → 쓰기 → 읽기를 비동기로 이어 붙이고 ioc를 끝까지 돌린다.
// tcp_stream의 타임아웃은 비동기 연산에만 적용된다.
template <typename Stream>
boost::beast::error_code Exchange(boost::asio::io_context& ioc, Stream& stream,
                                  const boost::asio::ip::tcp::resolver::results_type& results,
                                  std::chrono::seconds timeout, http::request<http::string_body>& req,
                                  http::response<http::string_body>& res) {
  boost::beast::error_code result;
  boost::beast::flat_buffer buffer;
  auto& lowest = boost::beast::get_lowest_layer(stream);

  auto on_read = [&result](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { result = ec; };
  auto on_write = [&](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      result = ec;
      return;
    }
    lowest.expires_after(timeout);
    http::async_read(stream, buffer, res, on_read);
  };
  auto send = [&]() {
    lowest.expires_after(timeout);
    http::async_write(stream, req, on_write);
  };

  lowest.expires_after(timeout);
  lowest.async_connect(results, [&](boost::beast::error_code ec, const boost::asio::ip::tcp::endpoint&) {
    if (ec) {
      result = ec;
      return;
    }
    if constexpr (kIsSslStream<Stream>) {
      lowest.expires_after(timeout);
      stream.async_handshake(boost::asio::ssl::stream_base::client, [&](boost::beast::error_code hs_ec) {
        if (hs_ec) {
          result = hs_ec;
          return;
        }
        send();
      });
    } else {
      send();
    }
  });
  ioc.run();
  return result;
}
}  // namespace

std::string UrlEncode(const std::string& value) {
  std::ostringstream oss;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      oss << c;
    } else if (c == ' ') {
      oss << '+';
    } else {
      oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
          << std::nouppercase << std::dec;
    }
  }
  return oss.str();
}

std::string EncodeClientCredentialsForm(const ClientCredentials& credentials, const std::string& scope) {
  std::string body = "grant_type=client_credentials";
  body += "&client_id=" + UrlEncode(credentials.client_id);
  body += "&client_secret=" + UrlEncode(credentials.client_secret);
  if (!scope.empty()) {
    body += "&scope=" + UrlEncode(scope);
  }
  return body;
}

namespace {
int ReadExpiresIn(const nlohmann::json& parsed) {
  auto it = parsed.find("expires_in");
  if (it == parsed.end() || it->is_null()) {
    return 0;
  }
  if (it->is_number_unsigned() &&
      it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
    return static_cast<int>(it->get<std::uint64_t>());
  }
  throw IdpError("expires_in out of range in token response: " + it->dump());
}
}  // namespace

IssuedToken ParseIdpTokenResponse(const std::string& body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw IdpError("failed to parse token response");
  }
  IssuedToken token;
  try {
    token.access_token = parsed.value("access_token", std::string{});
    token.token_type = parsed.value("token_type", std::string{"Bearer"});
    token.refresh_token = parsed.value("refresh_token", std::string{});
    token.scope = parsed.value("scope", std::string{});
  } catch (const nlohmann::json::exception& ex) {
    throw IdpError(std::string("failed to parse token response: ") + ex.what());
  }
  if (token.access_token.empty()) {
    throw IdpError("access_token missing in token response");
  }
  token.expires_in = ReadExpiresIn(parsed);
  return token;
}

IdpClient::IdpClient(IdpClientConfig config) : config_(std::move(config)) {
  std::string rest = config_.base_url;
  auto scheme_end = rest.find("://");
  if (scheme_end == std::string::npos) {
    throw IdpError("IDP URL에 스킴이 없습니다: " + config_.base_url);
  }
  scheme_ = rest.substr(0, scheme_end);
  if (scheme_ != "http" && scheme_ != "https") {
    throw IdpError("지원하지 않는 IDP URL 스킴: " + scheme_);
  }
  rest = rest.substr(scheme_end + 3);
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    base_path_ = rest.substr(slash);
    if (!base_path_.empty() && base_path_.back() == '/') {
      base_path_.pop_back();
    }
    rest = rest.substr(0, slash);
  }
  auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    port_ = rest.substr(colon + 1);
    host_ = rest.substr(0, colon);
  } else {
    host_ = rest;
    port_ = scheme_ == "https" ? "443" : "80";
  }
  if (host_.empty()) {
    throw IdpError("IDP URL에 호스트가 없습니다: " + config_.base_url);
  }

  if (scheme_ == "https") {
    ssl_ctx_ = std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
    ssl_ctx_->set_default_verify_paths();
    ssl_ctx_->set_verify_mode(config_.verify_peer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
  }
}

IssuedToken IdpClient::Issue(const ClientCredentials& credentials, const std::string& scope) {
  auto result = PostForm(EncodeClientCredentialsForm(credentials, scope));
  if (result.status != 200) {
    throw IdpError("IDP returned error status: " + std::to_string(result.status) + ", body: " + result.body,
                   result.status);
  }
  return ParseIdpTokenResponse(result.body);
}

IdpClient::HttpResult IdpClient::PostForm(const std::string& body) {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::resolver resolver{ioc};

  http::request<http::string_body> req{http::verb::post, base_path_ + config_.token_path, 11};
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/x-www-form-urlencoded");
  req.set(http::field::accept, "application/json");
  req.body() = body;
  req.prepare_payload();

  http::response<http::string_body> res;
  boost::beast::error_code ec;
  auto const results = resolver.resolve(host_, port_, ec);
  if (ec) {
    throw IdpError("failed to send request: " + ec.message());
  }
  if (ssl_ctx_) {
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream{ioc, *ssl_ctx_};
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
      throw IdpError("SNI 설정 실패: " + host_);
    }
    ec = Exchange(ioc, stream, results, config_.timeout, req, res);
  } else {
    boost::beast::tcp_stream stream{ioc};
    ec = Exchange(ioc, stream, results, config_.timeout, req, res);
    boost::beast::error_code ignored;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  }
  if (ec) {
    throw IdpError("failed to send request: " + ec.message());
  }
  return HttpResult{res.result_int(), res.body()};
}

SimulatedIssuer::SimulatedIssuer(std::chrono::milliseconds delay) : delay_(delay) {}

IssuedToken SimulatedIssuer::Issue(const ClientCredentials& credentials, const std::string& scope) {
  auto unix_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  if (delay_.count() > 0) {
    std::this_thread::sleep_for(delay_);
  }
  IssuedToken token;
  token.access_token = "fake-token-" + credentials.client_id + "-" + std::to_string(unix_seconds);
  token.token_type = "Bearer";
  token.expires_in = 3600;
  token.scope = scope;
  return token;
}

}  // namespace tokengw
