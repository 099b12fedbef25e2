/*
 * 설명: OAuth2 client-credentials 교환으로 IDP에서 액세스 토큰을 받아 온다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idp_client_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>

#include "tokengw/token_models.hpp"

namespace tokengw {

struct IssuedToken {
  std::string access_token;
  std::string token_type;
  int expires_in{0};
  std::string refresh_token;
  std::string scope;
};

// 자격 증명을 토큰으로 교환하는 주체. 실패 시 IdpError를 던진다.
class TokenIssuer {
 public:
  virtual ~TokenIssuer() = default;
  virtual IssuedToken Issue(const ClientCredentials& credentials, const std::string& scope) = 0;
};

struct IdpClientConfig {
  // 예: https://idp.example.com
  std::string base_url{"https://idp.example.com"};
  std::string token_path{"/realms/phoenix/protocol/openid-connect/token"};
  std::chrono::seconds timeout{std::chrono::seconds(10)};
  bool verify_peer{true};
};

class IdpClient : public TokenIssuer {
 public:
  explicit IdpClient(IdpClientConfig config);

  IssuedToken Issue(const ClientCredentials& credentials, const std::string& scope) override;

  const IdpClientConfig& GetConfig() const { return config_; }

 private:
  struct HttpResult {
    unsigned status{0};
    std::string body;
  };

  HttpResult PostForm(const std::string& body);

  IdpClientConfig config_;
  std::string scheme_;
  std::string host_;
  std::string port_;
  std::string base_path_;
  std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
};

// 실제 IDP 없이 개발할 때 쓰는 발급기. "fake-token-<client_id>-<unix 초>"를 돌려준다.
class SimulatedIssuer : public TokenIssuer {
 public:
  explicit SimulatedIssuer(std::chrono::milliseconds delay = std::chrono::milliseconds(200));

  IssuedToken Issue(const ClientCredentials& credentials, const std::string& scope) override;

 private:
  std::chrono::milliseconds delay_;
};

std::string UrlEncode(const std::string& value);
std::string EncodeClientCredentialsForm(const ClientCredentials& credentials, const std::string& scope);
// IDP 토큰 엔드포인트 응답 본문을 해석한다. access_token이 없으면 IdpError.
IssuedToken ParseIdpTokenResponse(const std::string& body);

}  // namespace tokengw
