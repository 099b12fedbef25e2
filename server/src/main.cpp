/*
 * 설명: 게이트웨이 진입점으로 설정을 로드해 서버를 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_http_flow_test.cpp
 */
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "tokengw/app.hpp"
#include "tokengw/config.hpp"

int main(int argc, char** argv) {
  using namespace tokengw;
  std::string config_path;
  if (argc > 1) {
    config_path = argv[1];
  } else if (const char* env_path = std::getenv("TOKEN_GATEWAY_CONFIG")) {
    config_path = env_path;
  }

  try {
    AppConfig config = LoadAppConfig(config_path);
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "게이트웨이 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
