/*
 * 설명: OpenSSL 난수 기반 식별자 생성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_models_test.cpp
 */
#include "tokengw/random_id.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/rand.h>

#include "tokengw/errors.hpp"

namespace tokengw {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw RandomSourceError("RAND_bytes 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

// 형식: 20240101120000.123-<16 hex>
std::string GenerateRequestId() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto tt = clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d%H%M%S") << '.' << std::setw(3) << std::setfill('0') << millis << '-'
      << RandomHex(8);
  return oss.str();
}

}  // namespace tokengw
