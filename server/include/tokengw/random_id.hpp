/*
 * 설명: 요청 ID와 회신 인박스 이름에 쓰는 난수 식별자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <cstddef>
#include <string>

namespace tokengw {

// OpenSSL CSPRNG에서 bytes 바이트를 읽어 소문자 16진 문자열로 반환한다.
// 난수를 얻지 못하면 RandomSourceError.
std::string RandomHex(std::size_t bytes);

std::string GenerateRequestId();

}  // namespace tokengw
