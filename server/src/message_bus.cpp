/*
 * 설명: 메시지 주제 패턴 매칭을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/in_process_bus_test.cpp
 */
#include "tokengw/message_bus.hpp"

#include <vector>

namespace tokengw {

namespace {
std::vector<std::string> SplitTokens(const std::string& subject) {
  std::vector<std::string> tokens;
  std::size_t pos = 0;
  while (true) {
    auto dot = subject.find('.', pos);
    tokens.push_back(subject.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos));
    if (dot == std::string::npos) {
      break;
    }
    pos = dot + 1;
  }
  return tokens;
}
}  // namespace

bool SubjectMatches(const std::string& pattern, const std::string& subject) {
  if (pattern == subject) {
    return true;
  }
  auto pattern_tokens = SplitTokens(pattern);
  auto subject_tokens = SplitTokens(subject);
  for (std::size_t i = 0; i < pattern_tokens.size(); ++i) {
    if (pattern_tokens[i] == ">") {
      return i + 1 == pattern_tokens.size() && subject_tokens.size() > i;
    }
    if (i >= subject_tokens.size()) {
      return false;
    }
    if (pattern_tokens[i] != "*" && pattern_tokens[i] != subject_tokens[i]) {
      return false;
    }
  }
  return pattern_tokens.size() == subject_tokens.size();
}

}  // namespace tokengw
