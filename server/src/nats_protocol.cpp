/*
 * 설명: NATS 프로토콜 명령 인코딩과 MSG/HMSG/INFO/PING/PONG/+OK/-ERR 파싱을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/nats_protocol_test.cpp
 */
#include "tokengw/nats_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tokengw/errors.hpp"

namespace tokengw {

namespace {
constexpr std::size_t kMaxControlLine = 4096;

std::vector<std::string> SplitArgs(const std::string& line) {
  std::vector<std::string> args;
  std::size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
      ++pos;
    }
    if (pos >= line.size()) {
      break;
    }
    auto end = line.find_first_of(" \t", pos);
    args.push_back(line.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
    pos = end == std::string::npos ? line.size() : end;
  }
  return args;
}

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::uint64_t ParseNumber(const std::string& value, const char* what) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw BusError(std::string("NATS 프로토콜 오류: ") + what + " 값이 올바르지 않습니다: " + value);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw BusError(std::string("NATS 프로토콜 오류: ") + what + " 값이 범위를 벗어났습니다: " + value);
  }
}

std::string RestOfLine(const std::string& line, std::size_t op_len) {
  auto pos = line.find_first_not_of(" \t", op_len);
  return pos == std::string::npos ? std::string{} : line.substr(pos);
}
}  // namespace

std::vector<NatsEvent> NatsProtocolParser::Feed(std::string_view chunk) {
  buffer_.append(chunk.data(), chunk.size());
  std::vector<NatsEvent> events;
  while (true) {
    if (pending_msg_) {
      if (buffer_.size() < pending_size_ + 2) {
        break;
      }
      if (buffer_[pending_size_] != '\r' || buffer_[pending_size_ + 1] != '\n') {
        throw BusError("NATS 프로토콜 오류: MSG 본문 종료가 올바르지 않습니다");
      }
      if (pending_header_size_ > 0) {
        pending_msg_->headers = buffer_.substr(0, pending_header_size_);
        pending_msg_->status = ParseHeaderStatus(pending_msg_->headers);
      }
      pending_msg_->payload = buffer_.substr(pending_header_size_, pending_size_ - pending_header_size_);
      buffer_.erase(0, pending_size_ + 2);
      events.push_back(std::move(*pending_msg_));
      pending_msg_.reset();
      pending_size_ = 0;
      pending_header_size_ = 0;
      continue;
    }

    auto crlf = buffer_.find("\r\n");
    if (crlf == std::string::npos) {
      if (buffer_.size() > kMaxControlLine) {
        throw BusError("NATS 프로토콜 오류: 제어 라인이 너무 깁니다");
      }
      break;
    }
    std::string line = buffer_.substr(0, crlf);
    buffer_.erase(0, crlf + 2);
    if (line.empty()) {
      continue;
    }
    auto event = ParseControlLine(line);
    if (event.type == NatsEvent::Type::kMsg) {
      pending_msg_ = std::move(event);
      continue;
    }
    events.push_back(std::move(event));
  }
  return events;
}

void NatsProtocolParser::ExpectBody(std::size_t header_size, std::size_t total_size) {
  if (header_size > total_size) {
    throw BusError("NATS 프로토콜 오류: 헤더 길이가 전체 길이보다 큽니다");
  }
  if (total_size > max_payload_) {
    throw BusError("NATS 프로토콜 오류: 본문이 max_payload(" + std::to_string(max_payload_) +
                   ")를 넘습니다: " + std::to_string(total_size));
  }
  pending_header_size_ = header_size;
  pending_size_ = total_size;
}

NatsEvent NatsProtocolParser::ParseControlLine(const std::string& line) {
  auto args = SplitArgs(line);
  if (args.empty()) {
    throw BusError("NATS 프로토콜 오류: 빈 제어 라인");
  }
  auto op = ToUpper(args.front());
  NatsEvent event;
  if (op == "MSG") {
    // MSG <subject> <sid> [reply-to] <#bytes>
    if (args.size() != 4 && args.size() != 5) {
      throw BusError("NATS 프로토콜 오류: MSG 인자 수가 올바르지 않습니다: " + line);
    }
    event.type = NatsEvent::Type::kMsg;
    event.subject = args[1];
    event.sid = ParseNumber(args[2], "sid");
    if (args.size() == 5) {
      event.reply_to = args[3];
    }
    ExpectBody(0, static_cast<std::size_t>(ParseNumber(args.back(), "size")));
    return event;
  }
  if (op == "HMSG") {
    // HMSG <subject> <sid> [reply-to] <#header bytes> <#total bytes>
    if (args.size() != 5 && args.size() != 6) {
      throw BusError("NATS 프로토콜 오류: HMSG 인자 수가 올바르지 않습니다: " + line);
    }
    event.type = NatsEvent::Type::kMsg;
    event.subject = args[1];
    event.sid = ParseNumber(args[2], "sid");
    if (args.size() == 6) {
      event.reply_to = args[3];
    }
    ExpectBody(static_cast<std::size_t>(ParseNumber(args[args.size() - 2], "header size")),
               static_cast<std::size_t>(ParseNumber(args.back(), "size")));
    return event;
  }
  if (op == "PING") {
    event.type = NatsEvent::Type::kPing;
    return event;
  }
  if (op == "PONG") {
    event.type = NatsEvent::Type::kPong;
    return event;
  }
  if (op == "+OK") {
    event.type = NatsEvent::Type::kOk;
    return event;
  }
  if (op == "INFO") {
    event.type = NatsEvent::Type::kInfo;
    event.payload = RestOfLine(line, 4);
    return event;
  }
  if (op == "-ERR") {
    event.type = NatsEvent::Type::kErr;
    auto message = RestOfLine(line, 4);
    if (message.size() >= 2 && message.front() == '\'' && message.back() == '\'') {
      message = message.substr(1, message.size() - 2);
    }
    event.payload = message;
    return event;
  }
  throw BusError("NATS 프로토콜 오류: 알 수 없는 명령: " + op);
}

int ParseHeaderStatus(const std::string& headers) {
  auto line_end = headers.find("\r\n");
  auto args = SplitArgs(headers.substr(0, line_end));
  if (args.size() < 2 || args[0].rfind("NATS/", 0) != 0 || args[1].size() != 3 ||
      !std::all_of(args[1].begin(), args[1].end(), [](unsigned char c) { return std::isdigit(c); })) {
    return 0;
  }
  return std::stoi(args[1]);
}

NatsEndpoint ParseNatsUrl(const std::string& url) {
  NatsEndpoint endpoint;
  std::string rest = url;
  auto scheme = rest.find("://");
  if (scheme != std::string::npos) {
    auto name = rest.substr(0, scheme);
    if (name != "nats" && name != "tcp") {
      throw BusError("지원하지 않는 NATS URL 스킴: " + url);
    }
    rest = rest.substr(scheme + 3);
  }
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }
  auto at = rest.rfind('@');
  if (at != std::string::npos) {
    auto userinfo = rest.substr(0, at);
    rest = rest.substr(at + 1);
    auto colon = userinfo.find(':');
    endpoint.user = userinfo.substr(0, colon);
    if (colon != std::string::npos) {
      endpoint.password = userinfo.substr(colon + 1);
    }
  }
  auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    endpoint.port = rest.substr(colon + 1);
    rest = rest.substr(0, colon);
    ParseNumber(endpoint.port, "port");
  }
  if (rest.empty()) {
    throw BusError("NATS URL에 호스트가 없습니다: " + url);
  }
  endpoint.host = rest;
  return endpoint;
}

std::string EncodeConnect(const NatsSettings& settings, const NatsEndpoint& endpoint, const std::string& client_name) {
  // headers + no_responders: 구독자가 없는 요청에 서버가 회신 주제로 503 HMSG를 보낸다.
  nlohmann::json options{{"verbose", false},   {"pedantic", false}, {"lang", "cpp"},
                         {"version", "1.0.0"}, {"protocol", 1},     {"name", client_name},
                         {"headers", true},    {"no_responders", true}};
  const auto& user = settings.user.empty() ? endpoint.user : settings.user;
  const auto& password = settings.password.empty() ? endpoint.password : settings.password;
  if (!user.empty()) {
    options["user"] = user;
    options["pass"] = password;
  }
  if (!settings.token.empty()) {
    options["auth_token"] = settings.token;
  }
  return "CONNECT " + options.dump() + "\r\n";
}

std::string EncodePub(const std::string& subject, const std::string& reply_to, const std::string& payload) {
  std::string frame = "PUB " + subject;
  if (!reply_to.empty()) {
    frame += " " + reply_to;
  }
  frame += " " + std::to_string(payload.size()) + "\r\n";
  frame += payload;
  frame += "\r\n";
  return frame;
}

std::string EncodeSub(const std::string& subject, const std::string& queue_group, std::uint64_t sid) {
  std::string frame = "SUB " + subject;
  if (!queue_group.empty()) {
    frame += " " + queue_group;
  }
  frame += " " + std::to_string(sid) + "\r\n";
  return frame;
}

std::string EncodeUnsub(std::uint64_t sid) { return "UNSUB " + std::to_string(sid) + "\r\n"; }

}  // namespace tokengw
