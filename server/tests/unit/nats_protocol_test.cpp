#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "tokengw/errors.hpp"
#include "tokengw/nats_protocol.hpp"

namespace {

using tokengw::NatsEvent;

TEST(NatsProtocolTest, ParsesControlCommands) {
  tokengw::NatsProtocolParser parser;
  auto events = parser.Feed("INFO {\"max_payload\":1048576}\r\nPING\r\nPONG\r\n+OK\r\n-ERR 'Authorization Violation'\r\n");
  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(events[0].type, NatsEvent::Type::kInfo);
  EXPECT_EQ(nlohmann::json::parse(events[0].payload)["max_payload"], 1048576);
  EXPECT_EQ(events[1].type, NatsEvent::Type::kPing);
  EXPECT_EQ(events[2].type, NatsEvent::Type::kPong);
  EXPECT_EQ(events[3].type, NatsEvent::Type::kOk);
  EXPECT_EQ(events[4].type, NatsEvent::Type::kErr);
  EXPECT_EQ(events[4].payload, "Authorization Violation");
  EXPECT_EQ(parser.Buffered(), 0u);
}

TEST(NatsProtocolTest, AssemblesMessageSplitAcrossReads) {
  tokengw::NatsProtocolParser parser;
  EXPECT_TRUE(parser.Feed("MSG _INBOX.abc 7 to").empty());
  EXPECT_TRUE(parser.Feed("ken.reply 11\r\nhello ").empty());
  auto events = parser.Feed("world\r\nPING\r\n");
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, NatsEvent::Type::kMsg);
  EXPECT_EQ(events[0].subject, "_INBOX.abc");
  EXPECT_EQ(events[0].sid, 7u);
  EXPECT_EQ(events[0].reply_to, "token.reply");
  EXPECT_EQ(events[0].payload, "hello world");
  EXPECT_EQ(events[1].type, NatsEvent::Type::kPing);
}

TEST(NatsProtocolTest, PayloadMayContainLineBreaks) {
  tokengw::NatsProtocolParser parser;
  auto events = parser.Feed("MSG token.request 1 4\r\na\r\nb\r\n");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].payload, "a\r\nb");
  EXPECT_TRUE(events[0].reply_to.empty());
}

TEST(NatsProtocolTest, ParsesNoRespondersStatusMessage) {
  tokengw::NatsProtocolParser parser;
  auto events = parser.Feed("HMSG _INBOX.a 1 16 16\r\nNATS/1.0 503\r\n\r\n\r\n");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, NatsEvent::Type::kMsg);
  EXPECT_EQ(events[0].subject, "_INBOX.a");
  EXPECT_EQ(events[0].sid, 1u);
  EXPECT_EQ(events[0].status, 503);
  EXPECT_EQ(events[0].headers, "NATS/1.0 503\r\n\r\n");
  EXPECT_TRUE(events[0].payload.empty());
  EXPECT_EQ(parser.Buffered(), 0u);
}

TEST(NatsProtocolTest, SplitsHeadersFromPayload) {
  tokengw::NatsProtocolParser parser;
  EXPECT_TRUE(parser.Feed("HMSG token.request 9 _INBOX.r 21 2").empty());
  auto events = parser.Feed("6\r\nNATS/1.0\r\nX-Id: 1\r\n\r\nhello\r\n");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].reply_to, "_INBOX.r");
  EXPECT_EQ(events[0].headers, "NATS/1.0\r\nX-Id: 1\r\n\r\n");
  EXPECT_EQ(events[0].status, 0);
  EXPECT_EQ(events[0].payload, "hello");
}

TEST(NatsProtocolTest, ReadsHeaderStatusLine) {
  EXPECT_EQ(tokengw::ParseHeaderStatus("NATS/1.0 503\r\n\r\n"), 503);
  EXPECT_EQ(tokengw::ParseHeaderStatus("NATS/1.0 408 Request Timeout\r\n\r\n"), 408);
  EXPECT_EQ(tokengw::ParseHeaderStatus("NATS/1.0\r\nA: b\r\n\r\n"), 0);
  EXPECT_EQ(tokengw::ParseHeaderStatus("garbage"), 0);
}

TEST(NatsProtocolTest, RejectsMalformedBrokerInputWithoutCrashing) {
  tokengw::NatsProtocolParser overflow;
  EXPECT_THROW(overflow.Feed("MSG a 1 99999999999999999999999\r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser blank;
  EXPECT_THROW(blank.Feed("   \r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser sid_overflow;
  EXPECT_THROW(sid_overflow.Feed("MSG a 99999999999999999999999 1\r\nx\r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser header_too_big;
  EXPECT_THROW(header_too_big.Feed("HMSG a 1 20 10\r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser bad_hmsg;
  EXPECT_THROW(bad_hmsg.Feed("HMSG a 1 10\r\n"), tokengw::BusError);
}

TEST(NatsProtocolTest, RejectsMessagesAboveMaxPayload) {
  tokengw::NatsProtocolParser parser;
  EXPECT_EQ(parser.MaxPayload(), tokengw::kDefaultNatsMaxPayload);
  parser.SetMaxPayload(8);
  EXPECT_EQ(parser.Feed("MSG a 1 8\r\n12345678\r\n").size(), 1u);
  EXPECT_THROW(parser.Feed("MSG a 1 9\r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser huge;
  EXPECT_THROW(huge.Feed("MSG a 1 18446744073709551615\r\n"), tokengw::BusError);
}

TEST(NatsProtocolTest, RejectsProtocolViolations) {
  tokengw::NatsProtocolParser unknown;
  EXPECT_THROW(unknown.Feed("HELLO\r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser bad_size;
  EXPECT_THROW(bad_size.Feed("MSG a 1 x\r\n"), tokengw::BusError);

  tokengw::NatsProtocolParser bad_terminator;
  EXPECT_THROW(bad_terminator.Feed("MSG a 1 2\r\nabXY"), tokengw::BusError);

  tokengw::NatsProtocolParser too_long;
  EXPECT_THROW(too_long.Feed(std::string(5000, 'x')), tokengw::BusError);
}

TEST(NatsProtocolTest, ParsesServerUrls) {
  auto plain = tokengw::ParseNatsUrl("nats://localhost:4222");
  EXPECT_EQ(plain.host, "localhost");
  EXPECT_EQ(plain.port, "4222");

  auto with_auth = tokengw::ParseNatsUrl("nats://svc:pw@nats.internal");
  EXPECT_EQ(with_auth.host, "nats.internal");
  EXPECT_EQ(with_auth.port, "4222");
  EXPECT_EQ(with_auth.user, "svc");
  EXPECT_EQ(with_auth.password, "pw");

  EXPECT_THROW(tokengw::ParseNatsUrl("http://localhost:4222"), tokengw::BusError);
  EXPECT_THROW(tokengw::ParseNatsUrl("nats://:4222"), tokengw::BusError);
  EXPECT_THROW(tokengw::ParseNatsUrl("nats://host:abc"), tokengw::BusError);
}

TEST(NatsProtocolTest, EncodesClientCommands) {
  EXPECT_EQ(tokengw::EncodePub("token.request", "_INBOX.1", "{}"), "PUB token.request _INBOX.1 2\r\n{}\r\n");
  EXPECT_EQ(tokengw::EncodePub("subj", "", "abc"), "PUB subj 3\r\nabc\r\n");
  EXPECT_EQ(tokengw::EncodeSub("token.request", "token-workers", 3), "SUB token.request token-workers 3\r\n");
  EXPECT_EQ(tokengw::EncodeSub("_INBOX.x", "", 4), "SUB _INBOX.x 4\r\n");
  EXPECT_EQ(tokengw::EncodeUnsub(4), "UNSUB 4\r\n");
}

TEST(NatsProtocolTest, ConnectCarriesCredentials) {
  tokengw::NatsSettings settings;
  settings.token = "tkn";
  auto endpoint = tokengw::ParseNatsUrl("nats://svc:pw@localhost:4222");
  auto frame = tokengw::EncodeConnect(settings, endpoint, "token-gateway");
  ASSERT_EQ(frame.rfind("CONNECT ", 0), 0u);
  ASSERT_EQ(frame.substr(frame.size() - 2), "\r\n");
  auto options = nlohmann::json::parse(frame.substr(8, frame.size() - 10));
  EXPECT_FALSE(options["verbose"].get<bool>());
  EXPECT_EQ(options["name"], "token-gateway");
  EXPECT_EQ(options["user"], "svc");
  EXPECT_EQ(options["pass"], "pw");
  EXPECT_EQ(options["auth_token"], "tkn");
}

TEST(NatsProtocolTest, ConnectAsksForNoRespondersNotice) {
  auto frame = tokengw::EncodeConnect(tokengw::NatsSettings{}, tokengw::ParseNatsUrl("nats://localhost"), "w");
  auto options = nlohmann::json::parse(frame.substr(8, frame.size() - 10));
  EXPECT_TRUE(options["headers"].get<bool>());
  EXPECT_TRUE(options["no_responders"].get<bool>());
  EXPECT_FALSE(options.contains("user"));
}

}  // namespace
