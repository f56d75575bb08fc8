#include "sip/SipConstants.h"
#include "sip/SipError.h"
#include "sip/SipMessage.h"
#include "sip/SipParser.h"
#include <gtest/gtest.h>

namespace {

const char *kInvite = "INVITE sip:bob@example.com SIP/2.0\r\n"
                      "Via: SIP/2.0/WSS a.invalid;branch=z9hG4bKabc, SIP/2.0/WSS b.invalid;branch=z9hG4bKdef\r\n"
                      "From: \"Alice Smith\" <sip:alice@example.com>;tag=1928\r\n"
                      "To: <sip:bob@example.com>\r\n"
                      "Call-ID: a84b4c76e66710\r\n"
                      "CSeq: 314159 INVITE\r\n"
                      "Content-Type: application/sdp\r\n"
                      "Content-Length: 4\r\n"
                      "\r\n"
                      "v=0\n";

} // namespace

TEST(SipParserTest, ParsesRequest) {
  auto msg = SipParser::parse(kInvite);
  ASSERT_TRUE(msg.has_value());

  EXPECT_TRUE(msg->isRequest);
  EXPECT_EQ(msg->method, SipMethod::INVITE);
  EXPECT_EQ(msg->methodStr, "INVITE");
  EXPECT_EQ(msg->uri, "sip:bob@example.com");
  EXPECT_EQ(msg->body, "v=0\n");
  EXPECT_EQ(msg->getCallId(), std::optional<std::string>("a84b4c76e66710"));
  EXPECT_EQ(msg->getBranch(), std::optional<std::string>("z9hG4bKabc"));
  EXPECT_EQ(msg->getFromTag(), "1928");
  EXPECT_EQ(msg->getFromDisplayName(), "Alice Smith");

  auto cseq = msg->getCSeq();
  ASSERT_TRUE(cseq.has_value());
  EXPECT_EQ(cseq->seq, 314159u);
  EXPECT_EQ(cseq->method, "INVITE");
}

TEST(SipParserTest, ParsesResponse) {
  auto msg = SipParser::parse("SIP/2.0 401 Unauthorized\r\n"
                              "Via: SIP/2.0/WSS x.invalid;branch=z9hG4bK1\r\n"
                              "CSeq: 2 REGISTER\r\n"
                              "WWW-Authenticate: Digest realm=\"r\", nonce=\"n\"\r\n"
                              "\r\n");
  ASSERT_TRUE(msg.has_value());
  EXPECT_FALSE(msg->isRequest);
  EXPECT_EQ(msg->statusCode, 401);
  EXPECT_EQ(msg->statusPhrase, "Unauthorized");
  EXPECT_FALSE(msg->isSuccess());
  EXPECT_FALSE(msg->isProvisional());
  EXPECT_TRUE(msg->hasHeader("www-authenticate"));
  EXPECT_TRUE(msg->body.empty());
}

TEST(SipParserTest, ExpandsCompactHeaders) {
  auto msg = SipParser::parse("OPTIONS sip:x SIP/2.0\r\n"
                              "v: SIP/2.0/WSS h.invalid;branch=z9hG4bKq\r\n"
                              "i: compact-call\r\n"
                              "f: <sip:a@b>\r\n"
                              "t: <sip:c@d>\r\n"
                              "CSeq: 1 OPTIONS\r\n"
                              "l: 0\r\n"
                              "\r\n");
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(msg->getCallId(), std::optional<std::string>("compact-call"));
  EXPECT_EQ(msg->getBranch(), std::optional<std::string>("z9hG4bKq"));
  EXPECT_EQ(msg->headers[0].name, "Via");
  EXPECT_EQ(msg->headers[1].name, "Call-ID");
}

TEST(SipParserTest, JoinsFoldedHeaderLines) {
  auto msg = SipParser::parse("OPTIONS sip:x SIP/2.0\r\n"
                              "Subject: first\r\n"
                              "  second\r\n"
                              "\r\n");
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(msg->getHeader("Subject"), std::optional<std::string>("first second"));
}

TEST(SipParserTest, RejectsGarbage) {
  EXPECT_FALSE(SipParser::parse("").has_value());
  EXPECT_FALSE(SipParser::parse("hello").has_value());
  EXPECT_FALSE(SipParser::parse("SIP/2.0 2000 OK\r\n\r\n").has_value());
  EXPECT_FALSE(SipParser::parse("SIP/2.0 099 Low\r\n\r\n").has_value());
  EXPECT_FALSE(SipParser::parse("OPTIONS sip:x HTTP/1.1\r\n\r\n").has_value());
  EXPECT_FALSE(SipParser::parse("OPTIONS sip:x SIP/2.0\r\nNoColonHere\r\n\r\n").has_value());
}

TEST(SipParserTest, ToleratesHighBitBytesInStartLine) {
  EXPECT_FALSE(SipParser::parse("SIP/2.0 2\xE9" "0 OK\r\n\r\n").has_value());

  auto msg = SipParser::parse("\xC3\xA9vite sip:x SIP/2.0\r\n\r\n");
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(msg->method, SipMethod::UNKNOWN);
  EXPECT_EQ(msg->methodStr, "\xC3\xA9VITE");
}

TEST(SipParserTest, RejectsShortBody) {
  EXPECT_FALSE(SipParser::parse("OPTIONS sip:x SIP/2.0\r\n"
                                "Content-Length: 10\r\n"
                                "\r\n"
                                "abc")
                   .has_value());
}

TEST(SipMessageTest, SerializesWithContentLength) {
  SipMessage msg = SipMessage::request(SipMethod::REGISTER, "sip:example.com");
  msg.addHeader("Call-ID", "abc");
  msg.addHeader("Content-Length", "999");
  msg.body = "hello";

  std::string raw = msg.toString();
  EXPECT_EQ(raw.rfind("REGISTER sip:example.com SIP/2.0\r\n", 0), 0u);
  EXPECT_NE(raw.find("Call-ID: abc\r\n"), std::string::npos);
  EXPECT_NE(raw.find("Content-Length: 5\r\n\r\nhello"), std::string::npos);
  EXPECT_EQ(raw.find("999"), std::string::npos);

  auto parsed = SipParser::parse(raw);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->body, "hello");
}

TEST(SipMessageTest, ResponseCarriesReasonPhrase) {
  EXPECT_EQ(SipMessage::response(202).statusPhrase, "Accepted");
  EXPECT_EQ(SipMessage::response(180).statusPhrase, "Ringing");
  EXPECT_TRUE(SipMessage::response(100).isProvisional());
  EXPECT_TRUE(SipMessage::response(200).isSuccess());
}

TEST(SipMessageTest, RequireHeaderThrowsWhenMissing) {
  SipMessage msg = SipMessage::request(SipMethod::OPTIONS, "sip:x");
  try {
    msg.requireHeader(SipConstants::HDR_VIA);
    FAIL() << "expected SipError";
  } catch (const SipError &e) {
    EXPECT_EQ(e.kind(), SipErrorKind::MISSING_HEADER);
  }
}

TEST(SipMessageTest, BranchAbsentWithoutParameter) {
  SipMessage msg = SipMessage::request(SipMethod::OPTIONS, "sip:x");
  EXPECT_FALSE(msg.getBranch().has_value());
  msg.addHeader("Via", "SIP/2.0/WSS h.invalid");
  EXPECT_FALSE(msg.getBranch().has_value());
  EXPECT_FALSE(msg.getCSeq().has_value());
  EXPECT_EQ(msg.getFromDisplayName(), "");
}
