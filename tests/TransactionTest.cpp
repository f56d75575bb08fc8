#include "sip/ClientTransaction.h"
#include "sip/SipConstants.h"
#include "sip/SipError.h"
#include "sip/ServerTransaction.h"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace {

SipMessage makeRequest(const std::string &branch = "z9hG4bKtx") {
  SipMessage msg = SipMessage::request(SipMethod::REGISTER, "sip:example.com");
  msg.addHeader("Via", "SIP/2.0/WSS h.invalid;branch=" + branch);
  msg.addHeader("From", "<sip:alice@example.com>;tag=x");
  msg.addHeader("To", "<sip:alice@example.com>");
  msg.addHeader("CSeq", "3 REGISTER");
  msg.addHeader("Call-ID", "call-tx");
  return msg;
}

SipMessage answer(const SipMessage &request, int code) {
  SipMessage msg = SipMessage::response(code);
  msg.addHeader("Via", *request.getHeader("Via"));
  msg.addHeader("Call-ID", *request.getHeader("Call-ID"));
  msg.addHeader("CSeq", *request.getHeader("CSeq"));
  return msg;
}

struct Pending {
  std::shared_ptr<TransactionRegistry> registry = std::make_shared<TransactionRegistry>();
  std::shared_ptr<ClientTransaction::ResponseChannel> channel =
      std::make_shared<ClientTransaction::ResponseChannel>(8);

  ClientTransaction start(const SipMessage &request) {
    ClientTransaction tx(request, channel, registry);
    registry->addTransaction(tx.key(), channel);
    return tx;
  }
};

} // namespace

TEST(ClientTransactionTest, SkipsProvisionalResponses) {
  Pending pending;
  SipMessage request = makeRequest();
  ClientTransaction tx = pending.start(request);

  pending.registry->route(answer(request, 100));
  pending.registry->route(answer(request, 180));
  pending.registry->route(answer(request, 200));

  SipMessage response = tx.receive();
  EXPECT_EQ(response.statusCode, 200);
}

TEST(ClientTransactionTest, ReceiveWaitsForRoutedResponse) {
  Pending pending;
  SipMessage request = makeRequest();
  ClientTransaction tx = pending.start(request);

  std::thread server([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pending.registry->route(answer(request, 401));
  });

  EXPECT_EQ(tx.receive().statusCode, 401);
  server.join();
}

TEST(ClientTransactionTest, DroppingHandleDeregisters) {
  Pending pending;
  SipMessage request = makeRequest();
  {
    ClientTransaction tx = pending.start(request);
    EXPECT_EQ(pending.registry->count(), 1u);
  }
  EXPECT_EQ(pending.registry->count(), 0u);
  EXPECT_TRUE(pending.channel->isClosed());
  EXPECT_FALSE(pending.registry->route(answer(request, 200)));
}

TEST(ClientTransactionTest, ThrowsWhenConnectionCloses) {
  Pending pending;
  ClientTransaction tx = pending.start(makeRequest());
  pending.registry->closeAll();

  try {
    tx.receive();
    FAIL() << "expected SipError";
  } catch (const SipError &e) {
    EXPECT_EQ(e.kind(), SipErrorKind::TRANSACTION_CLOSED);
  }
}

TEST(ClientTransactionTest, ReceiveAfterFinalResponseFails) {
  Pending pending;
  SipMessage request = makeRequest();
  ClientTransaction tx = pending.start(request);
  pending.registry->route(answer(request, 200));

  EXPECT_EQ(tx.receive().statusCode, 200);
  EXPECT_TRUE(pending.channel->isClosed());

  try {
    tx.receive();
    FAIL() << "expected SipError";
  } catch (const SipError &e) {
    EXPECT_EQ(e.kind(), SipErrorKind::TRANSACTION_CLOSED);
  }
}

TEST(ClientTransactionTest, DisplacedByDuplicateKeyFails) {
  auto registry = std::make_shared<TransactionRegistry>();
  auto oldChannel = std::make_shared<ClientTransaction::ResponseChannel>(8);
  auto newChannel = std::make_shared<ClientTransaction::ResponseChannel>(8);
  SipMessage request = makeRequest("z9hG4bKsame");

  ClientTransaction older(request, oldChannel, registry);
  registry->addTransaction(older.key(), oldChannel);
  ClientTransaction newer(request, newChannel, registry);
  registry->addTransaction(newer.key(), newChannel);

  try {
    older.receive();
    FAIL() << "expected SipError";
  } catch (const SipError &e) {
    EXPECT_EQ(e.kind(), SipErrorKind::TRANSACTION_CLOSED);
  }

  // The newer handle still owns the key
  registry->route(answer(request, 200));
  EXPECT_EQ(newer.receive().statusCode, 200);
}

TEST(ClientTransactionTest, OutlivesRegistry) {
  Pending pending;
  ClientTransaction tx = pending.start(makeRequest());
  pending.registry.reset();
  // Destroying tx afterwards must not touch the dead registry
  SUCCEED();
}

TEST(ClientTransactionTest, MovedFromHandleReleasesNothing) {
  Pending pending;
  ClientTransaction first = pending.start(makeRequest());
  ClientTransaction second = std::move(first);
  EXPECT_EQ(pending.registry->count(), 1u);
  EXPECT_FALSE(pending.channel->isClosed());
}

TEST(ServerTransactionTest, ResponseEchoesCorrelationHeaders) {
  auto responses = std::make_shared<ServerTransaction::ResponseChannel>(4);
  SipMessage request = makeRequest();
  request.addHeader("Via", "SIP/2.0/WSS proxy.invalid;branch=z9hG4bKsecond");
  request.addHeader("Subject", "not copied");
  ServerTransaction tx(request, responses);

  tx.respond(SipConstants::RINGING).header("Contact", "<sip:me@h.invalid>").send();

  auto sent = responses->tryReceive();
  ASSERT_TRUE(sent.has_value());
  EXPECT_FALSE(sent->isRequest);
  EXPECT_EQ(sent->statusCode, 180);
  EXPECT_EQ(sent->statusPhrase, "Ringing");
  EXPECT_EQ(sent->getHeaders("Via"), request.getHeaders("Via"));
  EXPECT_EQ(sent->getHeader("From"), request.getHeader("From"));
  EXPECT_EQ(sent->getHeader("To"), request.getHeader("To"));
  EXPECT_EQ(sent->getHeader("CSeq"), request.getHeader("CSeq"));
  EXPECT_EQ(sent->getHeader("Call-ID"), request.getHeader("Call-ID"));
  EXPECT_EQ(sent->getHeader("User-Agent"),
            std::optional<std::string>(SipConstants::USER_AGENT));
  EXPECT_EQ(sent->getHeader("Contact"), std::optional<std::string>("<sip:me@h.invalid>"));
  EXPECT_FALSE(sent->hasHeader("Subject"));
}

TEST(ServerTransactionTest, BareResponseHasOnlyCorrelationHeaders) {
  auto responses = std::make_shared<ServerTransaction::ResponseChannel>(4);
  SipMessage request = makeRequest();
  request.addHeader("Max-Forwards", "70");
  ServerTransaction tx(request, responses);

  tx.respond(SipConstants::ACCEPTED).send();

  auto sent = responses->tryReceive();
  ASSERT_TRUE(sent.has_value());
  std::vector<std::string> names;
  for (const auto &header : sent->headers)
    names.push_back(header.name);
  EXPECT_EQ(names, (std::vector<std::string>{"Via", "From", "To", "CSeq", "Call-ID",
                                             "User-Agent"}));

  // Serialization adds only the framing length
  std::string raw = sent->toString();
  EXPECT_NE(raw.find("\r\nContent-Length: 0\r\n\r\n"), std::string::npos);
  EXPECT_EQ(raw.find("Max-Forwards"), std::string::npos);
}

TEST(ServerTransactionTest, RespondRequiresCorrelationHeaders) {
  auto responses = std::make_shared<ServerTransaction::ResponseChannel>(4);
  SipMessage request = SipMessage::request(SipMethod::OPTIONS, "sip:x");
  request.addHeader("Via", "SIP/2.0/WSS h.invalid;branch=z9hG4bK1");
  ServerTransaction tx(request, responses);

  try {
    tx.respond(SipConstants::ACCEPTED);
    FAIL() << "expected SipError";
  } catch (const SipError &e) {
    EXPECT_EQ(e.kind(), SipErrorKind::MISSING_HEADER);
  }
}

TEST(ServerTransactionTest, SendFailsOnceConnectionIsGone) {
  auto responses = std::make_shared<ServerTransaction::ResponseChannel>(4);
  ServerTransaction tx(makeRequest(), responses);
  responses->close();

  try {
    tx.respond(SipConstants::ACCEPTED).send();
    FAIL() << "expected SipError";
  } catch (const SipError &e) {
    EXPECT_EQ(e.kind(), SipErrorKind::TRANSPORT_CLOSED);
  }
}
