#include "sip/TransactionRegistry.h"
#include <gtest/gtest.h>

namespace {

SipMessage response(int code, const std::string &branch = "z9hG4bKreg") {
  SipMessage msg = SipMessage::response(code);
  msg.addHeader("Via", "SIP/2.0/WSS h.invalid;branch=" + branch);
  msg.addHeader("Call-ID", "call-1");
  msg.addHeader("CSeq", "1 REGISTER");
  return msg;
}

TransactionKey keyFor(const std::string &branch = "z9hG4bKreg") {
  return TransactionKey::fromResponse(response(200, branch));
}

using ResponseChannel = TransactionRegistry::ResponseChannel;

} // namespace

TEST(TransactionRegistryTest, RoutesToMatchingTransaction) {
  TransactionRegistry registry;
  auto channel = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor(), channel);

  EXPECT_TRUE(registry.route(response(100)));
  EXPECT_TRUE(registry.contains(keyFor()));

  EXPECT_TRUE(registry.route(response(200)));
  EXPECT_FALSE(registry.contains(keyFor()));

  EXPECT_EQ(channel->tryReceive()->statusCode, 100);
  EXPECT_EQ(channel->tryReceive()->statusCode, 200);
}

TEST(TransactionRegistryTest, DropsUnmatchedResponse) {
  TransactionRegistry registry;
  auto channel = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor("z9hG4bKmine"), channel);

  EXPECT_FALSE(registry.route(response(200, "z9hG4bKother")));
  EXPECT_EQ(channel->size(), 0u);
  EXPECT_EQ(registry.count(), 1u);
}

TEST(TransactionRegistryTest, DropsResponseForAbandonedChannel) {
  TransactionRegistry registry;
  auto channel = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor(), channel);
  channel->close();

  EXPECT_FALSE(registry.route(response(180)));
}

TEST(TransactionRegistryTest, DuplicateKeyReplacesEntry) {
  TransactionRegistry registry;
  auto first = std::make_shared<ResponseChannel>(4);
  auto second = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor(), first);
  registry.addTransaction(keyFor(), second);

  EXPECT_EQ(registry.count(), 1u);
  EXPECT_TRUE(registry.route(response(200)));
  EXPECT_EQ(first->size(), 0u);
  EXPECT_EQ(second->size(), 1u);
  EXPECT_TRUE(first->isClosed());
  EXPECT_FALSE(second->isClosed());
}

TEST(TransactionRegistryTest, RemoveChecksOwner) {
  TransactionRegistry registry;
  auto owner = std::make_shared<ResponseChannel>(4);
  auto stranger = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor(), owner);

  registry.removeTransaction(keyFor(), stranger);
  EXPECT_TRUE(registry.contains(keyFor()));

  registry.removeTransaction(keyFor(), owner);
  EXPECT_FALSE(registry.contains(keyFor()));
}

TEST(TransactionRegistryTest, CloseAllClosesPendingAndLateChannels) {
  TransactionRegistry registry;
  auto pending = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor(), pending);

  registry.closeAll();
  EXPECT_TRUE(registry.isClosed());
  EXPECT_TRUE(pending->isClosed());
  EXPECT_EQ(registry.count(), 0u);

  auto late = std::make_shared<ResponseChannel>(4);
  registry.addTransaction(keyFor("z9hG4bKlate"), late);
  EXPECT_TRUE(late->isClosed());
  EXPECT_EQ(registry.count(), 0u);
}
