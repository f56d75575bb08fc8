#pragma once

#include "SipMessage.h"
#include "TransactionKey.h"
#include "TransactionRegistry.h"
#include <memory>

// A request we sent, waiting for its final response. Destroying the handle
// is how a caller abandons the transaction: the registry entry goes away
// and any late response is treated as unmatched.
class ClientTransaction {
public:
  using ResponseChannel = TransactionRegistry::ResponseChannel;

  ClientTransaction(SipMessage request, std::shared_ptr<ResponseChannel> responses,
                    std::weak_ptr<TransactionRegistry> registry);
  ~ClientTransaction();

  ClientTransaction(ClientTransaction &&other) noexcept;
  ClientTransaction &operator=(ClientTransaction &&other) noexcept;
  ClientTransaction(const ClientTransaction &) = delete;
  ClientTransaction &operator=(const ClientTransaction &) = delete;

  // Skips 1xx responses and returns the first final one. Throws
  // SipError(TRANSACTION_CLOSED) if the connection ends first, and on any
  // call after the final response was returned.
  SipMessage receive();

  const SipMessage &request() const { return request_; }
  const TransactionKey &key() const { return key_; }

private:
  void release();

  SipMessage request_;
  TransactionKey key_;
  std::shared_ptr<ResponseChannel> responses_;
  std::weak_ptr<TransactionRegistry> registry_;
};
