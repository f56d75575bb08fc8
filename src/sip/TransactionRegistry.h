#pragma once

#include "../util/Channel.h"
#include "SipMessage.h"
#include "TransactionKey.h"
#include <memory>
#include <mutex>
#include <unordered_map>

// Pending client transactions, keyed by TransactionKey. Shared between
// Connection::send (add), the multiplexer (route, closeAll) and
// ClientTransaction teardown (remove).
class TransactionRegistry {
public:
  using ResponseChannel = Channel<SipMessage>;

  // A colliding key replaces the previous entry and closes its channel.
  void addTransaction(const TransactionKey &key,
                      std::shared_ptr<ResponseChannel> channel);

  // Hands the response to the matching transaction. Final responses also
  // retire the entry. Returns false for unmatched responses.
  bool route(const SipMessage &response);

  void removeTransaction(const TransactionKey &key);
  // Removes the entry only while it still belongs to owner.
  void removeTransaction(const TransactionKey &key,
                         const std::shared_ptr<ResponseChannel> &owner);

  // Closes every pending channel; later additions are closed immediately.
  void closeAll();

  bool contains(const TransactionKey &key);
  bool isClosed();
  size_t count();

private:
  std::unordered_map<TransactionKey, std::shared_ptr<ResponseChannel>,
                     TransactionKeyHash>
      transactions_;
  bool closed_ = false;
  std::mutex mutex_;
};
