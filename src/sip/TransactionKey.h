#pragma once

#include "SipMessage.h"
#include <cstddef>
#include <optional>
#include <string>

// Correlates a response with the request that started its transaction:
// method + Call-ID + topmost Via branch. For responses the method comes
// from CSeq, since a status line carries none.
struct TransactionKey {
  std::string method;
  std::optional<std::string> callId;
  std::optional<std::string> branch;

  static TransactionKey fromRequest(const SipMessage &request);
  static TransactionKey fromResponse(const SipMessage &response);

  bool operator==(const TransactionKey &other) const {
    return method == other.method && callId == other.callId &&
           branch == other.branch;
  }
  bool operator!=(const TransactionKey &other) const { return !(*this == other); }

  std::string toString() const;
};

struct TransactionKeyHash {
  size_t operator()(const TransactionKey &key) const;
};
