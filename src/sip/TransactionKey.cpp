#include "TransactionKey.h"
#include <functional>

TransactionKey TransactionKey::fromRequest(const SipMessage &request) {
  TransactionKey key;
  key.method = request.methodStr;
  key.callId = request.getCallId();
  key.branch = request.getBranch();
  return key;
}

TransactionKey TransactionKey::fromResponse(const SipMessage &response) {
  TransactionKey key;
  auto cseq = response.getCSeq();
  key.method = cseq ? cseq->method : "";
  key.callId = response.getCallId();
  key.branch = response.getBranch();
  return key;
}

std::string TransactionKey::toString() const {
  return method + ":" + callId.value_or("-") + ":" + branch.value_or("-");
}

size_t TransactionKeyHash::operator()(const TransactionKey &key) const {
  std::hash<std::string> hasher;
  size_t seed = hasher(key.method);
  auto combine = [&seed, &hasher](const std::optional<std::string> &part) {
    size_t h = part ? hasher(*part) : 0x9e3779b9;
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  };
  combine(key.callId);
  combine(key.branch);
  return seed;
}
