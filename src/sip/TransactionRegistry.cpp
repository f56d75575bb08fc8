#include "TransactionRegistry.h"
#include "../app/Logger.h"
#include <vector>

void TransactionRegistry::addTransaction(
    const TransactionKey &key, std::shared_ptr<ResponseChannel> channel) {
  std::shared_ptr<ResponseChannel> displaced;
  bool added = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      auto &slot = transactions_[key];
      displaced = std::move(slot);
      slot = channel;
      added = true;
    }
  }

  if (added) {
    if (displaced && displaced != channel) {
      // The old owner can no longer be reached by route() or closeAll()
      LOG_WARN("Duplicate transaction key, replacing previous entry: "
               << key.toString());
      displaced->close();
    }
    LOG_DEBUG("Registered transaction " << key.toString());
    return;
  }

  LOG_WARN("Transaction " << key.toString()
                          << " registered after connection shutdown");
  channel->close();
}

bool TransactionRegistry::route(const SipMessage &response) {
  auto key = TransactionKey::fromResponse(response);

  std::shared_ptr<ResponseChannel> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(key);
    if (it != transactions_.end()) {
      channel = it->second;
      if (!response.isProvisional())
        transactions_.erase(it);
    }
  }

  if (!channel) {
    LOG_WARN("Received response without matching transaction: "
             << response.statusCode << " " << response.statusPhrase << " ["
             << key.toString() << "]");
    return false;
  }

  // Outside the lock: this may block until the transaction catches up.
  if (!channel->send(response)) {
    LOG_WARN("Transaction " << key.toString()
                            << " was abandoned, dropping response "
                            << response.statusCode);
    return false;
  }

  LOG_DEBUG("Routed response " << response.statusCode << " to transaction "
                               << key.toString());
  return true;
}

void TransactionRegistry::removeTransaction(const TransactionKey &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  transactions_.erase(key);
}

void TransactionRegistry::removeTransaction(
    const TransactionKey &key, const std::shared_ptr<ResponseChannel> &owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(key);
  if (it != transactions_.end() && it->second == owner) {
    transactions_.erase(it);
    LOG_DEBUG("Deregistered transaction " << key.toString());
  }
}

void TransactionRegistry::closeAll() {
  std::vector<std::shared_ptr<ResponseChannel>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (auto &entry : transactions_) {
      pending.push_back(entry.second);
    }
    transactions_.clear();
  }

  for (auto &channel : pending) {
    channel->close();
  }
}

bool TransactionRegistry::contains(const TransactionKey &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return transactions_.find(key) != transactions_.end();
}

bool TransactionRegistry::isClosed() {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t TransactionRegistry::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return transactions_.size();
}
