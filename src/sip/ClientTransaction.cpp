#include "ClientTransaction.h"
#include "../app/Logger.h"
#include "SipError.h"

ClientTransaction::ClientTransaction(SipMessage request,
                                     std::shared_ptr<ResponseChannel> responses,
                                     std::weak_ptr<TransactionRegistry> registry)
    : request_(std::move(request)),
      key_(TransactionKey::fromRequest(request_)),
      responses_(std::move(responses)),
      registry_(std::move(registry)) {}

ClientTransaction::~ClientTransaction() { release(); }

ClientTransaction::ClientTransaction(ClientTransaction &&other) noexcept
    : request_(std::move(other.request_)),
      key_(std::move(other.key_)),
      responses_(std::move(other.responses_)),
      registry_(std::move(other.registry_)) {
  other.responses_.reset();
}

ClientTransaction &ClientTransaction::operator=(ClientTransaction &&other) noexcept {
  if (this != &other) {
    release();
    request_ = std::move(other.request_);
    key_ = std::move(other.key_);
    responses_ = std::move(other.responses_);
    registry_ = std::move(other.registry_);
    other.responses_.reset();
  }
  return *this;
}

SipMessage ClientTransaction::receive() {
  while (responses_) {
    auto response = responses_->receive();
    if (!response)
      break;

    if (response->isProvisional()) {
      LOG_DEBUG("Transaction " << key_.toString() << " got provisional "
                               << response->statusCode);
      continue;
    }

    // Only one final response per transaction; later calls fail fast
    release();
    return std::move(*response);
  }

  throw SipError(SipErrorKind::TRANSACTION_CLOSED,
                 "Transaction closed without response");
}

void ClientTransaction::release() {
  if (!responses_)
    return;

  // The connection may already be gone; then there is nothing to undo.
  if (auto registry = registry_.lock()) {
    registry->removeTransaction(key_, responses_);
  }

  // Unblocks the multiplexer if it is waiting to deliver to us
  responses_->close();
  responses_.reset();
}
