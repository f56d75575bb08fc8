#include "CallNotifier.h"
#include "../sip/SipConstants.h"
#include "../sip/SipError.h"
#include "Logger.h"

void CallNotifier::handle(const ServerTransaction &tx) {
  const SipMessage &request = tx.request();

  switch (request.method) {
  case SipMethod::OPTIONS:
    onOptions(tx);
    break;
  case SipMethod::INVITE:
    onInvite(tx);
    break;
  case SipMethod::CANCEL:
    onCancel(tx);
    break;
  default:
    LOG_INFO("Ignoring " << request.methodStr << " request");
    break;
  }
}

void CallNotifier::onOptions(const ServerTransaction &tx) {
  LOG_DEBUG("Answering OPTIONS keepalive");
  tx.respond(SipConstants::ACCEPTED).send();
}

void CallNotifier::onInvite(const ServerTransaction &tx) {
  uint32_t seq = sequenceOf(tx);

  tx.respond(SipConstants::TRYING).send();
  tx.respond(SipConstants::RINGING).send();

  RingingCall call;
  call.caller = tx.request().getFromDisplayName();
  if (call.caller.empty())
    call.caller = "Unknown";
  call.callId = tx.request().getCallId().value_or("");

  LOG_INFO("Incoming call from " << call.caller << " (" << seq << ")");

  std::lock_guard<std::mutex> lock(mutex_);
  ringing_[seq] = std::move(call);
}

void CallNotifier::onCancel(const ServerTransaction &tx) {
  uint32_t seq = sequenceOf(tx);

  tx.respond(SipConstants::ACCEPTED).send();

  std::optional<RingingCall> call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ringing_.find(seq);
    if (it != ringing_.end()) {
      call = std::move(it->second);
      ringing_.erase(it);
    }
  }

  if (call) {
    LOG_INFO("Call from " << call->caller << " cancelled (" << seq << ")");
  } else {
    LOG_WARN("CANCEL for unknown call (" << seq << ")");
  }
}

uint32_t CallNotifier::sequenceOf(const ServerTransaction &tx) const {
  auto cseq = tx.request().getCSeq();
  if (!cseq) {
    throw SipError(SipErrorKind::MALFORMED_MESSAGE,
                   "Invalid CSeq in " + tx.request().methodStr + " request");
  }
  return cseq->seq;
}

std::map<uint32_t, CallNotifier::RingingCall> CallNotifier::ringingCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ringing_;
}

std::optional<CallNotifier::RingingCall> CallNotifier::ringingCall(uint32_t seq) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = ringing_.find(seq);
  if (it == ringing_.end())
    return std::nullopt;
  return it->second;
}
