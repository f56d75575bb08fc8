#pragma once

#include "../sip/ServerTransaction.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Answers what the server sends a registered webrtc device: keepalive
// OPTIONS, ringing INVITEs and their CANCELs. Calls are never picked up,
// only announced.
class CallNotifier {
public:
  struct RingingCall {
    std::string caller;
    std::string callId;
  };

  // Answers one inbound transaction. Throws SipError from the response
  // path (TRANSPORT_CLOSED, MISSING_HEADER).
  void handle(const ServerTransaction &tx);

  // Calls ringing right now, keyed by the INVITE's CSeq number
  std::map<uint32_t, RingingCall> ringingCalls() const;
  std::optional<RingingCall> ringingCall(uint32_t seq) const;

private:
  void onOptions(const ServerTransaction &tx);
  void onInvite(const ServerTransaction &tx);
  void onCancel(const ServerTransaction &tx);

  uint32_t sequenceOf(const ServerTransaction &tx) const;

  mutable std::mutex mutex_;
  std::map<uint32_t, RingingCall> ringing_;
};
