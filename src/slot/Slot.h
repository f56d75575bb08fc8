#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One provisioned device of the account. Only the webrtc one speaks SIP
// over WebSocket.
struct Slot {
  std::string id;
  std::string name;
  std::string userId;
  std::string deviceType;
  std::string deviceId;
  std::string sipHost;
  uint16_t sipPort = 0;
  std::string sipUser;
  std::string sipPassword;
};

// First slot whose device type matches
std::optional<Slot> findSlot(const std::vector<Slot> &slots,
                             const std::string &deviceType);

// wss://{host}:{slot.sipPort}/sipsockets/
std::string sipSocketUrl(const std::string &host, const Slot &slot);
