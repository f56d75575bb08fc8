#include "Slot.h"
#include "../sip/SipConstants.h"
#include <algorithm>

std::optional<Slot> findSlot(const std::vector<Slot> &slots,
                             const std::string &deviceType) {
  auto it = std::find_if(slots.begin(), slots.end(), [&](const Slot &slot) {
    return slot.deviceType == deviceType;
  });
  if (it == slots.end())
    return std::nullopt;
  return *it;
}

std::string sipSocketUrl(const std::string &host, const Slot &slot) {
  return "wss://" + host + ":" + std::to_string(slot.sipPort) +
         SipConstants::WS_PATH;
}
