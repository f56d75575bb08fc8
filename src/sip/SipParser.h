#pragma once

#include "SipMessage.h"
#include <optional>
#include <string_view>

class SipParser {
public:
  // Parses one complete SIP message (one WebSocket text frame).
  // Returns std::nullopt when the start line or framing is unusable.
  static std::optional<SipMessage> parse(std::string_view raw);
};
