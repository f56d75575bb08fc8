#pragma once

#include "../slot/Slot.h"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

class Config {
public:
  static Config &instance();
  bool load(const std::string &path);

  // Explicit server_host wins over the slot's own SIP host
  std::string getEffectiveHost(const Slot &slot) const {
    return serverHost.empty() ? slot.sipHost : serverHost;
  }

  std::string serverHost;
  std::string deviceType = "webrtc";
  std::string logLevel = "INFO";
  int pollIntervalMs = 50;
  size_t outboundQueueDepth = 8;
  size_t transactionQueueDepth = 8;
  unsigned registerExpires = 6000;
  bool tlsVerify = true;
  std::string tlsCaFile;

  std::vector<Slot> slots;
};
