#include "Config.h"
#include "Logger.h"

Config &Config::instance() {
  static Config instance;
  return instance;
}

bool Config::load(const std::string &path) {
  try {
    YAML::Node config = YAML::LoadFile(path);

    serverHost = config["server_host"].as<std::string>("");
    deviceType = config["device_type"].as<std::string>("webrtc");
    logLevel = config["log_level"].as<std::string>("INFO");
    pollIntervalMs = config["poll_interval_ms"].as<int>(50);
    outboundQueueDepth = config["outbound_queue_depth"].as<size_t>(8);
    transactionQueueDepth = config["transaction_queue_depth"].as<size_t>(8);
    registerExpires = config["register_expires"].as<unsigned>(6000);
    tlsVerify = config["tls_verify"].as<bool>(true);
    tlsCaFile = config["tls_ca_file"].as<std::string>("");

    slots.clear();
    if (config["slots"]) {
      for (const auto &node : config["slots"]) {
        Slot slot;
        slot.id = node["id"].as<std::string>("");
        slot.name = node["name"].as<std::string>("");
        slot.userId = node["user_id"].as<std::string>("");
        slot.deviceType = node["device_type"].as<std::string>("");
        slot.deviceId = node["device_id"].as<std::string>("");
        slot.sipHost = node["sip_host"].as<std::string>("");
        slot.sipPort = node["sip_port"].as<uint16_t>(443);
        slot.sipUser = node["sip_user"].as<std::string>("");
        slot.sipPassword = node["sip_password"].as<std::string>("");
        slots.push_back(std::move(slot));
      }
    }

    if (pollIntervalMs <= 0) {
      LOG_ERROR("poll_interval_ms must be positive");
      return false;
    }

    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load config: " << e.what());
    return false;
  }
}
