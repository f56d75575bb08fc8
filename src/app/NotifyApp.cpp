#include "NotifyApp.h"
#include "../sip/SipError.h"
#include "Config.h"
#include "Logger.h"
#include "SignalHandler.h"
#include <tuple>

bool NotifyApp::init(const std::string &configPath) {
  if (!Config::instance().load(configPath))
    return false;

  auto &config = Config::instance();

  Logger::instance().setLevel(Logger::parseLevel(config.logLevel));

  auto slot = findSlot(config.slots, config.deviceType);
  if (!slot) {
    LOG_ERROR("No slot with device type '" << config.deviceType << "' configured");
    return false;
  }
  slot_ = *slot;

  std::string host = config.getEffectiveHost(slot_);
  if (host.empty()) {
    LOG_ERROR("Slot '" << slot_.name << "' has no SIP host and server_host is not set");
    return false;
  }
  url_ = sipSocketUrl(host, slot_);

  options_.pollInterval = std::chrono::milliseconds(config.pollIntervalMs);
  options_.outboundQueueDepth = config.outboundQueueDepth;
  options_.transactionQueueDepth = config.transactionQueueDepth;
  options_.registerExpires = config.registerExpires;
  options_.tls.verifyPeer = config.tlsVerify;
  options_.tls.caFile = config.tlsCaFile;

  LOG_INFO("Using slot '" << slot_.name << "' (" << slot_.id << ") at " << url_);
  return true;
}

int NotifyApp::run() {
  try {
    std::tie(connection_, inbound_) =
        Connection::connect(url_, slot_.sipUser, options_);
    connection_->registerUser(slot_.sipUser, slot_.sipPassword);
  } catch (const SipError &e) {
    LOG_ERROR("Startup failed: " << e.what());
    return 1;
  }

  LOG_INFO("Waiting for calls. Press Ctrl+C to exit.");

  int status = 0;
  while (!SignalHandler::shouldExit()) {
    auto tx = inbound_->receiveFor(std::chrono::milliseconds(200));
    if (!tx) {
      if (inbound_->isClosed()) {
        LOG_ERROR("Client closed connection");
        status = 1;
        break;
      }
      continue;
    }

    try {
      notifier_.handle(*tx);
    } catch (const SipError &e) {
      if (e.kind() == SipErrorKind::TRANSPORT_CLOSED) {
        LOG_ERROR("Client closed connection");
        status = 1;
        break;
      }
      LOG_WARN("Failed to answer " << tx->request().methodStr << ": " << e.what());
    }
  }

  if (SignalHandler::shouldExit()) {
    LOG_INFO("Received signal " << SignalHandler::lastSignal() << ", shutting down...");
  }

  connection_->close();
  return status;
}
