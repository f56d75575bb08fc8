#pragma once

#include "../sip/Connection.h"
#include "../slot/Slot.h"
#include "CallNotifier.h"
#include <memory>
#include <string>

class NotifyApp {
public:
  bool init(const std::string &configPath);
  // Returns the process exit status
  int run();

private:
  std::string url_;
  Slot slot_;
  ConnectionOptions options_;

  std::unique_ptr<Connection> connection_;
  std::shared_ptr<InboundQueue> inbound_;
  CallNotifier notifier_;
};
