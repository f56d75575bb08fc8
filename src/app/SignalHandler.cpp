#include "SignalHandler.h"
#include <csignal>

std::atomic<bool> SignalHandler::exitFlag_(false);
std::atomic<int> SignalHandler::lastSignal_(0);

void SignalHandler::init() {
  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);
}

bool SignalHandler::shouldExit() { return exitFlag_; }

int SignalHandler::lastSignal() { return lastSignal_; }

// Only lock-free atomics in here; the app logs once it sees the flag.
void SignalHandler::handleSignal(int signum) {
  lastSignal_ = signum;
  setExit();
}

void SignalHandler::setExit() {
  exitFlag_ = true;
}
