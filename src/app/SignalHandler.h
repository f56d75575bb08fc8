#pragma once

#include <atomic>

class SignalHandler {
public:
  static void init();
  static bool shouldExit();
  static void setExit();
  // Last signal received, 0 if none
  static int lastSignal();

private:
  static void handleSignal(int signum);
  static std::atomic<bool> exitFlag_;
  static std::atomic<int> lastSignal_;
};
