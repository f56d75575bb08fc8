#include "app/NotifyApp.h"
#include "app/SignalHandler.h"
#include <iostream>

int main(int argc, char *argv[]) {
  SignalHandler::init();

  std::string configPath = "../config/sipsocket.yaml";
  if (argc > 1) {
    std::string arg = argv[1];
    if (arg == "--config" && argc > 2) {
      configPath = argv[2];
    }
  }

  NotifyApp app;
  if (!app.init(configPath)) {
    std::cerr << "Failed to initialize sipsocket-notify" << std::endl;
    return 1;
  }

  return app.run();
}
