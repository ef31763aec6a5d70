/**
 * @file main.cpp
 * @brief BacLink 게이트웨이 진입점
 * @author BacLink Development Team
 */

#include "Core/GatewayApplication.h"
#include "Logging/LogManager.h"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using BacLink::Core::GatewayApplication;

std::unique_ptr<GatewayApplication> g_app;

void SignalHandler(int signal_num) {
  (void)signal_num;
  if (g_app) {
    g_app->Stop();
  }
}

int main(int argc, char *argv[]) {
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--config=") == 0) {
        // ConfigManager 첫 사용 전에 설정해야 한다
        setenv("BACLINK_CONFIG_DIR", arg.substr(9).c_str(), 1);
      } else if (arg == "--help" || arg == "-h") {
        std::cout << "Usage: " << argv[0] << " [--config=<dir>]" << std::endl;
        std::cout << "  <dir>/.env 에서 설정을 읽는다 (기본: ./config)"
                  << std::endl;
        return 0;
      } else {
        std::cerr << "Unknown argument: " << arg << std::endl;
        return 2;
      }
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    g_app = std::make_unique<GatewayApplication>();
    g_app->Run();
    g_app.reset();
    return 0;

  } catch (const std::exception &e) {
    LogManager::getInstance().log("engine", LogLevel::LOG_FATAL,
                                  "Fatal error: {}", e.what());
    std::cerr << "Fatal error: " << e.what() << std::endl;
    g_app.reset();
    return 1;
  }
}
