/**
 * @file GatewayApplication.cpp
 * @brief BacLink 게이트웨이 메인 애플리케이션 구현
 * @author BacLink Development Team
 */

#include "Core/GatewayApplication.h"
#include "Engine/BridgeEngine.h"
#include "Logging/LogManager.h"
#include "Publish/MqttMessageBus.h"
#include "Transport/BacnetStackTransport.h"
#include "Utils/ConfigManager.h"

#if HAS_HTTPLIB
#include "Network/ControlApiServer.h"
#endif

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace BacLink {
namespace Core {

namespace {

constexpr const char *kCategory = "engine";

/// 저장 파일의 상위 디렉터리 생성. 실패 시 std::runtime_error
void EnsureStoreDirectory(const std::string &file) {
  const std::filesystem::path parent = std::filesystem::path(file).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("cannot create store directory " +
                             parent.string() + ": " + ec.message());
  }
}

} // namespace

GatewayApplication::GatewayApplication() {
  LogManager::getInstance().Info("GatewayApplication created");
}

GatewayApplication::~GatewayApplication() { Cleanup(); }

// =============================================================================
// 애플리케이션 생명주기
// =============================================================================

void GatewayApplication::Run() {
  auto &logger = LogManager::getInstance();
  logger.Info("BacLink gateway starting...");

  try {
    Initialize();
  } catch (const std::exception &e) {
    logger.log(kCategory, LogLevel::LOG_FATAL, "Startup aborted: {}", e.what());
    Cleanup();
    throw;
  }

  is_running_.store(true);
  logger.Info("BacLink gateway started");

  MainLoop();
  Cleanup();
  logger.Info("BacLink gateway shutdown complete");
}

void GatewayApplication::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_.store(true);
  }
  stop_cv_.notify_all();
}

void GatewayApplication::Initialize() {
  auto &logger = LogManager::getInstance();
  logger.Info("=== SYSTEM INITIALIZATION STARTING ===");

  // 1. 설정
  logger.Info("Step 1/4: Loading configuration...");
  auto &settings = ConfigManager::getInstance();
  const std::string config_dir = settings.getConfigDirectory();
  logger.log("config", LogLevel::INFO, "Config directory: {} ({} files loaded)",
             config_dir.empty() ? "<none>" : config_dir,
             settings.getLoadedFiles().size());
  config_ = GatewayConfig::FromConfigManager(settings);
  config_.Validate();
  logger.log("config", LogLevel::INFO, "Configuration: {}",
             config_.ToJson().dump());

  EnsureStoreDirectory(config_.devices_file);
  EnsureStoreDirectory(config_.mappings_file);

  // 2. BACnet Transport
  logger.Info("Step 2/4: Opening BACnet/IP transport...");
  Transport::BacnetStackOptions transport_options;
  transport_options.device_id = config_.bacnet_device_id;
  transport_options.device_name = config_.bacnet_device_name;
  transport_options.interface_name = config_.bacnet_interface;
  transport_options.port = static_cast<uint16_t>(config_.bacnet_port);
  transport_options.apdu_timeout_ms =
      static_cast<uint16_t>(config_.bacnet_apdu_timeout_ms);
  transport_ = std::make_unique<Transport::BacnetStackTransport>(transport_options);
  transport_->Open();

  // 3. MQTT 버스와 엔진
  logger.Info("Step 3/4: Starting bridge engine...");
  if (config_.mqtt_enabled) {
    Publish::MqttOptions mqtt_options;
    mqtt_options.broker_host = config_.mqtt_broker;
    mqtt_options.broker_port = config_.mqtt_port;
    mqtt_options.client_id = config_.mqtt_client_id;
    mqtt_options.username = config_.mqtt_username;
    mqtt_options.password = config_.mqtt_password;
    mqtt_options.keepalive_seconds = config_.mqtt_keepalive_sec;
    bus_ = std::make_unique<Publish::MqttMessageBus>(mqtt_options);
  }
  engine_ = std::make_unique<Engine::BridgeEngine>(config_, *transport_,
                                                   bus_.get());
  engine_->Start();

  // 4. 제어 API
#if HAS_HTTPLIB
  if (config_.api_enabled) {
    logger.Info("Step 4/4: Starting control API...");
    api_server_ = std::make_unique<Network::ControlApiServer>(
        *engine_, config_.api_host, config_.api_port);
    if (!api_server_->Start()) {
      throw std::runtime_error("control API could not bind " +
                               config_.api_host + ":" +
                               std::to_string(config_.api_port));
    }
  } else {
    logger.Info("Step 4/4: Control API disabled");
  }
#else
  if (config_.api_enabled) {
    logger.log(kCategory, LogLevel::WARN,
               "API_ENABLED is set but this build has no HTTP support");
  }
#endif

  logger.Info("=== SYSTEM INITIALIZATION COMPLETED ===");
}

void GatewayApplication::MainLoop() {
  auto &logger = LogManager::getInstance();
  logger.Info("Main loop started");

  auto last_health_check = std::chrono::steady_clock::now();
  auto last_log_cleanup = std::chrono::steady_clock::now();
  const auto health_check_interval = std::chrono::minutes(5);
  const int retention_days =
      ConfigManager::getInstance().getInt("LOG_RETENTION_DAYS", 30);

  while (!stop_requested_.load()) {
    try {
      auto now = std::chrono::steady_clock::now();
      if (now - last_health_check >= health_check_interval) {
        LogHealth();
        last_health_check = now;
      }
      if (now - last_log_cleanup >= std::chrono::hours(24)) {
        const size_t removed = logger.cleanupOldLogs(retention_days);
        if (removed > 0) {
          logger.log(kCategory, LogLevel::INFO,
                     "Removed {} log files older than {} days", removed,
                     retention_days);
        }
        last_log_cleanup = now;
      }
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Exception in main loop: {}",
                 e.what());
    }

    std::unique_lock<std::mutex> lock(stop_mutex_);
    if (stop_cv_.wait_for(lock, std::chrono::seconds(30),
                          [this]() { return stop_requested_.load(); })) {
      logger.Info("Main loop exiting due to shutdown signal");
      break;
    }
  }

  logger.Info("Main loop ended");
}

void GatewayApplication::LogHealth() {
  if (!engine_) {
    return;
  }
  const auto status = engine_->Status();
  LogManager::getInstance().log(
      kCategory, LogLevel::INFO,
      "Health: devices={} enabled={} objects={} poll_cycles={} registration={}",
      status["devices"]["total"].get<size_t>(),
      status["devices"]["enabled"].get<size_t>(),
      status["devices"]["objects"].get<size_t>(),
      status["polling"]["cycles"].get<uint64_t>(),
      status["registration"]["state"].get<std::string>());
}

void GatewayApplication::Cleanup() {
  auto &logger = LogManager::getInstance();
  is_running_.store(false);

#if HAS_HTTPLIB
  if (api_server_) {
    api_server_->Stop();
    api_server_.reset();
  }
#endif

  // 엔진이 Transport 와 버스를 참조하므로 먼저 해제
  if (engine_) {
    engine_->Stop();
    engine_.reset();
  }
  bus_.reset();
  if (transport_) {
    transport_->Close();
    transport_.reset();
  }

  logger.flushAll();
}

} // namespace Core
} // namespace BacLink
