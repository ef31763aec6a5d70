/**
 * @file RegistrationManager.cpp
 * @brief BBMD 등록 유지 구현
 * @author BacLink Development Team
 */

#include "Registration/RegistrationManager.h"
#include "Common/TimeUtils.h"
#include "Logging/LogManager.h"

#include <algorithm>

namespace BacLink {
namespace Registration {

namespace {
constexpr const char *kCategory = "registration";
}

const char *RegistrationStateToString(RegistrationState state) {
  switch (state) {
  case RegistrationState::UNREGISTERED:
    return "UNREGISTERED";
  case RegistrationState::REGISTERING:
    return "REGISTERING";
  case RegistrationState::REGISTERED:
    return "REGISTERED";
  case RegistrationState::UNREGISTERING:
    return "UNREGISTERING";
  }
  return "UNKNOWN";
}

RegistrationManager::RegistrationManager(
    RegistrationOptions options, StrategyList strategies,
    std::chrono::milliseconds minimum_renewal)
    : options_(std::move(options)), strategies_(std::move(strategies)),
      minimum_renewal_(minimum_renewal) {}

RegistrationManager::~RegistrationManager() { Stop(); }

StrategyList RegistrationManager::DefaultStrategies(Transport::ITransport &transport) {
  StrategyList strategies;
  strategies.push_back(std::make_unique<HighLevelRegistrationStrategy>(transport));
  strategies.push_back(std::make_unique<BvllRegistrationStrategy>(transport));
  strategies.push_back(std::make_unique<RawDatagramRegistrationStrategy>());
  return strategies;
}

std::chrono::milliseconds
RegistrationManager::RenewalInterval(uint16_t ttl_seconds,
                                     std::chrono::milliseconds minimum) {
  return std::max<std::chrono::milliseconds>(
      std::chrono::seconds(ttl_seconds / 2), minimum);
}

// =============================================================================
// 수명 주기
// =============================================================================

bool RegistrationManager::Start() {
  auto &logger = LogManager::getInstance();

  if (!options_.enabled) {
    logger.log(kCategory, LogLevel::INFO, "Foreign device registration disabled");
    return false;
  }
  if (options_.relay.host.empty()) {
    logger.log(kCategory, LogLevel::LOG_ERROR,
               "Registration enabled but no relay address configured");
    return false;
  }

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  logger.log(kCategory, LogLevel::INFO,
             "Registering as foreign device with {} (TTL {}s)",
             options_.relay.ToString(), options_.ttl_seconds);

  state_ = RegistrationState::REGISTERING;
  auto strategy = Attempt(options_.ttl_seconds);
  if (!strategy) {
    state_ = RegistrationState::UNREGISTERED;
    logger.log(kCategory, LogLevel::LOG_ERROR,
               "All registration strategies failed for {}, continuing without "
               "relay",
               options_.relay.ToString());
    return false;
  }

  state_ = RegistrationState::REGISTERED;
  logger.log(kCategory, LogLevel::INFO, "Registered with {} via {}",
             options_.relay.ToString(), *strategy);
  StartRenewalLocked();
  return true;
}

void RegistrationManager::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
  if (renewal_thread_.joinable()) {
    renewal_thread_.join();
  }

  if (state_.load() != RegistrationState::REGISTERED) {
    return;
  }

  auto &logger = LogManager::getInstance();
  state_ = RegistrationState::UNREGISTERING;
  logger.log(kCategory, LogLevel::INFO, "Unregistering from {}",
             options_.relay.ToString());
  if (!Attempt(0)) {
    logger.log(kCategory, LogLevel::DEBUG, "Unregistration from {} not confirmed",
               options_.relay.ToString());
  }
  state_ = RegistrationState::UNREGISTERED;
}

bool RegistrationManager::TriggerRegistration() {
  auto &logger = LogManager::getInstance();
  if (!options_.enabled || options_.relay.host.empty()) {
    logger.log(kCategory, LogLevel::WARN,
               "Registration requested but registration is not configured");
    return false;
  }

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  const bool was_registered = state_.load() == RegistrationState::REGISTERED;
  if (!was_registered) {
    state_ = RegistrationState::REGISTERING;
  }

  auto strategy = Attempt(options_.ttl_seconds);
  if (!strategy) {
    if (!was_registered) {
      state_ = RegistrationState::UNREGISTERED;
    }
    logger.log(kCategory, LogLevel::LOG_ERROR, "Manual registration with {} failed",
               options_.relay.ToString());
    return false;
  }

  state_ = RegistrationState::REGISTERED;
  logger.log(kCategory, LogLevel::INFO, "Registered with {} via {}",
             options_.relay.ToString(), *strategy);
  if (!renewal_thread_.joinable()) {
    StartRenewalLocked();
  }
  return true;
}

// =============================================================================
// 내부
// =============================================================================

std::optional<std::string> RegistrationManager::Attempt(uint16_t ttl_seconds) {
  auto &logger = LogManager::getInstance();
  std::lock_guard<std::mutex> lock(attempt_mutex_);

  for (const auto &strategy : strategies_) {
    bool ok = false;
    try {
      ok = strategy->Register(options_.relay, ttl_seconds);
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::DEBUG, "Strategy {} threw: {}",
                 strategy->Name(), e.what());
    }

    if (ok) {
      std::lock_guard<std::mutex> status_lock(status_mutex_);
      last_strategy_ = strategy->Name();
      last_success_ = TimeUtils::NowIsoString();
      return strategy->Name();
    }
    logger.log(kCategory, LogLevel::DEBUG, "Strategy {} failed",
               strategy->Name());
  }

  std::lock_guard<std::mutex> status_lock(status_mutex_);
  ++failures_;
  return std::nullopt;
}

void RegistrationManager::StartRenewalLocked() {
  if (renewal_thread_.joinable()) {
    renewal_thread_.join();
  }
  stop_requested_ = false;
  renewal_thread_ = std::thread(&RegistrationManager::RenewalLoop, this);
}

void RegistrationManager::RenewalLoop() {
  auto &logger = LogManager::getInstance();
  const auto interval = RenewalInterval(options_.ttl_seconds, minimum_renewal_);
  logger.log(kCategory, LogLevel::INFO, "Renewing registration every {} ms",
             interval.count());

  while (true) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      if (wait_cv_.wait_for(lock, interval,
                            [this] { return stop_requested_.load(); })) {
        break;
      }
    }

    try {
      auto strategy = Attempt(options_.ttl_seconds);
      if (strategy) {
        std::lock_guard<std::mutex> status_lock(status_mutex_);
        ++renewals_;
        logger.log(kCategory, LogLevel::DEBUG, "Re-registered via {} (TTL {}s)",
                   *strategy, options_.ttl_seconds);
      } else {
        logger.log(kCategory, LogLevel::WARN,
                   "Registration renewal with {} failed, retrying in {} ms",
                   options_.relay.ToString(), interval.count());
      }
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Registration renewal error: {}",
                 e.what());
    }
  }

  logger.log(kCategory, LogLevel::INFO, "Registration renewal stopped");
}

nlohmann::json RegistrationManager::GetStatusJson() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  nlohmann::json status = {
      {"enabled", options_.enabled},
      {"state", RegistrationStateToString(state_.load())},
      {"registered", state_.load() == RegistrationState::REGISTERED},
      {"relay", options_.relay.host.empty() ? nlohmann::json(nullptr)
                                            : nlohmann::json(options_.relay.ToString())},
      {"ttl", options_.ttl_seconds},
      {"renewal_interval",
       std::chrono::duration_cast<std::chrono::seconds>(
           RenewalInterval(options_.ttl_seconds, minimum_renewal_))
           .count()},
      {"renewals", renewals_},
      {"failures", failures_}};
  status["last_strategy"] =
      last_strategy_.empty() ? nlohmann::json(nullptr) : nlohmann::json(last_strategy_);
  status["last_success"] =
      last_success_.empty() ? nlohmann::json(nullptr) : nlohmann::json(last_success_);
  return status;
}

} // namespace Registration
} // namespace BacLink
