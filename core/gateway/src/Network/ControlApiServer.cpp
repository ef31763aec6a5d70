/**
 * @file ControlApiServer.cpp
 * @brief cpp-httplib 기반 제어 API 서버 구현
 * @author BacLink Development Team
 */

#include "Network/ControlApiServer.h"
#include "Logging/LogManager.h"

#include <httplib.h>

#include <utility>

namespace BacLink {
namespace Network {

namespace {

constexpr const char *kCategory = "api";

// 장치 ID / 객체 타입 / 인스턴스 경로 조각
constexpr const char *kDevicePath = R"(/api/devices/([^/]+))";
constexpr const char *kObjectPath =
    R"(/api/devices/([^/]+)/objects/([^/]+)/([^/]+))";
constexpr const char *kMappingPath = R"(/api/mappings/([^/]+)/([^/]+)/([^/]+))";

} // namespace

ControlApiServer::ControlApiServer(Engine::BridgeEngine &engine,
                                   std::string host, int port)
    : api_(engine), host_(std::move(host)), port_(port),
      server_(std::make_unique<httplib::Server>()) {
  SetupRoutes();
}

ControlApiServer::~ControlApiServer() { Stop(); }

// =============================================================================
// 서버 생명주기
// =============================================================================

bool ControlApiServer::Start() {
  auto &logger = LogManager::getInstance();
  if (running_.load()) {
    return true;
  }

  if (!server_->bind_to_port(host_, port_)) {
    logger.log(kCategory, LogLevel::LOG_ERROR,
               "Control API could not bind {}:{}", host_, port_);
    return false;
  }

  running_ = true;
  server_thread_ = std::thread([this]() {
    LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                  "Control API listening on http://{}:{}",
                                  host_, port_);
    if (!server_->listen_after_bind()) {
      LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                    "Control API listener exited");
    }
  });
  return true;
}

void ControlApiServer::Stop() {
  if (!running_.load()) {
    return;
  }
  running_ = false;

  server_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                "Control API stopped");
}

// =============================================================================
// 라우트 설정
// =============================================================================

void ControlApiServer::SetupRoutes() {
  server_->set_pre_routing_handler(
      [](const httplib::Request &, httplib::Response &res) {
        SetCorsHeaders(res);
        return httplib::Server::HandlerResponse::Unhandled;
      });

  server_->Options("/.*", [](const httplib::Request &, httplib::Response &res) {
    SetCorsHeaders(res);
  });

  // 상태
  server_->Get("/api/status",
               [this](const httplib::Request &, httplib::Response &res) {
                 Send(res, api_.GetStatus());
               });

  // 장치
  server_->Get("/api/devices",
               [this](const httplib::Request &, httplib::Response &res) {
                 Send(res, api_.GetDevices());
               });
  server_->Post("/api/devices/discover",
                [this](const httplib::Request &req, httplib::Response &res) {
                  Send(res, api_.PostDiscover(req.body));
                });
  server_->Get(kDevicePath,
               [this](const httplib::Request &req, httplib::Response &res) {
                 Send(res, api_.GetDevice(req.matches[1]));
               });
  server_->Delete(kDevicePath,
                  [this](const httplib::Request &req, httplib::Response &res) {
                    Send(res, api_.DeleteDevice(req.matches[1]));
                  });
  server_->Post(std::string(kDevicePath) + "/discover-objects",
                [this](const httplib::Request &req, httplib::Response &res) {
                  Send(res, api_.PostDiscoverObjects(req.matches[1]));
                });
  server_->Put(std::string(kDevicePath) + "/enable",
               [this](const httplib::Request &req, httplib::Response &res) {
                 Send(res, api_.PutEnable(req.matches[1]));
               });
  server_->Put(std::string(kDevicePath) + "/disable",
               [this](const httplib::Request &req, httplib::Response &res) {
                 Send(res, api_.PutDisable(req.matches[1]));
               });

  // 객체
  server_->Get(std::string(kDevicePath) + "/objects",
               [this](const httplib::Request &req, httplib::Response &res) {
                 Send(res, api_.GetObjects(req.matches[1]));
               });
  server_->Get(kObjectPath,
               [this](const httplib::Request &req, httplib::Response &res) {
                 Send(res, api_.GetObject(req.matches[1], req.matches[2],
                                          req.matches[3]));
               });

  // 읽기 / 쓰기
  server_->Post("/api/read",
                [this](const httplib::Request &req, httplib::Response &res) {
                  Send(res, api_.PostRead(req.body));
                });
  server_->Post("/api/write",
                [this](const httplib::Request &req, httplib::Response &res) {
                  Send(res, api_.PostWrite(req.body));
                });

  // BBMD
  server_->Post("/api/bbmd/register",
                [this](const httplib::Request &, httplib::Response &res) {
                  Send(res, api_.PostRegister());
                });

  // 토픽 매핑
  server_->Get("/api/mappings",
               [this](const httplib::Request &, httplib::Response &res) {
                 Send(res, api_.GetMappings());
               });
  server_->Post("/api/mappings",
                [this](const httplib::Request &req, httplib::Response &res) {
                  Send(res, api_.PostMapping(req.body));
                });
  server_->Delete(kMappingPath,
                  [this](const httplib::Request &req, httplib::Response &res) {
                    Send(res, api_.DeleteMapping(req.matches[1], req.matches[2],
                                                 req.matches[3]));
                  });
}

// =============================================================================
// 유틸리티
// =============================================================================

void ControlApiServer::SetCorsHeaders(httplib::Response &res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods",
                 "GET, POST, PUT, DELETE, OPTIONS");
  res.set_header("Access-Control-Allow-Headers",
                 "Content-Type, Authorization, X-Requested-With");
  res.set_header("Access-Control-Max-Age", "3600");
}

void ControlApiServer::Send(httplib::Response &res, const ApiResponse &response) {
  res.status = response.status;
  res.set_content(response.body.dump(), "application/json");
}

} // namespace Network
} // namespace BacLink
