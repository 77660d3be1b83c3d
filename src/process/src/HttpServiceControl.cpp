/**
 * @file HttpServiceControl.cpp
 * @brief Control-plane client and result-type formatting.
 */

#include "src/process/inc/HttpServiceControl.hpp"

#include "src/helpers/inc/Json.hpp"
#include "src/process/inc/HttpClient.hpp"

#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace arbiter {

namespace process {

namespace {

namespace json = helpers::json;

ServiceProcessState parseProcessState(std::string_view body, std::string_view key) {
  ServiceProcessState state{};
  const auto OBJ = json::findObject(body, key);
  if (!OBJ) {
    return state;
  }
  state.running = json::findBool(*OBJ, "running").value_or(false);
  if (const auto PID = json::findNumber(*OBJ, "pid")) {
    state.pid = static_cast<int>(*PID);
  }
  return state;
}

std::string pidJson(const std::optional<int>& pid) {
  return pid ? std::to_string(*pid) : std::string("null");
}

} // namespace

/* ----------------------------- Result Types ----------------------------- */

std::string SwitchResult::toString() const {
  if (!success) {
    return fmt::format("switch failed: {}", message.empty() ? "unknown error" : message);
  }
  return fmt::format("switched in {:.2f}s", switchTimeMs / 1000.0);
}

std::string ControlPlaneStatus::toString() const {
  if (!reachable) {
    return "control plane: unreachable";
  }
  auto line = [](std::string_view name, const ServiceProcessState& s) {
    return fmt::format("  {:<10} {}{}\n", name, s.running ? "running" : "stopped",
                       s.pid ? fmt::format(" (pid {})", *s.pid) : std::string{});
  };
  std::string out = "control plane: reachable\n";
  out += line("primary", primary);
  out += line("secondary", secondary);
  out += fmt::format("  current    {}",
                     currentService ? process::toString(*currentService) : "none");
  return out;
}

std::string ControlPlaneStatus::toJson() const {
  return fmt::format("{{\"reachable\":{},"
                     "\"primary\":{{\"running\":{},\"pid\":{}}},"
                     "\"secondary\":{{\"running\":{},\"pid\":{}}},"
                     "\"current_service\":{}}}",
                     reachable, primary.running, pidJson(primary.pid), secondary.running,
                     pidJson(secondary.pid),
                     currentService ? fmt::format("\"{}\"", process::toString(*currentService))
                                    : std::string("null"));
}

/* ----------------------------- ControlPlaneConfig ----------------------------- */

std::optional<ServiceType>
ControlPlaneConfig::serviceFromName(std::string_view name) const noexcept {
  for (std::size_t i = 0; i < serviceNames.size(); ++i) {
    if (!serviceNames[i].empty() && serviceNames[i] == name) {
      return static_cast<ServiceType>(i);
    }
  }
  return std::nullopt;
}

/* ----------------------------- Parsing ----------------------------- */

ControlPlaneStatus parseControlPlaneStatus(std::string_view body,
                                           const ControlPlaneConfig& config) {
  ControlPlaneStatus status{};
  status.reachable = true;
  status.primary = parseProcessState(body, config.serviceName(ServiceType::Primary));
  status.secondary = parseProcessState(body, config.serviceName(ServiceType::Secondary));
  if (const auto CURRENT = json::findString(body, "current_service")) {
    status.currentService = config.serviceFromName(*CURRENT);
  }
  return status;
}

SwitchResult parseSwitchResponse(std::string_view body) {
  SwitchResult result{};
  result.success = json::findBool(body, "success").value_or(true);
  result.switchTimeMs = json::findNumber(body, "switch_time").value_or(0.0) * 1000.0;
  result.message = json::findString(body, "message").value_or("");
  return result;
}

/* ----------------------------- HttpServiceControl ----------------------------- */

HttpServiceControl::HttpServiceControl(ControlPlaneConfig config) : config_(std::move(config)) {
  while (!config_.controlPlaneUrl.empty() && config_.controlPlaneUrl.back() == '/') {
    config_.controlPlaneUrl.pop_back();
  }
  if (config_.controlPlaneUrl.empty()) {
    spdlog::warn("Control-plane URL not set, process management disabled");
  } else {
    spdlog::info("Control plane at {}", config_.controlPlaneUrl);
  }
}

std::string HttpServiceControl::endpoint(std::string_view path) const {
  return fmt::format("{}{}", config_.controlPlaneUrl, path);
}

std::string HttpServiceControl::serviceEndpoint(std::string_view path, ServiceType type) const {
  return fmt::format("{}{}?service={}", config_.controlPlaneUrl, path,
                     urlEncode(config_.serviceName(type)));
}

bool HttpServiceControl::apiAvailable() noexcept {
  if (config_.controlPlaneUrl.empty()) {
    return false;
  }
  try {
    const HttpResponse RESP = httpGet(endpoint("/"), config_.apiTimeout);
    if (!RESP.transportOk) {
      spdlog::warn("Control plane unreachable at {}: {}", config_.controlPlaneUrl, RESP.error);
      return false;
    }
    if (RESP.status != 200) {
      spdlog::warn("Control plane returned HTTP {}", RESP.status);
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    spdlog::warn("Control plane check failed: {}", e.what());
    return false;
  }
}

SwitchResult HttpServiceControl::switchService(ServiceType type) noexcept {
  SwitchResult result{};
  if (config_.controlPlaneUrl.empty()) {
    result.message = "control plane disabled";
    return result;
  }
  try {
    const HttpResponse RESP =
        httpPost(serviceEndpoint("/process/switch", type), config_.switchTimeout);
    if (!RESP.transportOk) {
      result.message = RESP.error;
      return result;
    }
    if (!RESP.isSuccess()) {
      result.message = fmt::format("HTTP {}: {}", RESP.status, RESP.body);
      return result;
    }
    return parseSwitchResponse(RESP.body);
  } catch (const std::exception& e) {
    result.success = false;
    result.message = e.what();
    return result;
  }
}

bool HttpServiceControl::stopService(ServiceType type) noexcept {
  if (config_.controlPlaneUrl.empty()) {
    return false;
  }
  try {
    const HttpResponse RESP = httpPost(serviceEndpoint("/process/stop", type), config_.apiTimeout);
    if (!RESP.isSuccess()) {
      spdlog::warn("Stop {} failed: {}", config_.serviceName(type), RESP.toString());
      return false;
    }
    return helpers::json::findBool(RESP.body, "success").value_or(true);
  } catch (const std::exception& e) {
    spdlog::warn("Stop {} failed: {}", toString(type), e.what());
    return false;
  }
}

bool HttpServiceControl::startService(ServiceType type) noexcept {
  if (config_.controlPlaneUrl.empty()) {
    return false;
  }
  try {
    const HttpResponse RESP =
        httpPost(serviceEndpoint("/process/start", type), config_.switchTimeout);
    if (!RESP.isSuccess()) {
      spdlog::warn("Start {} failed: {}", config_.serviceName(type), RESP.toString());
      return false;
    }
    return helpers::json::findBool(RESP.body, "success").value_or(true);
  } catch (const std::exception& e) {
    spdlog::warn("Start {} failed: {}", toString(type), e.what());
    return false;
  }
}

ControlPlaneStatus HttpServiceControl::status() noexcept {
  if (config_.controlPlaneUrl.empty()) {
    return ControlPlaneStatus{};
  }
  try {
    const HttpResponse RESP = httpGet(endpoint("/process/status"), config_.apiTimeout);
    if (!RESP.isSuccess()) {
      spdlog::warn("Process status query failed: {}", RESP.toString());
      return ControlPlaneStatus{};
    }
    return parseControlPlaneStatus(RESP.body, config_);
  } catch (const std::exception& e) {
    spdlog::warn("Process status query failed: {}", e.what());
    return ControlPlaneStatus{};
  }
}

bool HttpServiceControl::serviceHealthy(ServiceType type) noexcept {
  const std::string& URL = config_.healthUrl(type);
  if (URL.empty()) {
    return true;
  }
  const HttpResponse RESP = httpGet(URL, config_.healthTimeout);
  return RESP.transportOk && RESP.status == 200;
}

} // namespace process

} // namespace arbiter
