/**
 * @file ArbiterConfig.cpp
 * @brief Key table and layered loading.
 */

#include "src/config/inc/ArbiterConfig.hpp"

#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/core.h>

namespace arbiter {
namespace config {

namespace {

namespace str = helpers::strings;
using Ms = std::chrono::milliseconds;

using Setter = bool (*)(ArbiterConfig&, std::string_view);

struct KeyDef {
  std::string_view key;
  Setter set;
};

bool setMs(Ms& out, std::string_view v) {
  const auto N = str::parseUint(v);
  if (!N || *N > static_cast<std::uint64_t>(std::numeric_limits<Ms::rep>::max())) {
    return false;
  }
  out = Ms{static_cast<Ms::rep>(*N)};
  return true;
}

bool setBool(bool& out, std::string_view v) {
  const auto B = str::parseBool(v);
  if (!B) {
    return false;
  }
  out = *B;
  return true;
}

/// Rejects values that do not fit T.
template <typename T> bool setUint(T& out, std::string_view v) {
  const auto N = str::parseUint(v);
  if (!N || *N > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
    return false;
  }
  out = static_cast<T>(*N);
  return true;
}

bool setInt(int& out, std::string_view v) {
  const auto N = str::parseInt(v);
  if (!N || *N < std::numeric_limits<int>::min() || *N > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(*N);
  return true;
}

bool setPositiveDouble(double& out, std::string_view v) {
  const auto D = str::parseDouble(v);
  if (!D || *D <= 0.0) {
    return false;
  }
  out = *D;
  return true;
}

bool setUrl(std::string& out, std::string_view v) {
  if (!v.empty() && v.substr(0, 7) != "http://") {
    return false;
  }
  out = std::string(v);
  return true;
}

constexpr std::size_t PRIMARY = 0;
constexpr std::size_t SECONDARY = 1;
constexpr std::size_t OTHER = 2;

// clang-format off
const std::array<KeyDef, 27> KEYS{{
  {"VRAM_MONITORING_ENABLED", [](ArbiterConfig& c, std::string_view v) { return setBool(c.vram.enabled, v); }},
  {"GPU_DEVICE_INDEX", [](ArbiterConfig& c, std::string_view v) { return setUint(c.vram.deviceIndex, v); }},
  {"VRAM_USAGE_CEILING_PERCENT", [](ArbiterConfig& c, std::string_view v) {
     return setPositiveDouble(c.vram.usageCeilingPercent, v) && c.vram.usageCeilingPercent <= 100.0; }},
  {"VRAM_MIN_FREE_MB", [](ArbiterConfig& c, std::string_view v) { return setUint(c.vram.minFreeMb, v); }},
  {"VRAM_POLL_INTERVAL_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.vram.pollInterval, v); }},

  {"PROCESS_MANAGER_API_URL", [](ArbiterConfig& c, std::string_view v) { return setUrl(c.controlPlane.controlPlaneUrl, v); }},
  {"PROCESS_API_TIMEOUT_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.controlPlane.apiTimeout, v); }},
  {"PROCESS_SWITCH_TIMEOUT_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.controlPlane.switchTimeout, v); }},
  {"SERVICE_HEALTH_TIMEOUT_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.controlPlane.healthTimeout, v); }},
  {"PRIMARY_SERVICE_NAME", [](ArbiterConfig& c, std::string_view v) {
     c.controlPlane.serviceNames[PRIMARY] = std::string(v); return !v.empty(); }},
  {"SECONDARY_SERVICE_NAME", [](ArbiterConfig& c, std::string_view v) {
     c.controlPlane.serviceNames[SECONDARY] = std::string(v); return !v.empty(); }},
  {"PRIMARY_HEALTH_URL", [](ArbiterConfig& c, std::string_view v) { return setUrl(c.controlPlane.healthUrls[PRIMARY], v); }},
  {"SECONDARY_HEALTH_URL", [](ArbiterConfig& c, std::string_view v) { return setUrl(c.controlPlane.healthUrls[SECONDARY], v); }},

  {"PROCESS_READY_TIMEOUT_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.switcher.readinessTimeout, v); }},
  {"PROCESS_READY_POLL_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.switcher.readinessPoll, v); }},
  {"PROCESS_RESTORE_ON_RELEASE", [](ArbiterConfig& c, std::string_view v) { return setBool(c.switcher.restoreOnRelease, v); }},
  {"RETRY_MAX_ATTEMPTS", [](ArbiterConfig& c, std::string_view v) {
     return setUint(c.switcher.retry.maxAttempts, v) && c.switcher.retry.maxAttempts > 0; }},
  {"RETRY_BASE_DELAY_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.switcher.retry.baseDelay, v); }},
  {"RETRY_MULTIPLIER", [](ArbiterConfig& c, std::string_view v) { return setPositiveDouble(c.switcher.retry.multiplier, v); }},

  {"PRIORITY_PRIMARY", [](ArbiterConfig& c, std::string_view v) { return setInt(c.manager.priorities[PRIMARY], v); }},
  {"PRIORITY_SECONDARY", [](ArbiterConfig& c, std::string_view v) { return setInt(c.manager.priorities[SECONDARY], v); }},
  {"PRIORITY_OTHER", [](ArbiterConfig& c, std::string_view v) { return setInt(c.manager.priorities[OTHER], v); }},
  {"GPU_WAIT_TIMEOUT_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.manager.defaultTimeout, v); }},
  {"SWITCH_SETTLE_MS", [](ArbiterConfig& c, std::string_view v) { return setMs(c.manager.settleDelay, v); }},
  {"QUEUE_RECHECK_MS", [](ArbiterConfig& c, std::string_view v) {
     return setMs(c.manager.queueRecheckInterval, v) && c.manager.queueRecheckInterval.count() > 0; }},
  {"ALWAYS_RESTORE_PRIMARY_AFTER_SECONDARY", [](ArbiterConfig& c, std::string_view v) {
     return setBool(c.manager.alwaysRestorePrimaryAfterSecondary, v); }},

  {"LOG_LEVEL", [](ArbiterConfig& c, std::string_view v) {
     if (!helpers::log::parseLevel(v)) { return false; }
     c.logLevel = std::string(v);
     return true; }},
}};
// clang-format on

bool fail(ErrorOut& error, std::string msg) {
  if (error) {
    error->get() = std::move(msg);
  }
  return false;
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::vector<std::string_view> knownKeys() {
  std::vector<std::string_view> out;
  out.reserve(KEYS.size());
  for (const KeyDef& DEF : KEYS) {
    out.push_back(DEF.key);
  }
  return out;
}

bool applyValue(ArbiterConfig& cfg, std::string_view key, std::string_view value, ErrorOut error) {
  for (const KeyDef& DEF : KEYS) {
    if (DEF.key == key) {
      if (!DEF.set(cfg, value)) {
        return fail(error, fmt::format("invalid value '{}' for {}", value, key));
      }
      return true;
    }
  }
  return fail(error, fmt::format("unknown configuration key '{}'", key));
}

bool applyText(ArbiterConfig& cfg, std::string_view text, ErrorOut error) {
  std::size_t start = 0;
  std::size_t lineNo = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    ++lineNo;
    std::string_view line = str::trim(text.substr(start, end - start));
    start = end + 1;

    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (line.substr(0, 7) == "export ") {
      line = str::trim(line.substr(7));
    }
    const std::size_t EQ = line.find('=');
    if (EQ == std::string_view::npos) {
      return fail(error, fmt::format("line {}: expected KEY=VALUE", lineNo));
    }
    std::string_view key = str::trim(line.substr(0, EQ));
    if (key.substr(0, ENV_PREFIX.size()) == ENV_PREFIX) {
      key.remove_prefix(ENV_PREFIX.size());
    }
    const std::string_view VALUE = str::unquote(str::trim(line.substr(EQ + 1)));

    std::string msg;
    if (!applyValue(cfg, key, VALUE, msg)) {
      return fail(error, fmt::format("line {}: {}", lineNo, msg));
    }
  }
  return true;
}

bool loadFromFile(ArbiterConfig& cfg, const std::string& path, ErrorOut error) {
  std::ifstream in(path);
  if (!in) {
    return fail(error, fmt::format("cannot open configuration file '{}'", path));
  }
  std::ostringstream buf;
  buf << in.rdbuf();

  std::string msg;
  if (!applyText(cfg, buf.str(), msg)) {
    return fail(error, fmt::format("{}: {}", path, msg));
  }
  return true;
}

bool loadFromEnv(ArbiterConfig& cfg, ErrorOut error) {
  for (const KeyDef& DEF : KEYS) {
    const std::string NAME = fmt::format("{}{}", ENV_PREFIX, DEF.key);
    const char* value = std::getenv(NAME.c_str());
    if (value == nullptr) {
      continue;
    }
    if (!DEF.set(cfg, str::trim(value))) {
      return fail(error, fmt::format("invalid value '{}' for {}", value, NAME));
    }
  }
  return true;
}

bool load(ArbiterConfig& cfg, const std::string& path, ErrorOut error) {
  if (!path.empty() && !loadFromFile(cfg, path, error)) {
    return false;
  }
  return loadFromEnv(cfg, error);
}

/* ----------------------------- ArbiterConfig ----------------------------- */

std::string ArbiterConfig::toString() const {
  using process::ServiceType;
  std::string out;
  out += fmt::format("VRAM:        {} (GPU {}, ceiling {:.1f}%, min free {} MB, poll {} ms)\n",
                     vram.enabled ? "monitored" : "disabled", vram.deviceIndex,
                     vram.usageCeilingPercent, vram.minFreeMb, vram.pollInterval.count());
  out += fmt::format("Control:     {} (api {} ms, switch {} ms, health {} ms)\n",
                     controlPlane.controlPlaneUrl.empty() ? "disabled"
                                                          : controlPlane.controlPlaneUrl,
                     controlPlane.apiTimeout.count(), controlPlane.switchTimeout.count(),
                     controlPlane.healthTimeout.count());
  out += fmt::format("Services:    primary '{}' {}, secondary '{}' {}\n",
                     controlPlane.serviceName(ServiceType::Primary),
                     controlPlane.healthUrl(ServiceType::Primary),
                     controlPlane.serviceName(ServiceType::Secondary),
                     controlPlane.healthUrl(ServiceType::Secondary));
  out += fmt::format("Switcher:    ready {} ms / poll {} ms, retry {}x from {} ms (x{:.1f}), "
                     "restore on release {}\n",
                     switcher.readinessTimeout.count(), switcher.readinessPoll.count(),
                     switcher.retry.maxAttempts, switcher.retry.baseDelay.count(),
                     switcher.retry.multiplier, switcher.restoreOnRelease ? "on" : "off");
  out += fmt::format("Arbiter:     priorities {}/{}/{}, timeout {} ms, settle {} ms, "
                     "recheck {} ms, primary after secondary {}",
                     manager.priorities[PRIMARY], manager.priorities[SECONDARY],
                     manager.priorities[OTHER], manager.defaultTimeout.count(),
                     manager.settleDelay.count(), manager.queueRecheckInterval.count(),
                     manager.alwaysRestorePrimaryAfterSecondary ? "on" : "off");
  return out;
}

} // namespace config
} // namespace arbiter
