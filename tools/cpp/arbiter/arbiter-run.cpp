/**
 * @file arbiter-run.cpp
 * @brief Run a command while holding the GPU lease for a service.
 *
 * Acquires the lease (switching services and waiting for VRAM as needed),
 * runs the command through /bin/sh -c, releases the lease and exits with the
 * command's status.
 *
 * Exit codes: command status on success, 1 usage/config error,
 * 3 timed out waiting, 4 service unavailable, 127 command could not start.
 */

#include "src/arbiter/inc/ResourceManager.hpp"
#include "src/config/inc/ArbiterConfig.hpp"
#include "src/gpu/inc/VramMonitor.hpp"
#include "src/gpu/inc/VramProbe.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/process/inc/HttpServiceControl.hpp"
#include "src/process/inc/ProcessSwitcher.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpu = arbiter::gpu;
namespace process = arbiter::process;
namespace args = arbiter::helpers::args;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_TIMEOUT = 3;
constexpr int EXIT_UNAVAILABLE = 4;
constexpr int EXIT_SPAWN = 127;

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_SERVICE = 1,
  ARG_CMD = 2,
  ARG_TIMEOUT = 3,
  ARG_VRAM = 4,
  ARG_REQUESTER = 5,
  ARG_FORCE_RESTART = 6,
  ARG_CONFIG = 7,
  ARG_LOG_LEVEL = 8,
  ARG_STATUS = 9,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Acquire the GPU for a service, run a shell command while holding it, then release.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_SERVICE] = {"--service", 1, true, "primary | secondary | other"};
  map[ARG_CMD] = {"--cmd", 1, true, "Shell command to run while the lease is held"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Seconds to wait for the GPU (default: config)"};
  map[ARG_VRAM] = {"--vram", 1, false, "Required free VRAM in MB"};
  map[ARG_REQUESTER] = {"--requester", 1, false, "Requester id for logs"};
  map[ARG_FORCE_RESTART] = {"--force-restart", 0, false, "Restart the service before running"};
  map[ARG_CONFIG] = {"--config", 1, false, "KEY=VALUE configuration file"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false, "trace|debug|info|warn|error|off"};
  map[ARG_STATUS] = {"--status", 0, false, "Print arbiter status once the lease is granted"};
  return map;
}

/// Run cmd via /bin/sh -c and return its exit status.
int runShell(const std::string& cmd) {
  const pid_t PID = ::fork();
  if (PID < 0) {
    spdlog::error("fork failed: {}", std::strerror(errno));
    return EXIT_SPAWN;
  }
  if (PID == 0) {
    ::execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr));
    ::_exit(EXIT_SPAWN);
  }

  int status = 0;
  while (::waitpid(PID, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::error("waitpid failed: {}", std::strerror(errno));
      return EXIT_SPAWN;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return EXIT_SPAWN;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 0 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  // --help short-circuits required-flag validation.
  for (const std::string_view ARG : argList) {
    if (ARG == "--help") {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_USAGE;
  }

  const auto SERVICE = process::parseServiceType(*args::firstValue(pargs, ARG_SERVICE));
  if (!SERVICE) {
    fmt::print(stderr, "Error: unknown service '{}'\n", *args::firstValue(pargs, ARG_SERVICE));
    return EXIT_USAGE;
  }
  const std::string COMMAND(*args::firstValue(pargs, ARG_CMD));

  arbiter::AcquireOptions opts{};
  if (pargs.count(ARG_TIMEOUT) != 0) {
    const auto SECS = args::uintValue(pargs, ARG_TIMEOUT);
    if (!SECS) {
      fmt::print(stderr, "Error: --timeout expects a whole number of seconds\n");
      return EXIT_USAGE;
    }
    opts.timeout = std::chrono::seconds{*SECS};
  }
  if (pargs.count(ARG_VRAM) != 0) {
    opts.requiredMemoryMb = args::uintValue(pargs, ARG_VRAM);
    if (!opts.requiredMemoryMb) {
      fmt::print(stderr, "Error: --vram expects megabytes\n");
      return EXIT_USAGE;
    }
  }
  if (const auto REQUESTER = args::firstValue(pargs, ARG_REQUESTER)) {
    opts.requesterId = std::string(*REQUESTER);
  }
  opts.forceRestart = pargs.count(ARG_FORCE_RESTART) != 0;

  arbiter::config::ArbiterConfig cfg;
  const std::string CONFIG_PATH(args::firstValue(pargs, ARG_CONFIG).value_or(""));
  if (!arbiter::config::load(cfg, CONFIG_PATH, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return EXIT_USAGE;
  }
  const auto LEVEL = args::firstValue(pargs, ARG_LOG_LEVEL);
  arbiter::helpers::log::init(LEVEL ? *LEVEL : std::string_view(cfg.logLevel));

  gpu::VramMonitor monitor(cfg.vram, gpu::makeDefaultProbes(cfg.vram.deviceIndex));
  process::ProcessSwitcher switcher(
      cfg.switcher, std::make_unique<process::HttpServiceControl>(cfg.controlPlane));
  arbiter::ResourceManager manager(cfg.manager, switcher, monitor);

  try {
    arbiter::LeaseGuard guard = manager.acquireScoped(*SERVICE, opts);
    if (pargs.count(ARG_STATUS) != 0) {
      fmt::print(stderr, "{}\n", manager.status().toString());
    }

    const auto START = std::chrono::steady_clock::now();
    const int RC = runShell(COMMAND);
    spdlog::info("Command exited with {} after {}", RC,
                 arbiter::helpers::format::seconds(std::chrono::steady_clock::now() - START));
    guard.release();
    return RC;
  } catch (const arbiter::TimeoutError& e) {
    spdlog::error("{}", e.what());
    return EXIT_TIMEOUT;
  } catch (const arbiter::ResourceUnavailableError& e) {
    spdlog::error("{}", e.what());
    return EXIT_UNAVAILABLE;
  }
}
