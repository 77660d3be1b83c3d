/**
 * @file arbiter-stat.cpp
 * @brief GPU arbitration status: VRAM headroom, GPU processes, managed services.
 *
 * Reads the same configuration as the arbiter (file plus ARBITER_* variables)
 * and reports what an acquire() would see right now.
 */

#include "src/config/inc/ArbiterConfig.hpp"
#include "src/gpu/inc/VramMonitor.hpp"
#include "src/gpu/inc/VramProbe.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/process/inc/HttpServiceControl.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace gpu = arbiter::gpu;
namespace process = arbiter::process;
namespace args = arbiter::helpers::args;

using arbiter::helpers::format::megabytes;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_CONFIG = 2,
  ARG_PROCS = 3,
  ARG_SHOW_CONFIG = 4,
  ARG_LOG_LEVEL = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Show GPU arbitration state: VRAM headroom, GPU processes, and managed service status.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_CONFIG] = {"--config", 1, false, "KEY=VALUE configuration file"};
  map[ARG_PROCS] = {"--procs", 0, false, "List GPU compute processes"};
  map[ARG_SHOW_CONFIG] = {"--show-config", 0, false, "Print the effective configuration"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false, "trace|debug|info|warn|error|off (default: warn)"};
  return map;
}

struct Report {
  gpu::UsageSnapshot usage{};
  bool headroom{true};
  std::vector<gpu::GpuProcessUsage> processes;
  process::ControlPlaneStatus control{};
  bool primaryHealthy{false};
  bool secondaryHealthy{false};
};

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const Report& r, const arbiter::config::ArbiterConfig& cfg, bool showProcs) {
  fmt::print("=== VRAM (GPU {}) ===\n", cfg.vram.deviceIndex);
  if (!r.usage.available) {
    fmt::print("  Telemetry:   \033[33munavailable\033[0m (arbiter runs in fallback mode)\n");
  } else {
    fmt::print("  Source:      {}\n", gpu::toString(r.usage.source));
    fmt::print("  Used:        {} / {} ({:.1f}%)\n", megabytes(r.usage.usedMb),
               megabytes(r.usage.totalMb), r.usage.usagePercent);
    fmt::print("  Free:        {}\n", megabytes(r.usage.freeMb));
  }
  fmt::print("  Headroom:    {} (ceiling {:.1f}%, min free {})\n",
             r.headroom ? "ok" : "\033[31mINSUFFICIENT\033[0m", cfg.vram.usageCeilingPercent,
             megabytes(cfg.vram.minFreeMb));

  if (showProcs) {
    fmt::print("\n=== GPU Processes ===\n");
    if (r.processes.empty()) {
      fmt::print("  (none reported)\n");
    }
    for (const auto& PROC : r.processes) {
      fmt::print("  {}\n", PROC.toString());
    }
  }

  fmt::print("\n=== Services ===\n");
  fmt::print("  {}\n", r.control.toString());
  fmt::print("  primary health:   {}\n", r.primaryHealthy ? "up" : "down");
  fmt::print("  secondary health: {}\n", r.secondaryHealthy ? "up" : "down");
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const Report& r, bool showProcs) {
  fmt::print("{{\n");
  fmt::print("  \"vram\": {},\n", r.usage.toJson());
  fmt::print("  \"headroom\": {},\n", r.headroom);
  if (showProcs) {
    fmt::print("  \"processes\": [");
    for (std::size_t i = 0; i < r.processes.size(); ++i) {
      const auto& PROC = r.processes[i];
      fmt::print("{}{{\"pid\": {}, \"name\": \"{}\", \"used_mb\": {}}}", i > 0 ? ", " : "",
                 PROC.pid, arbiter::helpers::json::escape(PROC.name), PROC.usedMb);
    }
    fmt::print("],\n");
  }
  fmt::print("  \"control_plane\": {},\n", r.control.toJson());
  fmt::print("  \"health\": {{\"primary\": {}, \"secondary\": {}}}\n", r.primaryHealthy,
             r.secondaryHealthy);
  fmt::print("}}\n");
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

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = pargs.count(ARG_JSON) != 0;
  const bool SHOW_PROCS = pargs.count(ARG_PROCS) != 0;

  arbiter::config::ArbiterConfig cfg;
  const std::string CONFIG_PATH(args::firstValue(pargs, ARG_CONFIG).value_or(""));
  if (!arbiter::config::load(cfg, CONFIG_PATH, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  arbiter::helpers::log::init(args::firstValue(pargs, ARG_LOG_LEVEL).value_or("warn"));

  if (pargs.count(ARG_SHOW_CONFIG) != 0) {
    fmt::print("{}\n\n", cfg.toString());
  }

  gpu::VramMonitor monitor(cfg.vram, gpu::makeDefaultProbes(cfg.vram.deviceIndex));
  process::HttpServiceControl control(cfg.controlPlane);

  Report report{};
  report.usage = monitor.getUsage();
  report.headroom = monitor.isAvailable();
  if (SHOW_PROCS) {
    report.processes = monitor.gpuProcesses();
  }
  report.control = control.status();
  report.primaryHealthy = control.serviceHealthy(process::ServiceType::Primary);
  report.secondaryHealthy = control.serviceHealthy(process::ServiceType::Secondary);

  if (JSON_OUTPUT) {
    printJson(report, SHOW_PROCS);
  } else {
    printHuman(report, cfg, SHOW_PROCS);
  }
  return 0;
}
