/**
 * @file NvidiaSmiProbe.cpp
 * @brief VRAM telemetry via the nvidia-smi CLI, plus CSV parsing.
 */

#include "src/gpu/inc/VramProbe.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <new>
#include <optional>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace arbiter {

namespace gpu {

namespace {

/* ----------------------------- Command Helpers ----------------------------- */

struct CommandOutput {
  std::string text;
  int exitCode{-1};
};

/// Run a shell command and capture stdout. exitCode is -1 if it could not run.
CommandOutput runCommand(const std::string& cmd) noexcept {
  CommandOutput out{};
  try {
    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (pipe == nullptr) {
      return out;
    }
    std::array<char, 512> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe) != nullptr) {
      out.text += buf.data();
    }
    const int STATUS = ::pclose(pipe);
    if (STATUS != -1 && WIFEXITED(STATUS)) {
      out.exitCode = WEXITSTATUS(STATUS);
    }
  } catch (const std::bad_alloc&) {
    out.text.clear();
    out.exitCode = -1;
  }
  return out;
}

/* ----------------------------- CSV Helpers ----------------------------- */

using helpers::strings::parseUint;
using helpers::strings::trim;

/// Split one line on commas.
std::vector<std::string_view> splitCsv(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t COMMA = line.find(',', start);
    if (COMMA == std::string_view::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, COMMA - start)));
    start = COMMA + 1;
  }
  return fields;
}

/// Non-empty lines of text.
std::vector<std::string_view> lines(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const std::string_view LINE = trim(text.substr(start, end - start));
    if (!LINE.empty()) {
      out.push_back(LINE);
    }
    start = end + 1;
  }
  return out;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

UsageSnapshot parseSmiMemoryCsv(std::string_view csv, int line) noexcept {
  try {
    const auto ROWS = lines(csv);
    if (line < 0 || static_cast<std::size_t>(line) >= ROWS.size()) {
      return UsageSnapshot{};
    }
    const auto FIELDS = splitCsv(ROWS[static_cast<std::size_t>(line)]);
    if (FIELDS.size() < 2) {
      return UsageSnapshot{};
    }
    const auto USED = parseUint(FIELDS[0]);
    const auto TOTAL = parseUint(FIELDS[1]);
    if (!USED || !TOTAL || *TOTAL == 0) {
      return UsageSnapshot{};
    }
    return UsageSnapshot::fromUsedTotal(*USED, *TOTAL, TelemetrySource::NvidiaSmi);
  } catch (const std::bad_alloc&) {
    return UsageSnapshot{};
  }
}

std::vector<GpuProcessUsage> parseSmiProcessCsv(std::string_view csv) {
  std::vector<GpuProcessUsage> out;
  for (const std::string_view ROW : lines(csv)) {
    const auto FIELDS = splitCsv(ROW);
    if (FIELDS.size() < 3) {
      continue;
    }
    const auto PID = parseUint(FIELDS[0]);
    const auto USED = parseUint(FIELDS[2]);
    if (!PID || !USED) {
      continue;
    }
    GpuProcessUsage proc{};
    proc.pid = static_cast<std::uint32_t>(*PID);
    proc.name = std::string(FIELDS[1]);
    proc.usedMb = *USED;
    out.push_back(std::move(proc));
  }
  return out;
}

/* ----------------------------- NvidiaSmiProbe ----------------------------- */

NvidiaSmiProbe::NvidiaSmiProbe(int deviceIndex, std::string executable,
                               std::chrono::seconds timeout)
    : deviceIndex_(deviceIndex), executable_(std::move(executable)), timeout_(timeout) {
  present_ = runCommand(command("--version")).exitCode == 0;
  if (present_) {
    spdlog::debug("nvidia-smi available for VRAM telemetry");
  } else {
    spdlog::debug("nvidia-smi not available");
  }
}

std::string NvidiaSmiProbe::command(std::string_view args) const {
  return fmt::format("timeout {} {} {} 2>/dev/null", timeout_.count(), executable_, args);
}

UsageSnapshot NvidiaSmiProbe::query() noexcept {
  if (!present_ || deviceIndex_ < 0) {
    return UsageSnapshot{};
  }
  try {
    const CommandOutput OUT = runCommand(command(
        fmt::format("--id={} --query-gpu=memory.used,memory.total --format=csv,noheader,nounits",
                    deviceIndex_)));
    if (OUT.exitCode != 0) {
      spdlog::error("nvidia-smi memory query exited with {}", OUT.exitCode);
      return UsageSnapshot{};
    }
    return parseSmiMemoryCsv(OUT.text, 0);
  } catch (const std::exception& e) {
    spdlog::error("nvidia-smi memory query failed: {}", e.what());
    return UsageSnapshot{};
  }
}

std::vector<GpuProcessUsage> NvidiaSmiProbe::processes() noexcept {
  if (!present_ || deviceIndex_ < 0) {
    return {};
  }
  try {
    const CommandOutput OUT = runCommand(command(fmt::format(
        "--id={} --query-compute-apps=pid,process_name,used_memory --format=csv,noheader,nounits",
        deviceIndex_)));
    if (OUT.exitCode != 0) {
      return {};
    }
    return parseSmiProcessCsv(OUT.text);
  } catch (const std::exception& e) {
    spdlog::debug("nvidia-smi process query failed: {}", e.what());
    return {};
  }
}

/* ----------------------------- Factory ----------------------------- */

std::vector<std::unique_ptr<VramProbe>> makeDefaultProbes(int deviceIndex) {
  std::vector<std::unique_ptr<VramProbe>> probes;
  probes.push_back(std::make_unique<NvmlProbe>(deviceIndex));
  probes.push_back(std::make_unique<NvidiaSmiProbe>(deviceIndex));
  return probes;
}

} // namespace gpu

} // namespace arbiter
