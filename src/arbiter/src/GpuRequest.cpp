/**
 * @file GpuRequest.cpp
 * @brief Request id generation.
 */

#include "src/arbiter/inc/GpuRequest.hpp"

#include <random>

#include <fmt/core.h>

namespace arbiter {

std::string makeRequestId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t HI = rng();
  const std::uint64_t LO = rng();

  // Version nibble 4, variant bits 10xx.
  return fmt::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}", HI >> 32, (HI >> 16) & 0xFFFFU,
                     HI & 0x0FFFU, 0x8000U | ((LO >> 48) & 0x3FFFU), LO & 0xFFFFFFFFFFFFULL);
}

} // namespace arbiter
