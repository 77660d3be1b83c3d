#ifndef ARBITER_ARBITER_GPU_REQUEST_HPP
#define ARBITER_ARBITER_GPU_REQUEST_HPP
/**
 * @file GpuRequest.hpp
 * @brief A pending or active bid for the GPU.
 *
 * Requests are shared as std::shared_ptr<const GpuRequest>; nothing changes
 * after construction.
 */

#include "src/process/inc/ServiceType.hpp"

#include <chrono>   // std::chrono::steady_clock
#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string

namespace arbiter {

struct GpuRequest {
  std::string id; ///< Random UUID (v4 text form)
  process::ServiceType serviceType{process::ServiceType::Other};
  int priority{0};                        ///< Higher wins
  std::optional<std::string> requesterId; ///< Observability only
  std::chrono::steady_clock::time_point createdAt{};
  std::optional<std::uint64_t> requiredMemoryMb;
  bool forceRestart{false};  ///< Restart the service on admission
  std::uint64_t sequence{0}; ///< Arrival counter, breaks createdAt ties
};

/// @brief Generate a random version-4 UUID string.
[[nodiscard]] std::string makeRequestId();

} // namespace arbiter

#endif // ARBITER_ARBITER_GPU_REQUEST_HPP
