#ifndef ARBITER_ARBITER_LEASE_HPP
#define ARBITER_ARBITER_LEASE_HPP
/**
 * @file Lease.hpp
 * @brief Proof of exclusive ownership of the GPU.
 *
 * Created only by ResourceManager when a request is admitted. The released
 * flag goes false -> true exactly once.
 */

#include "src/arbiter/inc/GpuRequest.hpp"

#include <atomic>  // std::atomic
#include <chrono>  // std::chrono::steady_clock
#include <memory>  // std::shared_ptr
#include <string>  // std::string
#include <utility> // std::move

namespace arbiter {

class Lease {
public:
  Lease(std::shared_ptr<const GpuRequest> request,
        std::chrono::steady_clock::time_point acquiredAt) noexcept
      : request_(std::move(request)), acquiredAt_(acquiredAt) {}

  Lease(const Lease&) = delete;
  Lease& operator=(const Lease&) = delete;

  /// @brief Same as the granting request's id.
  [[nodiscard]] const std::string& id() const noexcept { return request_->id; }
  [[nodiscard]] const GpuRequest& request() const noexcept { return *request_; }
  [[nodiscard]] process::ServiceType serviceType() const noexcept { return request_->serviceType; }
  [[nodiscard]] std::chrono::steady_clock::time_point acquiredAt() const noexcept {
    return acquiredAt_;
  }
  [[nodiscard]] bool released() const noexcept { return released_.load(); }

  /**
   * @brief Flip the released flag.
   * @return true only for the call that performed the transition.
   */
  bool markReleased() noexcept { return !released_.exchange(true); }

private:
  std::shared_ptr<const GpuRequest> request_;
  std::chrono::steady_clock::time_point acquiredAt_;
  std::atomic<bool> released_{false};
};

} // namespace arbiter

#endif // ARBITER_ARBITER_LEASE_HPP
