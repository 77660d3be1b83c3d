/**
 * @file ResourceManager.cpp
 * @brief Admission, queue promotion, release and restoration.
 */

#include "src/arbiter/inc/ResourceManager.hpp"

#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Json.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace arbiter {

using Clock = std::chrono::steady_clock;
using process::ServiceType;
using helpers::format::shortId;

namespace {

double secondsSince(Clock::time_point t) {
  return std::chrono::duration<double>(Clock::now() - t).count();
}

std::string requesterSuffix(const std::optional<std::string>& requester) {
  return requester ? fmt::format(", requester {}", *requester) : std::string{};
}

} // namespace

/* ----------------------------- ArbiterMetrics ----------------------------- */

double ArbiterMetrics::timeoutRate() const noexcept {
  if (totalRequests == 0) {
    return 0.0;
  }
  return static_cast<double>(totalTimeouts) / static_cast<double>(totalRequests);
}

double ArbiterMetrics::avgWaitSeconds() const noexcept {
  return totalGrants == 0 ? 0.0 : totalWaitSeconds / static_cast<double>(totalGrants);
}

double ArbiterMetrics::avgUsageSeconds() const noexcept {
  return completedLeases == 0 ? 0.0 : totalUsageSeconds / static_cast<double>(completedLeases);
}

/* ----------------------------- ArbiterStatus ----------------------------- */

std::string ArbiterStatus::toString() const {
  std::string out;
  out += fmt::format("GPU:        {}\n", locked ? "locked" : "free");
  if (leaseId) {
    out += fmt::format("Lease:      {} ({}, held {:.1f}s)\n", shortId(*leaseId),
                       leaseService ? process::toString(*leaseService) : "?", leaseHeldSeconds);
  }
  out += fmt::format("Active:     {}\n",
                     activeService ? process::toString(*activeService) : "unknown");
  out += fmt::format("Queue:      {} waiting\n", queueLength);
  for (std::size_t i = 0; i < queue.size(); ++i) {
    const QueuedRequestInfo& Q = queue[i];
    out += fmt::format("  {:>2}. {} {:<9} prio {:>3} waiting {:.1f}s{}\n", i + 1, Q.shortId,
                       process::toString(Q.serviceType), Q.priority, Q.waitingSeconds,
                       Q.requesterId ? fmt::format(" ({})", *Q.requesterId) : std::string{});
  }
  out += fmt::format("VRAM:       {}\n", vram.toString());
  out += fmt::format("Fallback:   {}\n", fallbackMode ? "yes (VRAM checks skipped)" : "no");
  out += fmt::format("Metrics:    {} requests, {} timeouts ({:.1f}%), avg wait {:.2f}s, "
                     "avg usage {:.2f}s",
                     metrics.totalRequests, metrics.totalTimeouts, metrics.timeoutRate() * 100.0,
                     metrics.avgWaitSeconds(), metrics.avgUsageSeconds());
  return out;
}

std::string ArbiterStatus::toJson() const {
  namespace json = helpers::json;
  auto optString = [](const std::optional<std::string>& s) {
    return s ? fmt::format("\"{}\"", json::escape(*s)) : std::string("null");
  };
  auto optService = [](const std::optional<ServiceType>& t) {
    return t ? fmt::format("\"{}\"", process::toString(*t)) : std::string("null");
  };

  std::string entries;
  for (const QueuedRequestInfo& Q : queue) {
    if (!entries.empty()) {
      entries += ',';
    }
    entries += fmt::format("{{\"id\":\"{}\",\"service\":\"{}\",\"priority\":{},"
                           "\"waiting_seconds\":{:.2f},\"requester\":{}}}",
                           Q.shortId, process::toString(Q.serviceType), Q.priority,
                           Q.waitingSeconds, optString(Q.requesterId));
  }

  return fmt::format(
      "{{\"locked\":{},\"lease\":{{\"id\":{},\"service\":{},\"held_seconds\":{:.2f}}},"
      "\"active_service\":{},\"queue_length\":{},\"queue\":[{}],\"vram\":{},"
      "\"metrics\":{{\"total_requests\":{},\"total_timeouts\":{},\"timeout_rate\":{:.4f},"
      "\"avg_wait_seconds\":{:.2f},\"avg_usage_seconds\":{:.2f}}},\"fallback_mode\":{}}}",
      locked, optString(leaseId), optService(leaseService), leaseHeldSeconds,
      optService(activeService), queueLength, entries, vram.toJson(), metrics.totalRequests,
      metrics.totalTimeouts, metrics.timeoutRate(), metrics.avgWaitSeconds(),
      metrics.avgUsageSeconds(), fallbackMode);
}

/* ----------------------------- ResourceManager ----------------------------- */

ResourceManager::ResourceManager(ResourceManagerConfig config, process::ProcessSwitcher& switcher,
                                 gpu::VramMonitor& vram)
    : config_(config), switcher_(switcher), vram_(vram) {
  refreshFallbackMode();
  spdlog::info("GPU arbiter ready (priorities: primary {}, secondary {}, other {})",
               config_.priorityFor(ServiceType::Primary),
               config_.priorityFor(ServiceType::Secondary),
               config_.priorityFor(ServiceType::Other));
}

bool ResourceManager::refreshFallbackMode() noexcept {
  const bool FALLBACK = !vram_.getUsage().available;
  const bool WAS = fallbackMode_.exchange(FALLBACK);
  if (FALLBACK && !WAS) {
    spdlog::warn("Fallback mode: VRAM telemetry unavailable, using the GPU lock only");
  } else if (!FALLBACK && WAS) {
    spdlog::info("VRAM telemetry back, leaving fallback mode");
  }
  return FALLBACK;
}

bool ResourceManager::admit(const GpuRequest& request) noexcept {
  const std::string_view NAME = process::toString(request.serviceType);
  const auto START = Clock::now();

  bool switched = false;
  try {
    switched = switcher_.switchTo(request.serviceType, request.forceRestart);
  } catch (const std::exception& e) {
    spdlog::error("Process switch to {} threw: {}", NAME, e.what());
  }
  if (switched) {
    spdlog::info("Process switch to {} done in {}", NAME,
                 helpers::format::seconds(Clock::now() - START));
  } else {
    spdlog::warn("Process switch to {} failed, proceeding anyway", NAME);
  }

  if (config_.settleDelay.count() > 0) {
    std::this_thread::sleep_for(config_.settleDelay);
  }

  if (fallbackMode_.load()) {
    return true;
  }
  return vram_.isAvailable(request.requiredMemoryMb);
}

std::shared_ptr<Lease> ResourceManager::grantLocked(std::shared_ptr<const GpuRequest> request) {
  const auto NOW = Clock::now();
  const double WAITED = std::chrono::duration<double>(NOW - request->createdAt).count();
  auto lease = std::make_shared<Lease>(std::move(request), NOW);
  currentLease_ = lease;
  slot_ = SlotState::Held;
  ++metrics_.totalGrants;
  metrics_.totalWaitSeconds += WAITED;
  spdlog::info("GPU granted to {} (id {}, waited {:.2f}s, avg wait {:.2f}s)",
               process::toString(lease->serviceType()), shortId(lease->id()), WAITED,
               metrics_.avgWaitSeconds());
  return lease;
}

void ResourceManager::promoteLocked(Lock& lock) {
  while (slot_ == SlotState::Free && !queue_.empty()) {
    RequestQueue::Entry next = queue_.pop();
    auto it = waiters_.find(next->id);
    if (it == waiters_.end()) {
      continue;
    }
    it->second.state = WaitState::Admitting;
    slot_ = SlotState::Switching;
    spdlog::info("Promoting {} request (id {}, priority {}, {} still queued)",
                 process::toString(next->serviceType), shortId(next->id), next->priority,
                 queue_.size());

    lock.unlock();
    const bool ADMITTED = admit(*next);
    lock.lock();

    it = waiters_.find(next->id);
    if (it == waiters_.end()) {
      // Waiter timed out during admission; the slot goes to the next one.
      slot_ = SlotState::Free;
      spdlog::info("Request {} timed out during admission, skipping", shortId(next->id));
      continue;
    }
    if (!ADMITTED) {
      spdlog::info("VRAM still short for {} (id {}), back in queue",
                   process::toString(next->serviceType), shortId(next->id));
      it->second.state = WaitState::Queued;
      it->second.vramDeferred = true;
      queue_.push(std::move(next));
      slot_ = SlotState::Free;
      retryAdmissionAt_ = Clock::now() + config_.queueRecheckInterval;
      cv_.notify_all();
      return;
    }
    it->second.lease = grantLocked(std::move(next));
    it->second.state = WaitState::Granted;
    cv_.notify_all();
    return;
  }
}

std::shared_ptr<Lease> ResourceManager::acquire(ServiceType type, const AcquireOptions& opts) {
  const auto START = Clock::now();
  refreshFallbackMode();

  auto request = std::make_shared<GpuRequest>();
  request->id = makeRequestId();
  request->serviceType = type;
  request->priority = config_.priorityFor(type);
  request->requesterId = opts.requesterId;
  request->createdAt = START;
  request->requiredMemoryMb = opts.requiredMemoryMb;
  request->forceRestart = opts.forceRestart;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    request->sequence = nextSequence_++;
    ++metrics_.totalRequests;
  }
  const std::shared_ptr<const GpuRequest> REQ = std::move(request);
  const std::string ID = shortId(REQ->id);
  const std::string_view NAME = process::toString(type);
  spdlog::info("GPU request for {} (priority {}, id {}{})", NAME, REQ->priority, ID,
               requesterSuffix(REQ->requesterId));

  if (!switcher_.checkApiAvailable() && !switcher_.checkAvailable(type)) {
    spdlog::error("{} unreachable and control plane down (id {})", NAME, ID);
    throw ResourceUnavailableError(fmt::format(
        "Service {} is unavailable and the process control plane is unreachable", NAME));
  }

  const auto TIMEOUT = opts.timeout.value_or(config_.defaultTimeout);
  const auto DEADLINE = START + TIMEOUT;

  Lock lock(mutex_);
  bool vramDeferred = false;
  if (slot_ == SlotState::Free && queue_.empty()) {
    slot_ = SlotState::Switching;
    lock.unlock();
    const bool ADMITTED = admit(*REQ);
    lock.lock();
    if (ADMITTED) {
      return grantLocked(REQ);
    }
    slot_ = SlotState::Free;
    vramDeferred = true;
    retryAdmissionAt_ = Clock::now() + config_.queueRecheckInterval;
    spdlog::info("VRAM not available after switching to {}, queuing (id {})", NAME, ID);
  }

  queue_.push(REQ);
  waiters_[REQ->id].vramDeferred = vramDeferred;
  spdlog::info("Request queued (position {}/{}, id {})", queue_.position(REQ->id), queue_.size(),
               ID);
  cv_.notify_all();

  while (true) {
    auto it = waiters_.find(REQ->id);
    Waiter& waiter = it->second;

    if (waiter.state == WaitState::Granted) {
      std::shared_ptr<Lease> lease = std::move(waiter.lease);
      waiters_.erase(it);
      return lease;
    }

    const auto NOW = Clock::now();
    if (NOW >= DEADLINE) {
      const bool FOR_VRAM = waiter.vramDeferred;
      queue_.remove(REQ->id);
      waiters_.erase(it);
      ++metrics_.totalTimeouts;
      const std::uint64_t TIMEOUTS = metrics_.totalTimeouts;
      lock.unlock();
      cv_.notify_all();
      spdlog::warn("Timed out after {} waiting for {} for {} (id {}, total timeouts {})",
                   helpers::format::seconds(TIMEOUT), FOR_VRAM ? "VRAM" : "the GPU", NAME, ID,
                   TIMEOUTS);
      throw TimeoutError(fmt::format("Timed out after {} waiting for {}",
                                     helpers::format::seconds(TIMEOUT),
                                     FOR_VRAM ? "VRAM headroom" : "the GPU"),
                         FOR_VRAM);
    }

    // A waiter only ever admits its own request, so its deadline never depends
    // on how long another request's switch takes.
    const RequestQueue::Entry HEAD = queue_.peek();
    if (waiter.state == WaitState::Queued && slot_ == SlotState::Free && HEAD &&
        HEAD->id == REQ->id && NOW >= retryAdmissionAt_) {
      promoteLocked(lock);
      continue;
    }

    cv_.wait_until(lock, std::min(DEADLINE, NOW + config_.queueRecheckInterval));
  }
}

LeaseGuard ResourceManager::acquireScoped(ServiceType type, const AcquireOptions& opts) {
  return LeaseGuard(*this, acquire(type, opts));
}

void ResourceManager::applyRestorationPolicy(ServiceType released) noexcept {
  try {
    if (released == ServiceType::Secondary && config_.alwaysRestorePrimaryAfterSecondary) {
      spdlog::info("Secondary service released, switching back to primary");
      if (!switcher_.ensurePrimaryActive()) {
        spdlog::warn("Primary service not restored after secondary");
      }
    } else if (released == ServiceType::Primary) {
      spdlog::debug("Primary service released, leaving it active");
    } else {
      spdlog::info("Restoring previous service after {}", process::toString(released));
      if (!switcher_.restorePrevious()) {
        spdlog::warn("Previous service not restored");
      }
    }
  } catch (const std::exception& e) {
    spdlog::error("Service restoration failed: {}", e.what());
  }
}

void ResourceManager::release(const std::string& leaseId) {
  std::shared_ptr<Lease> lease;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!currentLease_ || currentLease_->id() != leaseId) {
      spdlog::warn("Release of unknown or stale lease {}, ignoring", shortId(leaseId));
      return;
    }
    lease = std::move(currentLease_);
    lease->markReleased();
    const double USED = secondsSince(lease->acquiredAt());
    ++metrics_.completedLeases;
    metrics_.totalUsageSeconds += USED;
    slot_ = SlotState::Switching;
    spdlog::info("GPU released by {} (id {}, used {:.2f}s, avg usage {:.2f}s)",
                 process::toString(lease->serviceType()), shortId(leaseId), USED,
                 metrics_.avgUsageSeconds());
  }

  applyRestorationPolicy(lease->serviceType());

  // Freed memory may let a deferred request in, so retry admission now.
  Lock lock(mutex_);
  slot_ = SlotState::Free;
  retryAdmissionAt_ = {};
  promoteLocked(lock);
  lock.unlock();
  cv_.notify_all();
}

ArbiterStatus ResourceManager::status() {
  ArbiterStatus out{};
  out.vram = vram_.getUsage();
  out.activeService = switcher_.currentService();
  out.fallbackMode = fallbackMode_.load();

  std::lock_guard<std::mutex> guard(mutex_);
  out.locked = slot_ != SlotState::Free;
  if (currentLease_) {
    out.leaseId = currentLease_->id();
    out.leaseService = currentLease_->serviceType();
    out.leaseHeldSeconds = secondsSince(currentLease_->acquiredAt());
  }
  out.queueLength = queue_.size();
  for (const auto& entry : queue_.snapshot(config_.statusQueueLimit)) {
    QueuedRequestInfo info{};
    info.shortId = shortId(entry->id);
    info.serviceType = entry->serviceType;
    info.priority = entry->priority;
    info.waitingSeconds = secondsSince(entry->createdAt);
    info.requesterId = entry->requesterId;
    out.queue.push_back(std::move(info));
  }
  out.metrics = metrics_;
  return out;
}

ArbiterMetrics ResourceManager::metrics() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return metrics_;
}

std::size_t ResourceManager::queueLength() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return queue_.size();
}

std::optional<std::string> ResourceManager::currentLeaseId() const {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!currentLease_) {
    return std::nullopt;
  }
  return currentLease_->id();
}

/* ----------------------------- LeaseGuard ----------------------------- */

LeaseGuard::~LeaseGuard() {
  try {
    release();
  } catch (const std::exception& e) {
    spdlog::error("Lease release on scope exit failed: {}", e.what());
  }
}

LeaseGuard::LeaseGuard(LeaseGuard&& other) noexcept
    : manager_(other.manager_), lease_(std::move(other.lease_)) {}

LeaseGuard& LeaseGuard::operator=(LeaseGuard&& other) noexcept {
  if (this != &other) {
    try {
      release();
    } catch (const std::exception& e) {
      spdlog::error("Lease release on reassignment failed: {}", e.what());
    }
    manager_ = other.manager_;
    lease_ = std::move(other.lease_);
  }
  return *this;
}

void LeaseGuard::release() {
  if (lease_ && !lease_->released()) {
    manager_->release(lease_->id());
  }
}

} // namespace arbiter
