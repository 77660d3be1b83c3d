#ifndef ARBITER_ARBITER_REQUEST_QUEUE_HPP
#define ARBITER_ARBITER_REQUEST_QUEUE_HPP
/**
 * @file RequestQueue.hpp
 * @brief Priority queue of waiting GPU requests.
 *
 * Service order: priority descending, then createdAt ascending, then arrival
 * sequence ascending. Equal priorities are strictly FIFO.
 *
 * @note Not thread-safe. ResourceManager guards it with its own mutex.
 */

#include "src/arbiter/inc/GpuRequest.hpp"

#include <cstddef> // std::size_t
#include <memory>  // std::shared_ptr
#include <string>  // std::string
#include <vector>  // std::vector

namespace arbiter {

class RequestQueue {
public:
  using Entry = std::shared_ptr<const GpuRequest>;

  void push(Entry request);

  /// @brief Remove and return the next request to serve, or nullptr when empty.
  [[nodiscard]] Entry pop();

  /// @brief Next request to serve, or nullptr when empty.
  [[nodiscard]] Entry peek() const;

  /// @brief Remove a request by id. @return true if it was queued.
  bool remove(const std::string& id);

  [[nodiscard]] bool contains(const std::string& id) const noexcept;

  /// @brief 1-based position in service order, 0 when absent.
  [[nodiscard]] std::size_t position(const std::string& id) const;

  /// @brief Up to limit entries in service order.
  [[nodiscard]] std::vector<Entry> snapshot(std::size_t limit) const;

  [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }
  [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }

  void clear() noexcept { heap_.clear(); }

  /// @brief Heap ordering: true when a is served after b.
  [[nodiscard]] static bool servedAfter(const Entry& a, const Entry& b) noexcept;

private:
  std::vector<Entry> heap_;
};

} // namespace arbiter

#endif // ARBITER_ARBITER_REQUEST_QUEUE_HPP
