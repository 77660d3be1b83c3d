/**
 * @file RequestQueue.cpp
 * @brief Binary heap over std::vector.
 */

#include "src/arbiter/inc/RequestQueue.hpp"

#include <algorithm>
#include <utility>

namespace arbiter {

bool RequestQueue::servedAfter(const Entry& a, const Entry& b) noexcept {
  if (a->priority != b->priority) {
    return a->priority < b->priority;
  }
  if (a->createdAt != b->createdAt) {
    return a->createdAt > b->createdAt;
  }
  return a->sequence > b->sequence;
}

void RequestQueue::push(Entry request) {
  heap_.push_back(std::move(request));
  std::push_heap(heap_.begin(), heap_.end(), servedAfter);
}

RequestQueue::Entry RequestQueue::pop() {
  if (heap_.empty()) {
    return nullptr;
  }
  std::pop_heap(heap_.begin(), heap_.end(), servedAfter);
  Entry top = std::move(heap_.back());
  heap_.pop_back();
  return top;
}

RequestQueue::Entry RequestQueue::peek() const { return heap_.empty() ? nullptr : heap_.front(); }

bool RequestQueue::remove(const std::string& id) {
  const auto IT = std::find_if(heap_.begin(), heap_.end(),
                               [&id](const Entry& e) { return e->id == id; });
  if (IT == heap_.end()) {
    return false;
  }
  heap_.erase(IT);
  std::make_heap(heap_.begin(), heap_.end(), servedAfter);
  return true;
}

bool RequestQueue::contains(const std::string& id) const noexcept {
  return std::any_of(heap_.begin(), heap_.end(), [&id](const Entry& e) { return e->id == id; });
}

std::size_t RequestQueue::position(const std::string& id) const {
  const std::vector<Entry> ORDERED = snapshot(heap_.size());
  for (std::size_t i = 0; i < ORDERED.size(); ++i) {
    if (ORDERED[i]->id == id) {
      return i + 1;
    }
  }
  return 0;
}

std::vector<RequestQueue::Entry> RequestQueue::snapshot(std::size_t limit) const {
  std::vector<Entry> ordered(heap_);
  std::sort(ordered.begin(), ordered.end(),
            [](const Entry& a, const Entry& b) { return servedAfter(b, a); });
  if (ordered.size() > limit) {
    ordered.resize(limit);
  }
  return ordered;
}

} // namespace arbiter
