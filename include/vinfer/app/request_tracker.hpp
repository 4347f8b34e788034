#pragma once

#include <vinfer/core/batch_result.hpp>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vinfer::app {

/// Last BatchResult per request_id, in memory only.
///
/// put() is last-write-wins and marks the entry most recently used; get() also
/// refreshes it. When full, the least recently used entry is evicted. All
/// operations take an internal mutex.
class RequestTracker {
 public:
  /// \throws std::invalid_argument if capacity is 0.
  explicit RequestTracker(std::size_t capacity = 1024);

  void put(const std::string& request_id, vinfer::core::BatchResult result);

  /// Copy of the stored result, or nullopt if unknown or evicted.
  [[nodiscard]] std::optional<vinfer::core::BatchResult> get(const std::string& request_id);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  using Entry = std::pair<std::string, vinfer::core::BatchResult>;

  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::list<Entry> order_;  // front = most recent
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

}  // namespace vinfer::app
