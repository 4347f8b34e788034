#include <vinfer/app/request_tracker.hpp>
#include <vinfer/core/log.hpp>

#include <stdexcept>

namespace vinfer::app {

RequestTracker::RequestTracker(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("RequestTracker: capacity must be >= 1");
}

void RequestTracker::put(const std::string& request_id, vinfer::core::BatchResult result) {
  std::lock_guard lock(mutex_);
  if (auto it = index_.find(request_id); it != index_.end()) {
    it->second->second = std::move(result);
    order_.splice(order_.begin(), order_, it->second);
    return;
  }
  order_.emplace_front(request_id, std::move(result));
  index_.emplace(request_id, order_.begin());
  while (order_.size() > capacity_) {
    VINFER_LOGD("tracker evicting request_id=", order_.back().first);
    index_.erase(order_.back().first);
    order_.pop_back();
  }
}

std::optional<vinfer::core::BatchResult> RequestTracker::get(const std::string& request_id) {
  std::lock_guard lock(mutex_);
  auto it = index_.find(request_id);
  if (it == index_.end()) return std::nullopt;
  order_.splice(order_.begin(), order_, it->second);
  return it->second->second;
}

std::size_t RequestTracker::size() const {
  std::lock_guard lock(mutex_);
  return order_.size();
}

}  // namespace vinfer::app
