#include <vinfer/vision/mock_model.hpp>
#include <vinfer/core/error.hpp>
#include <stdexcept>
#include <thread>

namespace vinfer::vision {

void MockModel::set_prediction(RawPrediction prediction) {
  std::lock_guard lock(mutex_);
  prediction_ = std::move(prediction);
}

void MockModel::set_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  delay_ = delay;
}

void MockModel::set_failure(std::optional<std::string> message) {
  std::lock_guard lock(mutex_);
  failure_ = std::move(message);
}

void MockModel::set_throw(bool should_throw) {
  std::lock_guard lock(mutex_);
  throw_ = should_throw;
}

std::expected<RawModelOutput, vinfer::core::Error>
MockModel::predict(const vinfer::core::Frame& image, const vinfer::core::PredictParams& /*params*/) {
  calls_.fetch_add(1);
  const std::size_t now = in_flight_.fetch_add(1) + 1;
  std::size_t prev = peak_.load();
  while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
  }

  RawModelOutput out;
  std::chrono::milliseconds delay;
  std::optional<std::string> failure;
  bool should_throw = false;
  {
    std::lock_guard lock(mutex_);
    out.prediction = prediction_;
    delay = delay_;
    failure = failure_;
    should_throw = throw_;
  }

  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  in_flight_.fetch_sub(1);

  if (should_throw) {
    throw std::runtime_error("mock model exploded");
  }
  if (failure) {
    return std::unexpected(vinfer::core::Error{vinfer::core::ErrorCode::InferenceFailed, *failure});
  }
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  out.speed.preprocess_ms = 0.1;
  out.speed.inference_ms = static_cast<double>(delay.count());
  out.speed.postprocess_ms = 0.1;
  return out;
}

}  // namespace vinfer::vision
