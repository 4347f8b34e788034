#pragma once

#include <vinfer/vision/label_map.hpp>
#include <vinfer/vision/model.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace vinfer::vision {

/// Mock model that returns a configurable raw output (for tests/demo).
/// Records the number of concurrent predict() calls so admission control can
/// be observed from outside. Thread-safe.
class MockModel : public IModel {
 public:
  MockModel() = default;
  explicit MockModel(LabelMap labels) : labels_(std::move(labels)) {}

  /// Set the raw prediction returned by subsequent predict() calls.
  void set_prediction(RawPrediction prediction);

  /// Sleep this long inside each predict() call (simulates model latency).
  void set_delay(std::chrono::milliseconds delay);

  /// Return InferenceFailed with \p message from predict(); nullopt clears.
  void set_failure(std::optional<std::string> message);

  /// Throw std::runtime_error from predict() when true.
  void set_throw(bool should_throw);

  [[nodiscard]] std::expected<RawModelOutput, vinfer::core::Error>
  predict(const vinfer::core::Frame& image, const vinfer::core::PredictParams& params) override;

  [[nodiscard]] const LabelMap& labels() const override { return labels_; }

  /// Highest number of predict() calls observed running at the same time.
  [[nodiscard]] std::size_t peak_concurrency() const noexcept { return peak_.load(); }
  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  LabelMap labels_;
  mutable std::mutex mutex_;
  RawPrediction prediction_{ClassProbabilities{}};
  std::chrono::milliseconds delay_{0};
  std::optional<std::string> failure_;
  bool throw_{false};

  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_{0};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace vinfer::vision
