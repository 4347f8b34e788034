#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/core/frame.hpp>
#include <vinfer/core/inference_request.hpp>
#include <vinfer/vision/model.hpp>
#include <vinfer/vision/raw_model_output.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <semaphore>

namespace vinfer::vision {

/// Wraps the model capability behind an admission semaphore of size max_inflight.
///
/// infer() blocks until a slot is free, runs exactly one predict() and releases
/// the slot on every exit path (success, error return, thrown exception). No
/// other lock is held while the model runs. Shared by all concurrent batches.
class InferenceExecutor {
 public:
  /// \param model Model capability; must outlive nothing else (shared ownership).
  /// \param max_inflight Maximum concurrent predict() calls (>= 1).
  /// \param defaults Parameters used where a request leaves a field unset.
  /// \throws std::invalid_argument if model is null or max_inflight is 0.
  InferenceExecutor(std::shared_ptr<IModel> model,
                    std::size_t max_inflight,
                    vinfer::core::PredictParams defaults = {});

  InferenceExecutor(const InferenceExecutor&) = delete;
  InferenceExecutor& operator=(const InferenceExecutor&) = delete;

  /// One inference call. Model failures and exceptions become InferenceFailed.
  [[nodiscard]] std::expected<RawModelOutput, vinfer::core::Error>
  infer(const vinfer::core::Frame& image, const vinfer::core::InferenceParams& params);

  [[nodiscard]] std::size_t max_inflight() const noexcept { return max_inflight_; }

  /// Calls currently holding a slot.
  [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_.load(); }

  [[nodiscard]] const vinfer::core::PredictParams& defaults() const noexcept { return defaults_; }

  [[nodiscard]] const IModel& model() const noexcept { return *model_; }

 private:
  std::shared_ptr<IModel> model_;
  std::size_t max_inflight_;
  vinfer::core::PredictParams defaults_;
  std::counting_semaphore<> admission_;
  std::atomic<std::size_t> in_flight_{0};
};

}  // namespace vinfer::vision
