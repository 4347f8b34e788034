#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/core/frame.hpp>
#include <vinfer/core/inference_request.hpp>
#include <vinfer/vision/label_map.hpp>
#include <vinfer/vision/raw_model_output.hpp>
#include <expected>

namespace vinfer::vision {

/// Model capability: decoded image + params -> raw output.
/// Implementations must allow concurrent predict() calls; admission control
/// lives in InferenceExecutor, not here. predict() may also throw; the
/// executor treats a thrown std::exception like an InferenceFailed error.
class IModel {
 public:
  virtual ~IModel() = default;

  /// Single-image inference. Must be implemented.
  [[nodiscard]] virtual std::expected<RawModelOutput, vinfer::core::Error>
  predict(const vinfer::core::Frame& image, const vinfer::core::PredictParams& params) = 0;

  /// Class id -> label mapping bundled with the model.
  [[nodiscard]] virtual const LabelMap& labels() const = 0;

  /// Optional: validate image before predict. Default: reject empty frames.
  [[nodiscard]] virtual std::expected<void, vinfer::core::Error>
  validate_input(const vinfer::core::Frame& image) const;

  /// Optional: warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace vinfer::vision
