#include <vinfer/vision/inference_executor.hpp>
#include <vinfer/core/log.hpp>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>

namespace vinfer::vision {

namespace {

namespace vc = vinfer::core;

/// Holds one admission slot for its lifetime.
class AdmissionPermit {
 public:
  AdmissionPermit(std::counting_semaphore<>& sem, std::atomic<std::size_t>& in_flight)
      : sem_(sem), in_flight_(in_flight) {
    sem_.acquire();
    in_flight_.fetch_add(1);
  }
  ~AdmissionPermit() {
    in_flight_.fetch_sub(1);
    sem_.release();
  }

  AdmissionPermit(const AdmissionPermit&) = delete;
  AdmissionPermit& operator=(const AdmissionPermit&) = delete;

 private:
  std::counting_semaphore<>& sem_;
  std::atomic<std::size_t>& in_flight_;
};

double sanitize_ms(double ms) {
  return std::isfinite(ms) && ms > 0.0 ? ms : 0.0;
}

std::ptrdiff_t checked_slots(std::size_t max_inflight) {
  if (max_inflight == 0 ||
      max_inflight > static_cast<std::size_t>(std::counting_semaphore<>::max())) {
    throw std::invalid_argument("InferenceExecutor: max_inflight out of range");
  }
  return static_cast<std::ptrdiff_t>(max_inflight);
}

}  // namespace

InferenceExecutor::InferenceExecutor(std::shared_ptr<IModel> model,
                                     std::size_t max_inflight,
                                     vinfer::core::PredictParams defaults)
    : model_(std::move(model)),
      max_inflight_(max_inflight),
      defaults_(defaults),
      admission_(checked_slots(max_inflight)) {
  if (!model_) {
    throw std::invalid_argument("InferenceExecutor: model is null");
  }
}

std::expected<RawModelOutput, vinfer::core::Error>
InferenceExecutor::infer(const vinfer::core::Frame& image,
                         const vinfer::core::InferenceParams& params) {
  const vc::PredictParams resolved = vc::resolve_params(params, defaults_);

  std::expected<RawModelOutput, vc::Error> result;
  {
    AdmissionPermit permit(admission_, in_flight_);
    try {
      result = model_->predict(image, resolved);
    } catch (const std::exception& e) {
      VINFER_LOGW("model raised: ", e.what());
      return std::unexpected(vc::Error{vc::ErrorCode::InferenceFailed, e.what()});
    }
  }

  if (!result) {
    if (result.error().code != vc::ErrorCode::InferenceFailed) {
      result.error().code = vc::ErrorCode::InferenceFailed;
    }
    return result;
  }
  result->speed.preprocess_ms = sanitize_ms(result->speed.preprocess_ms);
  result->speed.inference_ms = sanitize_ms(result->speed.inference_ms);
  result->speed.postprocess_ms = sanitize_ms(result->speed.postprocess_ms);
  return result;
}

}  // namespace vinfer::vision
