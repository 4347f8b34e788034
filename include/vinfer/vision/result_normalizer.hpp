#pragma once

#include <vinfer/core/batch_result.hpp>
#include <vinfer/vision/label_map.hpp>
#include <vinfer/vision/raw_model_output.hpp>
#include <cstddef>
#include <optional>

namespace vinfer::vision {

struct NormalizerOptions {
  /// Classes kept for a classification result.
  std::size_t top_k{5};
  /// Decimal places kept for every floating value.
  int precision{5};
  /// Optional extra score floor for detections (the model already applied conf).
  std::optional<float> min_score;
};

/// Task-tagged, rounded record for one image.
struct NormalizedResult {
  vinfer::core::TaskKind task{vinfer::core::TaskKind::Classification};
  vinfer::core::TaskPayload payload;
  vinfer::core::StageTimings speed_ms;
};

/// Decodes RawModelOutput -> NormalizedResult.
///
/// Class probabilities become the top-K classes sorted by descending score
/// (ties keep the lower class id first). Boxes keep model-native order and are
/// only dropped by min_score. Labels come from the model's LabelMap.
class ResultNormalizer {
 public:
  ResultNormalizer(NormalizerOptions options, LabelMap labels);

  [[nodiscard]] NormalizedResult normalize(const RawModelOutput& raw) const;

  [[nodiscard]] const NormalizerOptions& options() const noexcept { return options_; }

 private:
  [[nodiscard]] vinfer::core::ClassificationPayload
  normalize_classification(const ClassProbabilities& probs) const;

  [[nodiscard]] vinfer::core::DetectionPayload
  normalize_detection(const DetectionBoxes& boxes) const;

  NormalizerOptions options_;
  LabelMap labels_;
};

}  // namespace vinfer::vision
