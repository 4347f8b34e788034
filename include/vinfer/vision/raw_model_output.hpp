#pragma once

#include <vinfer/core/batch_result.hpp>
#include <cstdint>
#include <variant>
#include <vector>

namespace vinfer::vision {

/// Per-class probabilities, indexed by class id.
struct ClassProbabilities {
  std::vector<float> probs;
};

/// Boxes after the model's own filtering/NMS, in model-native order.
/// boxes holds [x1,y1,x2,y2] per detection in original image pixels.
struct DetectionBoxes {
  std::vector<float> boxes;
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

/// Raw output shape of one model call.
using RawPrediction = std::variant<ClassProbabilities, DetectionBoxes>;

/// Raw model output (before normalization) plus per-stage timing.
struct RawModelOutput {
  RawPrediction prediction;
  vinfer::core::StageTimings speed;
};

}  // namespace vinfer::vision
