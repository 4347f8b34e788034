#pragma once

#include <vinfer/core/error.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace vinfer::core {

/// Task discriminant of a successful outcome.
enum class TaskKind : std::uint8_t {
  Classification,
  Detection,
};

[[nodiscard]] inline const char* to_string(TaskKind task) noexcept {
  return task == TaskKind::Classification ? "classification" : "detection";
}

/// Per-stage wall time of one model call, in milliseconds (each >= 0).
struct StageTimings {
  double preprocess_ms{0.0};
  double inference_ms{0.0};
  double postprocess_ms{0.0};
};

struct ClassPrediction {
  std::int64_t class_id{0};
  std::string label;
  double score{0.0};
};

/// Top-K classes, descending by score. top_k_confidences[i] == predictions[i].score.
struct ClassificationPayload {
  std::vector<double> top_k_confidences;
  std::vector<ClassPrediction> predictions;
};

/// One box in original image pixel coordinates (x1, y1, x2, y2).
struct Detection {
  std::array<double, 4> bbox_xyxy{};
  double score{0.0};
  std::int64_t class_id{0};
  std::string label;
};

/// Detections in model-native order.
struct DetectionPayload {
  std::vector<Detection> detections;
};

/// Closed set of task payloads; the variant index is the task tag.
using TaskPayload = std::variant<ClassificationPayload, DetectionPayload>;

[[nodiscard]] inline TaskKind task_of(const TaskPayload& payload) noexcept {
  return std::holds_alternative<ClassificationPayload>(payload) ? TaskKind::Classification
                                                                : TaskKind::Detection;
}

struct InferenceSuccess {
  std::string source;
  TaskPayload payload;
  StageTimings speed_ms;

  [[nodiscard]] TaskKind task() const noexcept { return task_of(payload); }
};

struct InferenceFailure {
  std::string source;
  Error error;
};

/// Exactly one outcome per input source.
using InferenceOutcome = std::variant<InferenceSuccess, InferenceFailure>;

/// Source string of either alternative.
[[nodiscard]] inline const std::string& source_of(const InferenceOutcome& outcome) noexcept {
  return std::visit([](const auto& o) -> const std::string& { return o.source; }, outcome);
}

/// The unit returned to a synchronous caller or posted to a callback.
struct BatchResult {
  std::string request_id;
  std::vector<InferenceOutcome> results;
};

}  // namespace vinfer::core
