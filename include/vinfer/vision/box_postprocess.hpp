#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/vision/raw_model_output.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <variant>
#include <vector>

namespace vinfer::vision {

/// Axis-aligned box candidate (x1, y1, x2, y2) with score and class.
struct BoxCandidate {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};
  float score{0.f};
  std::int64_t class_id{0};
};

struct NmsConfig {
  float iou_threshold{0.45f};
  std::size_t max_det{300};
};

[[nodiscard]] float box_iou(const BoxCandidate& a, const BoxCandidate& b) noexcept;

/// Class-aware greedy NMS. Output is in descending score order, at most max_det boxes.
[[nodiscard]] std::vector<BoxCandidate> nms(std::vector<BoxCandidate> candidates,
                                            const NmsConfig& config);

/// Decode a raw YOLO head laid out [4 + C, N] (attribute-major): center x,
/// center y, width, height, then C class scores per anchor. Keeps anchors whose
/// best class score is >= conf_threshold.
[[nodiscard]] std::vector<BoxCandidate> decode_yolo_head(const float* data,
                                                         std::int64_t num_attrs,
                                                         std::int64_t num_anchors,
                                                         float conf_threshold);

/// Rows of an end-to-end head laid out [N, 6]: x1, y1, x2, y2, score, class.
/// The model already ran NMS; only rows with score >= conf_threshold are kept.
[[nodiscard]] std::vector<BoxCandidate> filter_end_to_end(const float* data,
                                                          std::int64_t rows,
                                                          float conf_threshold);

/// Class id tensor of a boxes/scores/class_ids model. Exporters emit int64,
/// int32 or float ids.
using ClassIdView = std::variant<std::span<const std::int64_t>,
                                 std::span<const std::int32_t>,
                                 std::span<const float>>;

/// Zip boxes [N, 4], scores [N] and class ids [N] into candidates with
/// score >= conf_threshold. InferenceFailed when boxes or ids hold fewer
/// than N entries.
[[nodiscard]] std::expected<std::vector<BoxCandidate>, core::Error> gather_three_outputs(
    std::span<const float> boxes,
    std::span<const float> scores,
    const ClassIdView& class_ids,
    float conf_threshold);

/// Map boxes from letterboxed canvas back to original image pixels and clip.
void unletterbox(std::vector<BoxCandidate>& boxes,
                 float scale,
                 float pad_x,
                 float pad_y,
                 std::uint32_t image_width,
                 std::uint32_t image_height);

[[nodiscard]] DetectionBoxes to_detection_boxes(const std::vector<BoxCandidate>& boxes);

}  // namespace vinfer::vision
