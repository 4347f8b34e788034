#include <vinfer/vision/box_postprocess.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>

namespace vinfer::vision {

namespace {

std::int64_t class_id_at(const ClassIdView& ids, std::size_t i) {
  return std::visit(
      [i](auto view) -> std::int64_t {
        using T = typename decltype(view)::value_type;
        if constexpr (std::is_floating_point_v<T>) {
          return static_cast<std::int64_t>(std::lround(view[i]));
        } else {
          return static_cast<std::int64_t>(view[i]);
        }
      },
      ids);
}

std::size_t class_id_count(const ClassIdView& ids) {
  return std::visit([](auto view) { return view.size(); }, ids);
}

}  // namespace

float box_iou(const BoxCandidate& a, const BoxCandidate& b) noexcept {
  const float ix1 = std::max(a.x1, b.x1);
  const float iy1 = std::max(a.y1, b.y1);
  const float ix2 = std::min(a.x2, b.x2);
  const float iy2 = std::min(a.y2, b.y2);
  const float iw = std::max(0.f, ix2 - ix1);
  const float ih = std::max(0.f, iy2 - iy1);
  const float inter = iw * ih;
  const float area_a = std::max(0.f, a.x2 - a.x1) * std::max(0.f, a.y2 - a.y1);
  const float area_b = std::max(0.f, b.x2 - b.x1) * std::max(0.f, b.y2 - b.y1);
  const float uni = area_a + area_b - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

std::vector<BoxCandidate> nms(std::vector<BoxCandidate> candidates, const NmsConfig& config) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const BoxCandidate& a, const BoxCandidate& b) { return a.score > b.score; });

  std::vector<BoxCandidate> kept;
  std::vector<bool> suppressed(candidates.size(), false);
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (suppressed[i]) continue;
    kept.push_back(candidates[i]);
    if (config.max_det > 0 && kept.size() >= config.max_det) break;

    for (std::size_t j = i + 1; j < candidates.size(); ++j) {
      if (suppressed[j] || candidates[i].class_id != candidates[j].class_id) continue;
      if (box_iou(candidates[i], candidates[j]) > config.iou_threshold) {
        suppressed[j] = true;
      }
    }
  }
  return kept;
}

std::vector<BoxCandidate> decode_yolo_head(const float* data,
                                           std::int64_t num_attrs,
                                           std::int64_t num_anchors,
                                           float conf_threshold) {
  std::vector<BoxCandidate> out;
  const std::int64_t num_classes = num_attrs - 4;
  if (data == nullptr || num_classes <= 0 || num_anchors <= 0) return out;

  for (std::int64_t i = 0; i < num_anchors; ++i) {
    std::int64_t best_class = 0;
    float best_score = data[4 * num_anchors + i];
    for (std::int64_t c = 1; c < num_classes; ++c) {
      const float s = data[(4 + c) * num_anchors + i];
      if (s > best_score) {
        best_score = s;
        best_class = c;
      }
    }
    if (best_score < conf_threshold) continue;

    const float cx = data[0 * num_anchors + i];
    const float cy = data[1 * num_anchors + i];
    const float w = data[2 * num_anchors + i];
    const float h = data[3 * num_anchors + i];
    out.push_back({cx - w / 2.f, cy - h / 2.f, cx + w / 2.f, cy + h / 2.f, best_score, best_class});
  }
  return out;
}

std::vector<BoxCandidate> filter_end_to_end(const float* data,
                                            std::int64_t rows,
                                            float conf_threshold) {
  std::vector<BoxCandidate> out;
  if (data == nullptr || rows <= 0) return out;
  for (std::int64_t i = 0; i < rows; ++i) {
    const float* row = data + i * 6;
    if (row[4] < conf_threshold) continue;
    out.push_back({row[0], row[1], row[2], row[3], row[4],
                   static_cast<std::int64_t>(std::lround(row[5]))});
  }
  return out;
}

std::expected<std::vector<BoxCandidate>, core::Error> gather_three_outputs(
    std::span<const float> boxes,
    std::span<const float> scores,
    const ClassIdView& class_ids,
    float conf_threshold) {
  const std::size_t n = scores.size();
  if (boxes.size() < n * 4u) {
    return std::unexpected(core::Error{
        core::ErrorCode::InferenceFailed,
        "boxes output holds " + std::to_string(boxes.size()) + " values for " +
            std::to_string(n) + " scores"});
  }
  if (class_id_count(class_ids) < n) {
    return std::unexpected(core::Error{
        core::ErrorCode::InferenceFailed,
        "class_ids output holds " + std::to_string(class_id_count(class_ids)) +
            " values for " + std::to_string(n) + " scores"});
  }

  std::vector<BoxCandidate> out;
  for (std::size_t i = 0; i < n; ++i) {
    if (scores[i] < conf_threshold) continue;
    const float* row = boxes.data() + i * 4;
    out.push_back({row[0], row[1], row[2], row[3], scores[i], class_id_at(class_ids, i)});
  }
  return out;
}

void unletterbox(std::vector<BoxCandidate>& boxes,
                 float scale,
                 float pad_x,
                 float pad_y,
                 std::uint32_t image_width,
                 std::uint32_t image_height) {
  if (scale <= 0.f) return;
  const float max_x = static_cast<float>(image_width);
  const float max_y = static_cast<float>(image_height);
  for (auto& b : boxes) {
    b.x1 = std::clamp((b.x1 - pad_x) / scale, 0.f, max_x);
    b.y1 = std::clamp((b.y1 - pad_y) / scale, 0.f, max_y);
    b.x2 = std::clamp((b.x2 - pad_x) / scale, 0.f, max_x);
    b.y2 = std::clamp((b.y2 - pad_y) / scale, 0.f, max_y);
  }
}

DetectionBoxes to_detection_boxes(const std::vector<BoxCandidate>& boxes) {
  DetectionBoxes out;
  out.num_detections = static_cast<std::uint32_t>(boxes.size());
  out.boxes.reserve(boxes.size() * 4u);
  out.scores.reserve(boxes.size());
  out.class_ids.reserve(boxes.size());
  for (const auto& b : boxes) {
    out.boxes.push_back(b.x1);
    out.boxes.push_back(b.y1);
    out.boxes.push_back(b.x2);
    out.boxes.push_back(b.y2);
    out.scores.push_back(b.score);
    out.class_ids.push_back(b.class_id);
  }
  return out;
}

}  // namespace vinfer::vision
