#include <vinfer/vision/result_normalizer.hpp>
#include <vinfer/core/rounding.hpp>
#include <algorithm>
#include <numeric>
#include <type_traits>
#include <vector>

namespace vinfer::vision {

namespace vc = vinfer::core;
using vinfer::core::round_to;

ResultNormalizer::ResultNormalizer(NormalizerOptions options, LabelMap labels)
    : options_(options), labels_(std::move(labels)) {}

NormalizedResult ResultNormalizer::normalize(const RawModelOutput& raw) const {
  NormalizedResult out;
  out.payload = std::visit(
      [this](const auto& prediction) -> vc::TaskPayload {
        using T = std::decay_t<decltype(prediction)>;
        if constexpr (std::is_same_v<T, ClassProbabilities>) {
          return normalize_classification(prediction);
        } else {
          static_assert(std::is_same_v<T, DetectionBoxes>, "unhandled raw prediction shape");
          return normalize_detection(prediction);
        }
      },
      raw.prediction);
  out.task = vc::task_of(out.payload);

  const int p = options_.precision;
  out.speed_ms.preprocess_ms = round_to(raw.speed.preprocess_ms, p);
  out.speed_ms.inference_ms = round_to(raw.speed.inference_ms, p);
  out.speed_ms.postprocess_ms = round_to(raw.speed.postprocess_ms, p);
  return out;
}

vc::ClassificationPayload ResultNormalizer::normalize_classification(
    const ClassProbabilities& probs) const {
  vc::ClassificationPayload out;
  std::vector<std::size_t> order(probs.probs.size());
  std::iota(order.begin(), order.end(), std::size_t{0});

  const std::size_t k = std::min(options_.top_k, order.size());
  std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
                    [&probs](std::size_t a, std::size_t b) {
                      if (probs.probs[a] != probs.probs[b]) return probs.probs[a] > probs.probs[b];
                      return a < b;
                    });

  out.top_k_confidences.reserve(k);
  out.predictions.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    const auto cid = static_cast<std::int64_t>(order[i]);
    const double score = round_to(probs.probs[order[i]], options_.precision);
    out.top_k_confidences.push_back(score);
    out.predictions.push_back({cid, labels_.label_for(cid), score});
  }
  return out;
}

vc::DetectionPayload ResultNormalizer::normalize_detection(const DetectionBoxes& boxes) const {
  vc::DetectionPayload out;
  const std::size_t n = static_cast<std::size_t>(boxes.num_detections);
  const int p = options_.precision;

  for (std::size_t i = 0; i < n; ++i) {
    if (i * 4 + 3 >= boxes.boxes.size()) break;
    const float score = i < boxes.scores.size() ? boxes.scores[i] : 0.f;
    if (options_.min_score && !(score >= *options_.min_score)) {
      continue;
    }

    vc::Detection d;
    for (std::size_t c = 0; c < 4; ++c) {
      d.bbox_xyxy[c] = round_to(boxes.boxes[i * 4 + c], p);
    }
    d.score = round_to(score, p);
    d.class_id = i < boxes.class_ids.size() ? boxes.class_ids[i] : 0;
    d.label = labels_.label_for(d.class_id);
    out.detections.push_back(std::move(d));
  }
  return out;
}

}  // namespace vinfer::vision
