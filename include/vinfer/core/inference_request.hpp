#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vinfer::core {

/// Per-request overrides; unset fields fall back to the service defaults.
struct InferenceParams {
  std::optional<std::uint32_t> imgsz;
  std::optional<float> conf;
  std::optional<float> iou;
};

/// Fully resolved parameters handed to the model for one call.
struct PredictParams {
  std::uint32_t imgsz{640};
  float conf{0.25f};
  float iou{0.45f};
};

/// Fill unset fields of \p params from \p defaults.
[[nodiscard]] inline PredictParams resolve_params(const InferenceParams& params,
                                                  const PredictParams& defaults) {
  PredictParams out = defaults;
  if (params.imgsz) out.imgsz = *params.imgsz;
  if (params.conf) out.conf = *params.conf;
  if (params.iou) out.iou = *params.iou;
  return out;
}

/// One accepted job. Sources are positional: results come back in this order.
/// No callback_url means synchronous mode.
struct InferenceRequest {
  std::string request_id;
  std::vector<std::string> sources;
  std::optional<std::string> callback_url;
  InferenceParams params;
};

}  // namespace vinfer::core
