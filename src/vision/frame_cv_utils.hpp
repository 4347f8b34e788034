#pragma once

#include <vinfer/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace vinfer::vision::detail {

/// cv::Mat header over the frame's pixels; no copy. The view is only valid
/// while \p frame is alive and unmodified. nullopt for incomplete frames.
std::optional<cv::Mat> mat_view(const vinfer::core::Frame& frame);

/// Packed copy of an 8-bit 1, 3 or 4 channel Mat. Empty Frame for other types.
vinfer::core::Frame frame_from_mat(const cv::Mat& mat);

}  // namespace vinfer::vision::detail
