#include <vinfer/vision/decode_image.hpp>
#include "frame_cv_utils.hpp"
#include <vinfer/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>

namespace vinfer::vision {

std::optional<vinfer::core::Frame> decode_image(std::span<const std::byte> encoded) {
  if (encoded.empty()) return std::nullopt;

  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  if (mat.empty()) return std::nullopt;

  return detail::frame_from_mat(mat);
}

}  // namespace vinfer::vision
