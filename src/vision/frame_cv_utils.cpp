#include "frame_cv_utils.hpp"
#include <vinfer/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace vinfer::vision::detail {

namespace vc = vinfer::core;

std::optional<cv::Mat> mat_view(const vc::Frame& frame) {
  if (!frame.is_complete()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* ptr = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case vc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, ptr);
    case vc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, ptr);
    case vc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, ptr);
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

vc::Frame frame_from_mat(const cv::Mat& mat) {
  if (mat.empty() || mat.depth() != CV_8U) return vc::Frame();

  vc::PixelFormat format = vc::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1: format = vc::PixelFormat::Grayscale8; break;
    case 3: format = vc::PixelFormat::BGR8; break;
    case 4: format = vc::PixelFormat::BGRA8; break;
    default: return vc::Frame();
  }

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return vc::Frame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace vinfer::vision::detail
