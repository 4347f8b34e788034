#pragma once

#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <vector>

namespace vinfer::vision {

/// Image placed on a fixed-size canvas with preserved aspect ratio.
/// Original pixel (x, y) maps to canvas (x * scale + pad_x, y * scale + pad_y).
struct Letterbox {
  cv::Mat image;
  float scale{1.f};
  float pad_x{0.f};
  float pad_y{0.f};
};

/// Resize \p bgr to fit target_width x target_height keeping aspect ratio and
/// pad the remainder with gray (114), centered.
[[nodiscard]] Letterbox letterbox(const cv::Mat& bgr,
                                  std::uint32_t target_width,
                                  std::uint32_t target_height);

/// Plain (aspect-distorting) resize; no-op copy when already at the target size.
[[nodiscard]] cv::Mat resize_to(const cv::Mat& bgr,
                                std::uint32_t target_width,
                                std::uint32_t target_height);

/// BGR8 HWC -> RGB float32 NCHW scaled to [0, 1], batch of one.
[[nodiscard]] std::vector<float> to_nchw_rgb(const cv::Mat& bgr);

/// Round up to a multiple of \p stride (minimum one stride).
[[nodiscard]] std::uint32_t round_up_to_stride(std::uint32_t value, std::uint32_t stride) noexcept;

}  // namespace vinfer::vision
