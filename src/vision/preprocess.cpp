#include <vinfer/vision/preprocess.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace vinfer::vision {

namespace {

constexpr int kNumChannels = 3;
constexpr double kPadValue = 114.0;

}  // namespace

Letterbox letterbox(const cv::Mat& bgr,
                    std::uint32_t target_width,
                    std::uint32_t target_height) {
  Letterbox out;
  const float sx = static_cast<float>(target_width) / static_cast<float>(bgr.cols);
  const float sy = static_cast<float>(target_height) / static_cast<float>(bgr.rows);
  out.scale = std::min(sx, sy);

  const int new_w = std::max(1, static_cast<int>(std::lround(bgr.cols * out.scale)));
  const int new_h = std::max(1, static_cast<int>(std::lround(bgr.rows * out.scale)));

  cv::Mat resized;
  if (new_w == bgr.cols && new_h == bgr.rows) {
    resized = bgr;
  } else {
    cv::resize(bgr, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);
  }

  const int pad_w = static_cast<int>(target_width) - new_w;
  const int pad_h = static_cast<int>(target_height) - new_h;
  const int left = pad_w / 2;
  const int top = pad_h / 2;
  cv::copyMakeBorder(resized, out.image, top, pad_h - top, left, pad_w - left,
                     cv::BORDER_CONSTANT, cv::Scalar(kPadValue, kPadValue, kPadValue));
  out.pad_x = static_cast<float>(left);
  out.pad_y = static_cast<float>(top);
  return out;
}

cv::Mat resize_to(const cv::Mat& bgr,
                  std::uint32_t target_width,
                  std::uint32_t target_height) {
  if (static_cast<std::uint32_t>(bgr.cols) == target_width &&
      static_cast<std::uint32_t>(bgr.rows) == target_height) {
    return bgr.clone();
  }
  cv::Mat out;
  cv::resize(bgr, out,
             cv::Size(static_cast<int>(target_width), static_cast<int>(target_height)),
             0, 0, cv::INTER_LINEAR);
  return out;
}

std::vector<float> to_nchw_rgb(const cv::Mat& bgr) {
  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  cv::Mat as_float;
  rgb.convertTo(as_float, CV_32FC3, 1.0 / 255.0);

  const std::size_t h = static_cast<std::size_t>(as_float.rows);
  const std::size_t w = static_cast<std::size_t>(as_float.cols);
  const std::size_t hw = h * w;
  std::vector<float> nchw(hw * kNumChannels);
  for (std::size_t y = 0; y < h; ++y) {
    const float* row = as_float.ptr<float>(static_cast<int>(y));
    for (std::size_t x = 0; x < w; ++x) {
      nchw[0 * hw + y * w + x] = row[x * kNumChannels + 0];
      nchw[1 * hw + y * w + x] = row[x * kNumChannels + 1];
      nchw[2 * hw + y * w + x] = row[x * kNumChannels + 2];
    }
  }
  return nchw;
}

std::uint32_t round_up_to_stride(std::uint32_t value, std::uint32_t stride) noexcept {
  if (stride == 0) return value;
  const std::uint32_t n = (value + stride - 1) / stride;
  return std::max<std::uint32_t>(n, 1) * stride;
}

}  // namespace vinfer::vision
