#include <vinfer/core/frame.hpp>

namespace vinfer::core {

std::uint32_t Frame::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
      break;
  }
  return 0;
}

std::size_t Frame::min_bytes(std::uint32_t width, std::uint32_t height,
                             PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * channels(format);
}

}  // namespace vinfer::core
