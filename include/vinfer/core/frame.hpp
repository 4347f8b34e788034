#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace vinfer::core {

/// Pixel layout of a decoded image. Decoding always produces BGR8; the other
/// layouts are accepted by models that convert on their own.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
};

/// Decoded image owned by one in-flight batch item.
///
/// Pixels are 8-bit, row-major and tightly packed (no row padding). A Frame is
/// moved from the resolver to the executor and never shared between items, so
/// it carries no synchronization of its own.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width, std::uint32_t height, PixelFormat format,
        std::vector<std::byte> pixels)
      : width_(width), height_(height), format_(format), pixels_(std::move(pixels)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return channels(format_); }

  [[nodiscard]] std::span<std::byte> data() noexcept { return pixels_; }
  [[nodiscard]] std::span<const std::byte> data() const noexcept { return pixels_; }

  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }

  /// True if the buffer holds at least width * height * channels bytes of a known format.
  [[nodiscard]] bool is_complete() const noexcept {
    return format_ != PixelFormat::Unknown && !pixels_.empty() &&
           pixels_.size() >= min_bytes(width_, height_, format_);
  }

  [[nodiscard]] static std::uint32_t channels(PixelFormat format) noexcept;

  /// Bytes needed for a packed image of this size; 0 for Unknown.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width, std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
};

}  // namespace vinfer::core
