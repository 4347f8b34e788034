#pragma once

#include <vinfer/core/frame.hpp>
#include <cstddef>
#include <optional>
#include <span>

namespace vinfer::vision {

/// Decode encoded image bytes (JPEG, PNG, BMP, WebP, ...) into a BGR8 Frame.
/// Grayscale and alpha images are converted to three channels. Returns nullopt
/// if the bytes are not a decodable image.
std::optional<vinfer::core::Frame> decode_image(std::span<const std::byte> encoded);

}  // namespace vinfer::vision
