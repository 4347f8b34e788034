#include <vinfer/vision/model.hpp>

namespace vinfer::vision {

std::expected<void, vinfer::core::Error>
IModel::validate_input(const vinfer::core::Frame& image) const {
  if (image.empty() || image.width() == 0 || image.height() == 0) {
    return std::unexpected(vinfer::core::Error{vinfer::core::ErrorCode::InferenceFailed,
                                               "empty image"});
  }
  return {};
}

}  // namespace vinfer::vision
