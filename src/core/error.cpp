#include <vinfer/core/error.hpp>

namespace vinfer::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::UnsupportedScheme:
      return "unsupported_scheme";
    case ErrorCode::TransportFailed:
      return "transport";
    case ErrorCode::DecodeFailed:
      return "decode";
    case ErrorCode::InferenceFailed:
      return "model";
    case ErrorCode::DeliveryFailed:
      return "delivery";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::InvalidRequest:
      return "invalid_request";
    case ErrorCode::InvalidConfig:
      return "config";
    case ErrorCode::NotFound:
      return "not_found";
  }
  return "unknown";
}

ErrorCode error_code_from_string(std::string_view kind) noexcept {
  constexpr ErrorCode kAll[] = {
      ErrorCode::UnsupportedScheme, ErrorCode::TransportFailed, ErrorCode::DecodeFailed,
      ErrorCode::InferenceFailed,   ErrorCode::DeliveryFailed,  ErrorCode::Unauthorized,
      ErrorCode::InvalidRequest,    ErrorCode::InvalidConfig,   ErrorCode::NotFound,
  };
  for (ErrorCode code : kAll) {
    if (to_string(code) == kind) return code;
  }
  return ErrorCode::None;
}

bool is_item_error(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::UnsupportedScheme:
    case ErrorCode::TransportFailed:
    case ErrorCode::DecodeFailed:
    case ErrorCode::InferenceFailed:
      return true;
    default:
      return false;
  }
}

}  // namespace vinfer::core
