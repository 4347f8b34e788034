#pragma once

#include <string>
#include <string_view>

namespace vinfer::core {

/// Error codes; used with std::expected for recoverable failures.
/// UnsupportedScheme / TransportFailed / DecodeFailed are source errors and
/// InferenceFailed is a model error; all four are scoped to one batch item.
enum class ErrorCode {
  None = 0,
  UnsupportedScheme,
  TransportFailed,
  DecodeFailed,
  InferenceFailed,
  DeliveryFailed,
  Unauthorized,
  InvalidRequest,
  InvalidConfig,
  NotFound,
};

/// Error code plus a human-readable reason.
struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

/// Stable snake_case kind string (used as "error_kind" on the wire).
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/// Inverse of to_string; None for unknown kinds.
[[nodiscard]] ErrorCode error_code_from_string(std::string_view kind) noexcept;

/// True for the per-item errors that become a Failure outcome.
[[nodiscard]] bool is_item_error(ErrorCode code) noexcept;

}  // namespace vinfer::core
