#pragma once

namespace vinfer::core {

/// Round half away from zero to \p precision decimal places. Idempotent;
/// non-finite values are returned unchanged.
[[nodiscard]] double round_to(double value, int precision) noexcept;

}  // namespace vinfer::core
