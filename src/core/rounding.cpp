#include <vinfer/core/rounding.hpp>
#include <cmath>

namespace vinfer::core {

double round_to(double value, int precision) noexcept {
  if (!std::isfinite(value)) return value;
  const double scale = std::pow(10.0, precision);
  const double scaled = value * scale;
  if (!std::isfinite(scaled)) return value;
  return std::round(scaled) / scale;
}

}  // namespace vinfer::core
