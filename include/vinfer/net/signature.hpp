#pragma once

#include <string>
#include <string_view>

namespace vinfer::net {

/// Header carrying the callback signature.
inline constexpr std::string_view kSignatureHeader = "X-Signature";

/// Lowercase hex HMAC-SHA256 of \p payload keyed with \p secret.
[[nodiscard]] std::string hmac_sha256_hex(std::string_view secret, std::string_view payload);

/// Header value "sha256=<hex>" for \p payload.
[[nodiscard]] std::string signature_header_value(std::string_view secret, std::string_view payload);

/// True if \p header_value is the signature of \p payload under \p secret.
/// Comparison runs in constant time.
[[nodiscard]] bool verify_signature(std::string_view secret,
                                    std::string_view payload,
                                    std::string_view header_value);

/// Length-checked constant-time equality (for tokens and signatures).
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace vinfer::net
