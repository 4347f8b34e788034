#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/core/inference_request.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace vinfer::app {

/// Whether a request body must carry a callback_url.
enum class DeliveryMode {
  Async,  // POST /infer
  Sync,   // POST /infer_sync
};

/// Parse an /infer or /infer_sync JSON body.
///
/// Fields: "urls" (array of strings, "sources" accepted as an alias),
/// "request_id" (optional; a UUIDv4 is generated when absent or empty),
/// "callback_url" (required and http(s) for Async, ignored for Sync), and
/// imgsz / conf / iou either inside "params" or at the top level (nested wins).
/// InvalidRequest on malformed JSON, wrong types or out-of-range values.
[[nodiscard]] std::expected<vinfer::core::InferenceRequest, vinfer::core::Error>
parse_infer_request(std::string_view body, DeliveryMode mode);

/// Range checks for per-request overrides: imgsz in [1, 8192], conf and iou in [0, 1].
[[nodiscard]] std::expected<void, vinfer::core::Error>
validate_params(const vinfer::core::InferenceParams& params);

/// Random RFC 4122 version 4 UUID, lowercase.
std::string generate_request_id();

/// Bearer check against \p expected_token. An empty expected token disables
/// the check. Unauthorized when the header is missing, malformed or wrong.
[[nodiscard]] std::expected<void, vinfer::core::Error>
check_bearer(std::string_view expected_token, std::string_view authorization_header);

}  // namespace vinfer::app
