#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/core/inference_request.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace vinfer::app {

/// Service configuration: model, admission limits, secrets, timeouts, test mode.
/// Built once at startup, validated, then passed by const reference.
struct ServiceConfig {
  std::string model_path;
  std::string device{"cpu"};
  std::string labels_path;
  vinfer::core::PredictParams predict;  // default imgsz / conf / iou

  std::size_t max_inflight{2};
  std::size_t io_concurrency{8};
  std::size_t max_jobs{4};

  std::string inbound_token;
  std::string shared_secret;

  std::chrono::milliseconds post_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds http_timeout{std::chrono::seconds(30)};
  int callback_max_retries{0};
  std::chrono::milliseconds callback_retry_backoff{1500};

  int round_precision{5};
  std::size_t top_k{5};
  std::size_t tracker_capacity{1024};

  bool test_mode{false};
  std::string host{"0.0.0.0"};
  int port{8000};
  std::string log_level{"info"};

  bool enable_s3{true};
  std::string s3_endpoint;
  std::string aws_region{"us-east-1"};
  std::string aws_access_key_id;
  std::string aws_secret_access_key;
  std::string aws_session_token;
};

/// Built-in defaults (no model path).
ServiceConfig default_config();

/// Apply one setting by its lowercase key (e.g. "max_inflight"). Unknown keys
/// and malformed values are InvalidConfig.
[[nodiscard]] std::expected<void, vinfer::core::Error>
apply_setting(ServiceConfig& config, const std::string& key, const std::string& value);

/// Load a key=value file (one per line, '#' comments) on top of \p base.
[[nodiscard]] std::expected<ServiceConfig, vinfer::core::Error>
load_config(const std::string& path, ServiceConfig base = default_config());

/// Environment lookup by variable name; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup backed by the process environment.
EnvLookup process_env();

/// Override settings from environment variables (MODEL_PATH, MAX_INFLIGHT, ...).
[[nodiscard]] std::expected<void, vinfer::core::Error>
apply_env_overrides(ServiceConfig& config, const EnvLookup& env = process_env());

/// Range and consistency checks; InvalidConfig naming the first offending field.
[[nodiscard]] std::expected<void, vinfer::core::Error> validate_config(const ServiceConfig& config);

/// defaults -> optional file -> environment -> validate.
[[nodiscard]] std::expected<ServiceConfig, vinfer::core::Error>
load_service_config(const std::optional<std::string>& path, const EnvLookup& env = process_env());

/// One-line summary for the startup log; secrets are redacted.
std::string describe(const ServiceConfig& config);

}  // namespace vinfer::app
