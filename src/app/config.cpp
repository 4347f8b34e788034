#include <vinfer/app/config.hpp>
#include <vinfer/core/log.hpp>
#include <vinfer/vision/onnx_model.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vinfer::app {

namespace {

namespace vc = vinfer::core;

/// Every settable key; the environment variable is the uppercase form.
constexpr std::array<std::string_view, 28> kKeys = {
    "model_path", "device", "labels_path", "imgsz", "conf", "iou", "max_inflight",
    "io_concurrency", "max_jobs", "inbound_token", "shared_secret", "post_timeout",
    "http_timeout", "callback_max_retries", "callback_retry_backoff", "round_precision",
    "top_k", "tracker_capacity", "test_mode", "host", "port", "log_level", "enable_s3",
    "s3_endpoint", "aws_default_region", "aws_access_key_id", "aws_secret_access_key",
    "aws_session_token",
};

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::unexpected<vc::Error> config_error(std::string message) {
  return std::unexpected(vc::Error{vc::ErrorCode::InvalidConfig, std::move(message)});
}

template <typename T>
std::expected<T, vc::Error> parse_number(const std::string& key, const std::string& value) {
  T out{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return config_error(key + ": malformed number '" + value + "'");
  }
  return out;
}

std::expected<bool, vc::Error> parse_bool(const std::string& key, const std::string& value) {
  std::string v = value;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
  return config_error(key + ": malformed boolean '" + value + "'");
}

/// Seconds (fractional allowed) to milliseconds.
std::expected<std::chrono::milliseconds, vc::Error>
parse_seconds(const std::string& key, const std::string& value) {
  auto secs = parse_number<double>(key, value);
  if (!secs) return std::unexpected(secs.error());
  if (!std::isfinite(*secs)) return config_error(key + ": not a finite duration");
  return std::chrono::milliseconds(static_cast<long long>(std::llround(*secs * 1000.0)));
}

template <typename T, typename Target>
std::expected<void, vc::Error> assign_number(Target& target, const std::string& key,
                                             const std::string& value) {
  auto parsed = parse_number<T>(key, value);
  if (!parsed) return std::unexpected(parsed.error());
  if constexpr (std::is_unsigned_v<Target> && std::is_signed_v<T>) {
    if (*parsed < 0) return config_error(key + ": must not be negative");
  }
  if constexpr (std::is_integral_v<T> && std::is_integral_v<Target>) {
    if (!std::in_range<Target>(*parsed)) return config_error(key + ": out of range");
  }
  target = static_cast<Target>(*parsed);
  return {};
}

std::string to_env_name(std::string_view key) {
  std::string name(key);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return name;
}

}  // namespace

ServiceConfig default_config() { return ServiceConfig{}; }

std::expected<void, vc::Error>
apply_setting(ServiceConfig& c, const std::string& key, const std::string& value) {
  if (key == "model_path") c.model_path = value;
  else if (key == "device") c.device = value;
  else if (key == "labels_path") c.labels_path = value;
  else if (key == "imgsz") return assign_number<long long>(c.predict.imgsz, key, value);
  else if (key == "conf") return assign_number<float>(c.predict.conf, key, value);
  else if (key == "iou") return assign_number<float>(c.predict.iou, key, value);
  else if (key == "max_inflight") return assign_number<long long>(c.max_inflight, key, value);
  else if (key == "io_concurrency") return assign_number<long long>(c.io_concurrency, key, value);
  else if (key == "max_jobs") return assign_number<long long>(c.max_jobs, key, value);
  else if (key == "inbound_token") c.inbound_token = value;
  else if (key == "shared_secret") c.shared_secret = value;
  else if (key == "post_timeout" || key == "http_timeout" || key == "callback_retry_backoff") {
    auto ms = parse_seconds(key, value);
    if (!ms) return std::unexpected(ms.error());
    if (key == "post_timeout") c.post_timeout = *ms;
    else if (key == "http_timeout") c.http_timeout = *ms;
    else c.callback_retry_backoff = *ms;
  }
  else if (key == "callback_max_retries") return assign_number<int>(c.callback_max_retries, key, value);
  else if (key == "round_precision") return assign_number<int>(c.round_precision, key, value);
  else if (key == "top_k") return assign_number<long long>(c.top_k, key, value);
  else if (key == "tracker_capacity") return assign_number<long long>(c.tracker_capacity, key, value);
  else if (key == "test_mode" || key == "enable_s3") {
    auto b = parse_bool(key, value);
    if (!b) return std::unexpected(b.error());
    (key == "test_mode" ? c.test_mode : c.enable_s3) = *b;
  }
  else if (key == "host") c.host = value;
  else if (key == "port") return assign_number<int>(c.port, key, value);
  else if (key == "log_level") c.log_level = value;
  else if (key == "s3_endpoint") c.s3_endpoint = value;
  else if (key == "aws_default_region") c.aws_region = value;
  else if (key == "aws_access_key_id") c.aws_access_key_id = value;
  else if (key == "aws_secret_access_key") c.aws_secret_access_key = value;
  else if (key == "aws_session_token") c.aws_session_token = value;
  else return config_error("unknown config key '" + key + "'");
  return {};
}

std::expected<ServiceConfig, vc::Error> load_config(const std::string& path, ServiceConfig base) {
  std::ifstream f(path);
  if (!f) return config_error("cannot open config file: " + path);

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      return config_error(path + ":" + std::to_string(line_no) + ": expected key=value");
    }
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (auto r = apply_setting(base, key, value); !r) {
      return config_error(path + ":" + std::to_string(line_no) + ": " + r.error().message);
    }
  }
  return base;
}

EnvLookup process_env() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
  };
}

std::expected<void, vc::Error> apply_env_overrides(ServiceConfig& config, const EnvLookup& env) {
  for (std::string_view key : kKeys) {
    auto value = env(to_env_name(key));
    if (!value) continue;
    if (auto r = apply_setting(config, std::string(key), *value); !r) {
      return config_error("env " + to_env_name(key) + ": " + r.error().message);
    }
  }
  return {};
}

std::expected<void, vc::Error> validate_config(const ServiceConfig& c) {
  if (c.model_path.empty()) return config_error("model_path is required");
  if (c.predict.imgsz < 1 || c.predict.imgsz > 8192) return config_error("imgsz must be in [1, 8192]");
  if (!(c.predict.conf >= 0.f && c.predict.conf <= 1.f)) return config_error("conf must be in [0, 1]");
  if (!(c.predict.iou >= 0.f && c.predict.iou <= 1.f)) return config_error("iou must be in [0, 1]");
  if (c.max_inflight < 1) return config_error("max_inflight must be >= 1");
  if (c.io_concurrency < 1) return config_error("io_concurrency must be >= 1");
  if (c.max_jobs < 1) return config_error("max_jobs must be >= 1");
  if (c.round_precision < 0 || c.round_precision > 12) {
    return config_error("round_precision must be in [0, 12]");
  }
  if (c.top_k < 1) return config_error("top_k must be >= 1");
  if (c.tracker_capacity < 1) return config_error("tracker_capacity must be >= 1");
  if (c.post_timeout.count() <= 0) return config_error("post_timeout must be positive");
  if (c.http_timeout.count() <= 0) return config_error("http_timeout must be positive");
  if (c.callback_max_retries < 0) return config_error("callback_max_retries must be >= 0");
  if (c.callback_retry_backoff.count() < 0) {
    return config_error("callback_retry_backoff must be >= 0");
  }
  if (c.port < 0 || c.port > 65535) return config_error("port must be in [0, 65535]");
  if (!vinfer::vision::parse_device(c.device)) {
    return config_error("unknown device '" + c.device + "'");
  }
  if (!vinfer::log::parse_level(c.log_level)) {
    return config_error("unknown log_level '" + c.log_level + "'");
  }
  return {};
}

std::expected<ServiceConfig, vc::Error>
load_service_config(const std::optional<std::string>& path, const EnvLookup& env) {
  ServiceConfig config = default_config();
  if (path) {
    auto loaded = load_config(*path, config);
    if (!loaded) return std::unexpected(loaded.error());
    config = std::move(*loaded);
  }
  if (auto r = apply_env_overrides(config, env); !r) return std::unexpected(r.error());
  if (auto r = validate_config(config); !r) return std::unexpected(r.error());
  return config;
}

std::string describe(const ServiceConfig& c) {
  auto secret = [](const std::string& s) { return s.empty() ? "<unset>" : "<set>"; };
  std::ostringstream os;
  os << "model_path=" << c.model_path << " device=" << c.device << " imgsz=" << c.predict.imgsz
     << " conf=" << c.predict.conf << " iou=" << c.predict.iou
     << " max_inflight=" << c.max_inflight << " io_concurrency=" << c.io_concurrency
     << " max_jobs=" << c.max_jobs << " post_timeout_ms=" << c.post_timeout.count()
     << " http_timeout_ms=" << c.http_timeout.count()
     << " callback_max_retries=" << c.callback_max_retries
     << " round_precision=" << c.round_precision << " top_k=" << c.top_k
     << " tracker_capacity=" << c.tracker_capacity << " test_mode=" << c.test_mode
     << " inbound_token=" << secret(c.inbound_token)
     << " shared_secret=" << secret(c.shared_secret) << " enable_s3=" << c.enable_s3
     << " listen=" << c.host << ":" << c.port;
  return os.str();
}

}  // namespace vinfer::app
