#include <vinfer/app/request_codec.hpp>
#include <vinfer/net/signature.hpp>

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <random>

namespace vinfer::app {

namespace {

namespace vc = vinfer::core;
using nlohmann::json;

constexpr std::int64_t kMaxImgsz = 8192;
constexpr std::string_view kBearerPrefix = "Bearer ";

std::unexpected<vc::Error> bad_request(std::string message) {
  return std::unexpected(vc::Error{vc::ErrorCode::InvalidRequest, std::move(message)});
}

bool is_http_url(const std::string& url) {
  const auto starts = [&](std::string_view p) {
    return url.size() > p.size() && url.compare(0, p.size(), p) == 0;
  };
  return starts("http://") || starts("https://");
}

/// Read imgsz / conf / iou from \p obj into \p params (only fields present).
std::expected<void, vc::Error> read_params(const json& obj, vc::InferenceParams& params) {
  if (auto it = obj.find("imgsz"); it != obj.end() && !it->is_null()) {
    if (!it->is_number_integer()) return bad_request("imgsz must be an integer");
    const auto v = it->get<std::int64_t>();
    if (v < 1 || v > kMaxImgsz) return bad_request("imgsz out of range");
    params.imgsz = static_cast<std::uint32_t>(v);
  }
  for (const char* name : {"conf", "iou"}) {
    auto it = obj.find(name);
    if (it == obj.end() || it->is_null()) continue;
    if (!it->is_number()) return bad_request(std::string(name) + " must be a number");
    const auto v = it->get<double>();
    if (!std::isfinite(v)) return bad_request(std::string(name) + " must be finite");
    (std::string_view(name) == "conf" ? params.conf : params.iou) = static_cast<float>(v);
  }
  return validate_params(params);
}

}  // namespace

std::expected<void, vc::Error> validate_params(const vc::InferenceParams& params) {
  if (params.imgsz && (*params.imgsz < 1 || *params.imgsz > kMaxImgsz)) {
    return bad_request("imgsz must be in [1, " + std::to_string(kMaxImgsz) + "]");
  }
  if (params.conf && !(*params.conf >= 0.f && *params.conf <= 1.f)) {
    return bad_request("conf must be in [0, 1]");
  }
  if (params.iou && !(*params.iou >= 0.f && *params.iou <= 1.f)) {
    return bad_request("iou must be in [0, 1]");
  }
  return {};
}

std::expected<vc::InferenceRequest, vc::Error> parse_infer_request(std::string_view body,
                                                                   DeliveryMode mode) {
  const json doc = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) return bad_request("malformed JSON body");
  if (!doc.is_object()) return bad_request("body must be a JSON object");

  vc::InferenceRequest req;

  auto urls = doc.find("urls");
  if (urls == doc.end()) urls = doc.find("sources");
  if (urls == doc.end() || !urls->is_array()) return bad_request("'urls' must be an array");
  req.sources.reserve(urls->size());
  for (const auto& u : *urls) {
    if (!u.is_string()) return bad_request("'urls' entries must be strings");
    req.sources.push_back(u.get<std::string>());
  }

  if (auto id = doc.find("request_id"); id != doc.end() && !id->is_null()) {
    if (!id->is_string()) return bad_request("'request_id' must be a string");
    req.request_id = id->get<std::string>();
  }
  if (req.request_id.empty()) req.request_id = generate_request_id();

  if (mode == DeliveryMode::Async) {
    auto cb = doc.find("callback_url");
    if (cb == doc.end() || !cb->is_string()) return bad_request("'callback_url' is required");
    std::string url = cb->get<std::string>();
    if (!is_http_url(url)) return bad_request("'callback_url' must be an http(s) URL");
    req.callback_url = std::move(url);
  }

  if (auto r = read_params(doc, req.params); !r) return std::unexpected(r.error());
  if (auto nested = doc.find("params"); nested != doc.end() && !nested->is_null()) {
    if (!nested->is_object()) return bad_request("'params' must be an object");
    if (auto r = read_params(*nested, req.params); !r) return std::unexpected(r.error());
  }
  return req;
}

std::string generate_request_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uint64_t hi = rng();
  std::uint64_t lo = rng();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return buf;
}

std::expected<void, vc::Error> check_bearer(std::string_view expected_token,
                                            std::string_view authorization_header) {
  if (expected_token.empty()) return {};
  if (!authorization_header.starts_with(kBearerPrefix)) {
    return std::unexpected(vc::Error{vc::ErrorCode::Unauthorized, "missing bearer token"});
  }
  std::string_view token = authorization_header.substr(kBearerPrefix.size());
  while (!token.empty() && (token.front() == ' ' || token.front() == '\t')) token.remove_prefix(1);
  while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) token.remove_suffix(1);
  if (!vinfer::net::constant_time_equals(token, expected_token)) {
    return std::unexpected(vc::Error{vc::ErrorCode::Unauthorized, "invalid token"});
  }
  return {};
}

}  // namespace vinfer::app
