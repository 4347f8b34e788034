#include <vinfer/vision/image_source.hpp>
#include <vinfer/vision/decode_image.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <new>
#include <span>
#include <stdexcept>

namespace vinfer::vision {

namespace {

namespace vc = vinfer::core;

constexpr std::string_view kFilePrefix = "file://";
constexpr std::string_view kS3Prefix = "s3://";

std::unexpected<vc::Error> transport_error(std::string message) {
  return std::unexpected(vc::Error{vc::ErrorCode::TransportFailed, std::move(message)});
}

/// Lowercase scheme before "://", or empty when the URI has none.
std::string scheme_prefix(std::string_view uri) {
  const auto pos = uri.find("://");
  if (pos == std::string_view::npos || pos == 0) return {};
  std::string scheme;
  for (char c : uri.substr(0, pos)) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') return {};
    scheme.push_back(static_cast<char>(std::tolower(uc)));
  }
  return scheme;
}

}  // namespace

SourceScheme scheme_of(std::string_view uri) noexcept {
  std::string scheme;
  try {
    scheme = scheme_prefix(uri);
  } catch (const std::bad_alloc&) {
    return SourceScheme::Unsupported;
  }
  if (scheme.empty() || scheme == "file") return SourceScheme::File;
  if (scheme == "http" || scheme == "https") return SourceScheme::Http;
  if (scheme == "s3") return SourceScheme::S3;
  return SourceScheme::Unsupported;
}

std::expected<std::string, vc::Error> FileFetcher::fetch(const std::string& uri) {
  const std::string path =
      uri.starts_with(kFilePrefix) ? uri.substr(kFilePrefix.size()) : uri;
  if (path.empty()) return transport_error("empty file path");
  std::ifstream in(path, std::ios::binary);
  if (!in) return transport_error("cannot open file: " + path);
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return transport_error("read failed: " + path);
  return bytes;
}

HttpFetcher::HttpFetcher(std::shared_ptr<vinfer::net::IHttpClient> client,
                         HttpFetchOptions options)
    : client_(std::move(client)), options_(options) {
  if (!client_) throw std::invalid_argument("HttpFetcher: http client is null");
}

std::expected<std::string, vc::Error> HttpFetcher::fetch(const std::string& uri) {
  vinfer::net::HttpRequest req;
  req.url = uri;
  req.timeout = options_.timeout;
  req.max_body_bytes = options_.max_body_bytes;
  auto resp = client_->perform(req);
  if (!resp) return std::unexpected(resp.error());
  if (!resp->ok()) return transport_error("HTTP " + std::to_string(resp->status));
  return std::move(resp->body);
}

std::expected<S3Location, vc::Error> parse_s3_uri(const std::string& uri) {
  if (!uri.starts_with(kS3Prefix)) return transport_error("not an s3 reference: " + uri);
  const std::string rest = uri.substr(kS3Prefix.size());
  const auto slash = rest.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
    return transport_error("malformed s3 reference: " + uri);
  }
  return S3Location{rest.substr(0, slash), rest.substr(slash + 1)};
}

S3Fetcher::S3Fetcher(std::shared_ptr<vinfer::net::IHttpClient> client, S3Options options)
    : client_(std::move(client)), options_(std::move(options)) {
  if (!client_) throw std::invalid_argument("S3Fetcher: http client is null");
}

std::string encode_s3_key(std::string_view key) {
  std::string out;
  out.reserve(key.size());
  std::size_t start = 0;
  while (true) {
    const auto slash = key.find('/', start);
    out += vinfer::net::url_escape(key.substr(start, slash - start));
    if (slash == std::string_view::npos) break;
    out.push_back('/');
    start = slash + 1;
  }
  return out;
}

std::string S3Fetcher::object_url(const S3Location& location) const {
  const std::string key = encode_s3_key(location.key);
  if (!options_.endpoint.empty()) {
    std::string base = options_.endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + vinfer::net::url_escape(location.bucket) + "/" + key;
  }
  return "https://" + location.bucket + ".s3." + options_.region + ".amazonaws.com/" + key;
}

std::expected<std::string, vc::Error> S3Fetcher::fetch(const std::string& uri) {
  if (!options_.enabled) return transport_error("s3 fetch is disabled");
  auto location = parse_s3_uri(uri);
  if (!location) return std::unexpected(location.error());
  if (options_.access_key.empty() || options_.secret_key.empty()) {
    return transport_error("s3 credentials are not configured");
  }

  vinfer::net::HttpRequest req;
  try {
    req.url = object_url(*location);
  } catch (const std::runtime_error& e) {
    return transport_error("cannot encode s3 key of " + uri + ": " + e.what());
  }
  req.timeout = options_.http.timeout;
  req.max_body_bytes = options_.http.max_body_bytes;
  req.aws_sigv4 = vinfer::net::AwsSigV4{options_.region, "s3", options_.access_key,
                                        options_.secret_key, options_.session_token};
  auto resp = client_->perform(req);
  if (!resp) return std::unexpected(resp.error());
  if (!resp->ok()) return transport_error("s3 GET returned HTTP " + std::to_string(resp->status));
  return std::move(resp->body);
}

ImageSourceResolver::ImageSourceResolver(std::shared_ptr<ISourceFetcher> file,
                                         std::shared_ptr<ISourceFetcher> http,
                                         std::shared_ptr<ISourceFetcher> s3)
    : file_(std::move(file)), http_(std::move(http)), s3_(std::move(s3)) {}

std::expected<ResolvedImage, vc::Error> ImageSourceResolver::resolve(const std::string& uri) const {
  ISourceFetcher* fetcher = nullptr;
  switch (scheme_of(uri)) {
    case SourceScheme::File:
      fetcher = file_.get();
      break;
    case SourceScheme::Http:
      fetcher = http_.get();
      break;
    case SourceScheme::S3:
      fetcher = s3_.get();
      break;
    case SourceScheme::Unsupported:
      return std::unexpected(
          vc::Error{vc::ErrorCode::UnsupportedScheme, "unsupported scheme: " + uri});
  }
  if (!fetcher) return transport_error("no fetcher configured for " + uri);

  auto bytes = fetcher->fetch(uri);
  if (!bytes) return std::unexpected(bytes.error());

  auto frame = decode_image(std::as_bytes(std::span<const char>(bytes->data(), bytes->size())));
  if (!frame) {
    return std::unexpected(vc::Error{vc::ErrorCode::DecodeFailed, "cannot decode image"});
  }
  return ResolvedImage{uri, std::move(*frame)};
}

}  // namespace vinfer::vision
