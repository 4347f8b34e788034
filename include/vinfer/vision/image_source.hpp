#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/core/frame.hpp>
#include <vinfer/net/http_client.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace vinfer::vision {

/// Decoded pixels plus the source string they came from. Owned by one
/// in-flight item and dropped once inference has consumed it.
struct ResolvedImage {
  std::string source;
  vinfer::core::Frame image;
};

enum class SourceScheme {
  File,
  Http,
  S3,
  Unsupported,
};

/// Classify a source URI. "file://" and bare paths are File; any other
/// "<scheme>://" that is not http, https or s3 is Unsupported.
[[nodiscard]] SourceScheme scheme_of(std::string_view uri) noexcept;

/// Fetches the encoded bytes behind a URI of one scheme. Failures are
/// TransportFailed. Implementations must be safe to call concurrently.
class ISourceFetcher {
 public:
  virtual ~ISourceFetcher() = default;

  [[nodiscard]] virtual std::expected<std::string, vinfer::core::Error>
  fetch(const std::string& uri) = 0;
};

/// Local file read; accepts "file://<path>" or a bare path.
class FileFetcher : public ISourceFetcher {
 public:
  [[nodiscard]] std::expected<std::string, vinfer::core::Error>
  fetch(const std::string& uri) override;
};

struct HttpFetchOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  /// Response bodies larger than this fail the fetch (0 = unlimited).
  std::size_t max_body_bytes{64u * 1024u * 1024u};
};

/// http(s) GET; any non-2xx status is a transport failure.
class HttpFetcher : public ISourceFetcher {
 public:
  HttpFetcher(std::shared_ptr<vinfer::net::IHttpClient> client, HttpFetchOptions options = {});

  [[nodiscard]] std::expected<std::string, vinfer::core::Error>
  fetch(const std::string& uri) override;

 private:
  std::shared_ptr<vinfer::net::IHttpClient> client_;
  HttpFetchOptions options_;
};

struct S3Options {
  bool enabled{true};
  /// Path-style endpoint (e.g. a MinIO URL); empty = AWS virtual-host style.
  std::string endpoint;
  std::string region{"us-east-1"};
  std::string access_key;
  std::string secret_key;
  std::string session_token;
  HttpFetchOptions http;
};

/// Object-store reference split into its parts.
struct S3Location {
  std::string bucket;
  std::string key;
};

/// Parse "s3://bucket/key". TransportFailed naming the URI if either part is missing.
[[nodiscard]] std::expected<S3Location, vinfer::core::Error> parse_s3_uri(const std::string& uri);

/// Percent-encode each '/'-separated segment of an object key; the slashes
/// themselves are kept. "a b/c#d" -> "a%20b/c%23d".
[[nodiscard]] std::string encode_s3_key(std::string_view key);

/// Authenticated GET of s3://bucket/key, signed with AWS SigV4.
class S3Fetcher : public ISourceFetcher {
 public:
  S3Fetcher(std::shared_ptr<vinfer::net::IHttpClient> client, S3Options options);

  [[nodiscard]] std::expected<std::string, vinfer::core::Error>
  fetch(const std::string& uri) override;

  /// URL the object is fetched from, with the key percent-encoded.
  [[nodiscard]] std::string object_url(const S3Location& location) const;

 private:
  std::shared_ptr<vinfer::net::IHttpClient> client_;
  S3Options options_;
};

/// Turns a source URI into a decoded image.
///
/// Dispatches on the URI scheme to the matching fetcher, then decodes the
/// bytes. Errors: UnsupportedScheme for an unknown scheme, TransportFailed for
/// fetch problems, DecodeFailed for bytes that are not an image. No retries.
class ImageSourceResolver {
 public:
  /// A null fetcher makes its scheme fail with TransportFailed.
  ImageSourceResolver(std::shared_ptr<ISourceFetcher> file,
                      std::shared_ptr<ISourceFetcher> http,
                      std::shared_ptr<ISourceFetcher> s3);

  [[nodiscard]] std::expected<ResolvedImage, vinfer::core::Error>
  resolve(const std::string& uri) const;

 private:
  std::shared_ptr<ISourceFetcher> file_;
  std::shared_ptr<ISourceFetcher> http_;
  std::shared_ptr<ISourceFetcher> s3_;
};

}  // namespace vinfer::vision
