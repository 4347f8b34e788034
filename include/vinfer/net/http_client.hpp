#pragma once

#include <vinfer/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vinfer::net {

/// AWS Signature V4 credentials, applied by libcurl's built-in signer.
struct AwsSigV4 {
  std::string region;
  std::string service{"s3"};
  std::string access_key;
  std::string secret_key;
  std::string session_token;
};

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  /// Raw header lines, e.g. "Content-Type: application/json".
  std::vector<std::string> headers;
  std::string body;
  /// Whole-transfer timeout.
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  std::optional<AwsSigV4> aws_sigv4;
  /// Abort the transfer once the response body exceeds this size (0 = unlimited).
  std::size_t max_body_bytes{0};
};

struct HttpResponse {
  long status{0};
  std::string body;

  [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/// Blocking HTTP transport. Returns TransportFailed only when no HTTP response
/// was received (DNS, connect, TLS, timeout, size limit); any status code is a
/// successful transfer. Implementations must be safe to call concurrently.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  [[nodiscard]] virtual std::expected<HttpResponse, vinfer::core::Error>
  perform(const HttpRequest& request) = 0;
};

/// Percent-encode \p text with libcurl: every byte outside the RFC 3986
/// unreserved set (A-Z a-z 0-9 - . _ ~) becomes %XX, '/' included.
/// \throws std::runtime_error if libcurl fails to encode.
[[nodiscard]] std::string url_escape(std::string_view text);

/// Process-wide libcurl init/cleanup.
class CurlGlobalManager {
 public:
  static CurlGlobalManager& getInstance();
  CurlGlobalManager(const CurlGlobalManager&) = delete;
  CurlGlobalManager& operator=(const CurlGlobalManager&) = delete;

 private:
  CurlGlobalManager();
  ~CurlGlobalManager();
};

/// libcurl implementation; one easy handle per perform() call.
class CurlHttpClient : public IHttpClient {
 public:
  /// \throws std::runtime_error if libcurl cannot be initialized.
  CurlHttpClient();

  [[nodiscard]] std::expected<HttpResponse, vinfer::core::Error>
  perform(const HttpRequest& request) override;
};

}  // namespace vinfer::net
