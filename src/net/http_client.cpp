#include <vinfer/net/http_client.hpp>
#include <curl/curl.h>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>

namespace vinfer::net {

namespace {

namespace vc = vinfer::core;

class CurlEasyHandle {
 public:
  CurlEasyHandle() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw std::runtime_error("Failed to create CURL handle");
    }
  }
  ~CurlEasyHandle() { curl_easy_cleanup(handle_); }

  CurlEasyHandle(const CurlEasyHandle&) = delete;
  CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;

  CURL* get() { return handle_; }

 private:
  CURL* handle_;
};

class CurlHeaderList {
 public:
  CurlHeaderList() = default;
  ~CurlHeaderList() {
    if (list_) curl_slist_free_all(list_);
  }

  CurlHeaderList(const CurlHeaderList&) = delete;
  CurlHeaderList& operator=(const CurlHeaderList&) = delete;

  bool append(const std::string& header) {
    curl_slist* next = curl_slist_append(list_, header.c_str());
    if (!next) return false;
    list_ = next;
    return true;
  }
  curl_slist* get() { return list_; }

 private:
  curl_slist* list_{nullptr};
};

struct WriteTarget {
  std::string* buffer;
  std::size_t limit;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
  auto* target = static_cast<WriteTarget*>(userp);
  const size_t len = size * nmemb;
  if (target->limit > 0 && target->buffer->size() + len > target->limit) {
    return 0;  // aborts the transfer with CURLE_WRITE_ERROR
  }
  try {
    target->buffer->append(static_cast<const char*>(contents), len);
    return len;
  } catch (const std::bad_alloc&) {
    return 0;
  }
}

vc::Error transport_error(std::string message) {
  return vc::Error{vc::ErrorCode::TransportFailed, std::move(message)};
}

}  // namespace

CurlGlobalManager& CurlGlobalManager::getInstance() {
  static CurlGlobalManager instance;
  return instance;
}

CurlGlobalManager::CurlGlobalManager() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize libcurl");
  }
}

CurlGlobalManager::~CurlGlobalManager() { curl_global_cleanup(); }

CurlHttpClient::CurlHttpClient() { CurlGlobalManager::getInstance(); }

std::string url_escape(std::string_view text) {
  if (text.empty()) return {};
  if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("url_escape: input too long");
  }
  CurlGlobalManager::getInstance();
  CurlEasyHandle easy;
  char* escaped = curl_easy_escape(easy.get(), text.data(), static_cast<int>(text.size()));
  if (!escaped) throw std::runtime_error("url_escape: curl_easy_escape failed");
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

std::expected<HttpResponse, vinfer::core::Error>
CurlHttpClient::perform(const HttpRequest& request) {
  CurlEasyHandle easy;
  CURL* h = easy.get();

  HttpResponse response;
  WriteTarget target{&response.body, request.max_body_bytes};
  char error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &target);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);

  if (request.method == "POST") {
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
  } else if (request.method != "GET") {
    return std::unexpected(transport_error("unsupported HTTP method " + request.method));
  }

  CurlHeaderList headers;
  for (const auto& line : request.headers) {
    if (!headers.append(line)) {
      return std::unexpected(transport_error("failed to build request headers"));
    }
  }

  std::string sigv4_provider;
  std::string credentials;
  if (request.aws_sigv4) {
    const AwsSigV4& aws = *request.aws_sigv4;
    sigv4_provider = "aws:amz:" + aws.region + ":" + aws.service;
    credentials = aws.access_key + ":" + aws.secret_key;
    curl_easy_setopt(h, CURLOPT_AWS_SIGV4, sigv4_provider.c_str());
    curl_easy_setopt(h, CURLOPT_USERPWD, credentials.c_str());
    if (!aws.session_token.empty() &&
        !headers.append("x-amz-security-token: " + aws.session_token)) {
      return std::unexpected(transport_error("failed to build request headers"));
    }
  }
  if (headers.get()) {
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  }

  const CURLcode res = curl_easy_perform(h);
  if (res != CURLE_OK) {
    std::string message = curl_easy_strerror(res);
    if (error_buffer[0] != '\0') message += std::string(": ") + error_buffer;
    if (res == CURLE_WRITE_ERROR && request.max_body_bytes > 0) {
      message = "response body exceeds " + std::to_string(request.max_body_bytes) + " bytes";
    }
    return std::unexpected(transport_error(std::move(message)));
  }

  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

}  // namespace vinfer::net
