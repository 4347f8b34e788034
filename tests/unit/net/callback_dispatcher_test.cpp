#include "support/fakes.hpp"
#include <vinfer/core/result_json.hpp>
#include <vinfer/net/callback_dispatcher.hpp>
#include <vinfer/net/signature.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>

namespace vn = vinfer::net;
namespace vc = vinfer::core;
namespace vt = vinfer::testing;

namespace {

vc::BatchResult sample_batch() {
  vc::BatchResult batch;
  batch.request_id = "job-7";
  batch.results.push_back(
      vc::InferenceFailure{"http://bad", {vc::ErrorCode::TransportFailed, "HTTP 500"}});
  return batch;
}

std::string header_value(const vn::HttpRequest& req, const std::string& name) {
  const std::string prefix = name + ": ";
  for (const auto& h : req.headers) {
    if (h.rfind(prefix, 0) == 0) return h.substr(prefix.size());
  }
  return {};
}

vn::CallbackOptions fast_options(std::string secret = {}, int retries = 0) {
  vn::CallbackOptions o;
  o.shared_secret = std::move(secret);
  o.max_retries = retries;
  o.retry_backoff = std::chrono::milliseconds(1);
  o.timeout = std::chrono::milliseconds(2500);
  return o;
}

}  // namespace

TEST(CallbackDispatcher, PostsSignedCanonicalPayload) {
  auto client = vt::FakeHttpClient::returning(200);
  vn::CallbackDispatcher dispatcher(client, fast_options("topsecret"));

  auto outcome = dispatcher.deliver(sample_batch(), "http://backend/cb");
  EXPECT_TRUE(outcome.delivered);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_EQ(outcome.http_status, 200);

  const auto sent = client->requests();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].method, "POST");
  EXPECT_EQ(sent[0].url, "http://backend/cb");
  EXPECT_EQ(sent[0].timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(sent[0].body, vc::serialize_batch_result(sample_batch(), 5));
  EXPECT_EQ(header_value(sent[0], "Content-Type"), "application/json");
  const std::string sig = header_value(sent[0], "X-Signature");
  EXPECT_TRUE(vn::verify_signature("topsecret", sent[0].body, sig));
}

TEST(CallbackDispatcher, UnsignedWhenNoSecret) {
  auto client = vt::FakeHttpClient::returning(204);
  vn::CallbackDispatcher dispatcher(client, fast_options());
  EXPECT_TRUE(dispatcher.deliver(sample_batch(), "http://backend/cb").delivered);
  EXPECT_TRUE(header_value(client->requests().at(0), "X-Signature").empty());
}

TEST(CallbackDispatcher, NonSuccessIsReportedWithoutRetryByDefault) {
  auto client = vt::FakeHttpClient::returning(503);
  vn::CallbackDispatcher dispatcher(client, fast_options());
  auto outcome = dispatcher.deliver(sample_batch(), "http://backend/cb");
  EXPECT_FALSE(outcome.delivered);
  EXPECT_EQ(outcome.attempts, 1);
  EXPECT_EQ(outcome.http_status, 503);
  EXPECT_NE(outcome.error.find("503"), std::string::npos);
  EXPECT_EQ(client->requests().size(), 1u);
}

TEST(CallbackDispatcher, RetriesTransportFailuresUpToLimit) {
  std::atomic<int> calls{0};
  auto client = std::make_shared<vt::FakeHttpClient>([&calls](const vn::HttpRequest&) {
    if (++calls < 3) {
      return std::expected<vn::HttpResponse, vc::Error>(
          std::unexpected(vc::Error{vc::ErrorCode::TransportFailed, "connection refused"}));
    }
    return std::expected<vn::HttpResponse, vc::Error>(vn::HttpResponse{200, "ok"});
  });
  vn::CallbackDispatcher dispatcher(client, fast_options("k", 2));
  auto outcome = dispatcher.deliver(sample_batch(), "http://backend/cb");
  EXPECT_TRUE(outcome.delivered);
  EXPECT_EQ(outcome.attempts, 3);

  // Every attempt carries the same bytes and signature.
  const auto sent = client->requests();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[0].body, sent[2].body);
  EXPECT_EQ(header_value(sent[0], "X-Signature"), header_value(sent[2], "X-Signature"));
}

TEST(CallbackDispatcher, GivesUpAfterRetries) {
  auto client = vt::FakeHttpClient::returning(500);
  vn::CallbackDispatcher dispatcher(client, fast_options({}, 1));
  auto outcome = dispatcher.deliver(sample_batch(), "http://backend/cb");
  EXPECT_FALSE(outcome.delivered);
  EXPECT_EQ(outcome.attempts, 2);
  EXPECT_EQ(client->requests().size(), 2u);
}
