#include "support/fakes.hpp"
#include <vinfer/vision/image_source.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace vv = vinfer::vision;
namespace vc = vinfer::core;
namespace vt = vinfer::testing;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& bytes) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path, std::ios::binary);
  f << bytes;
  return path;
}

vv::ImageSourceResolver resolver_with(std::shared_ptr<vt::StubFetcher> http,
                                      std::shared_ptr<vt::StubFetcher> s3 = nullptr) {
  return vv::ImageSourceResolver(std::make_shared<vv::FileFetcher>(), std::move(http),
                                 std::move(s3));
}

}  // namespace

TEST(SourceScheme, Classification) {
  EXPECT_EQ(vv::scheme_of("file:///tmp/a.jpg"), vv::SourceScheme::File);
  EXPECT_EQ(vv::scheme_of("/tmp/a.jpg"), vv::SourceScheme::File);
  EXPECT_EQ(vv::scheme_of("relative/a.jpg"), vv::SourceScheme::File);
  EXPECT_EQ(vv::scheme_of("http://x/a.jpg"), vv::SourceScheme::Http);
  EXPECT_EQ(vv::scheme_of("HTTPS://x/a.jpg"), vv::SourceScheme::Http);
  EXPECT_EQ(vv::scheme_of("s3://bucket/key.png"), vv::SourceScheme::S3);
  EXPECT_EQ(vv::scheme_of("ftp://x/a.jpg"), vv::SourceScheme::Unsupported);
  EXPECT_EQ(vv::scheme_of("gs://bucket/a.jpg"), vv::SourceScheme::Unsupported);
}

TEST(ImageSourceResolver, ReadsFileUriAndBarePath) {
  const auto path = write_temp("vinfer_resolver_ok.png", vt::encode_png(8, 6));
  auto resolver = resolver_with(std::make_shared<vt::StubFetcher>());

  auto by_uri = resolver.resolve("file://" + path.string());
  ASSERT_TRUE(by_uri.has_value()) << by_uri.error().message;
  EXPECT_EQ(by_uri->source, "file://" + path.string());
  EXPECT_EQ(by_uri->image.width(), 8u);
  EXPECT_EQ(by_uri->image.height(), 6u);
  EXPECT_EQ(by_uri->image.format(), vc::PixelFormat::BGR8);

  auto by_path = resolver.resolve(path.string());
  ASSERT_TRUE(by_path.has_value());
  std::filesystem::remove(path);
}

TEST(ImageSourceResolver, MissingFileIsTransportError) {
  auto resolver = resolver_with(std::make_shared<vt::StubFetcher>());
  auto r = resolver.resolve("file:///nonexistent/vinfer/none.jpg");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, vc::ErrorCode::TransportFailed);
}

TEST(ImageSourceResolver, CorruptBytesAreDecodeError) {
  const auto path = write_temp("vinfer_resolver_corrupt.jpg", "definitely not an image");
  auto resolver = resolver_with(std::make_shared<vt::StubFetcher>());
  auto r = resolver.resolve(path.string());
  std::filesystem::remove(path);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, vc::ErrorCode::DecodeFailed);
}

TEST(ImageSourceResolver, UnknownSchemeIsRejected) {
  auto resolver = resolver_with(std::make_shared<vt::StubFetcher>());
  auto r = resolver.resolve("ftp://example.com/a.jpg");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, vc::ErrorCode::UnsupportedScheme);
}

TEST(ImageSourceResolver, DispatchesHttpAndS3ToTheirFetchers) {
  auto http = std::make_shared<vt::StubFetcher>();
  auto s3 = std::make_shared<vt::StubFetcher>();
  http->add("https://img.example/a.png", vt::encode_png(3, 2));
  s3->add("s3://bucket/b.png", vt::encode_png(5, 4));
  auto resolver = resolver_with(http, s3);

  auto a = resolver.resolve("https://img.example/a.png");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->image.width(), 3u);
  auto b = resolver.resolve("s3://bucket/b.png");
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->image.width(), 5u);

  auto bad = resolver.resolve("http://bad");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, vc::ErrorCode::TransportFailed);
}

TEST(ImageSourceResolver, MissingFetcherFailsAsTransport) {
  vv::ImageSourceResolver resolver(std::make_shared<vv::FileFetcher>(), nullptr, nullptr);
  auto r = resolver.resolve("s3://bucket/key");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, vc::ErrorCode::TransportFailed);
}

TEST(HttpFetcher, NonSuccessStatusIsTransportError) {
  auto client = vt::FakeHttpClient::returning(404, "nope");
  vv::HttpFetcher fetcher(client, {std::chrono::milliseconds(1234), 1024});
  auto r = fetcher.fetch("http://img.example/missing.jpg");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, vc::ErrorCode::TransportFailed);
  EXPECT_EQ(r.error().message, "HTTP 404");

  const auto sent = client->requests();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].method, "GET");
  EXPECT_EQ(sent[0].timeout, std::chrono::milliseconds(1234));
  EXPECT_EQ(sent[0].max_body_bytes, 1024u);
}

TEST(S3Fetcher, ParsesReferences) {
  auto ok = vv::parse_s3_uri("s3://my-bucket/path/to/img.jpg");
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->bucket, "my-bucket");
  EXPECT_EQ(ok->key, "path/to/img.jpg");

  for (const char* bad : {"s3://bucket", "s3://bucket/", "s3:///key", "s3://"}) {
    auto r = vv::parse_s3_uri(bad);
    ASSERT_FALSE(r.has_value()) << bad;
    EXPECT_EQ(r.error().code, vc::ErrorCode::TransportFailed);
    EXPECT_NE(r.error().message.find(bad), std::string::npos);
  }
}

TEST(S3Fetcher, SignsRequestAgainstVirtualHostOrEndpoint) {
  auto client = vt::FakeHttpClient::returning(200, "bytes");
  vv::S3Options opts;
  opts.region = "ap-northeast-2";
  opts.access_key = "AKIA";
  opts.secret_key = "secret";
  opts.session_token = "tok";
  vv::S3Fetcher aws(client, opts);
  auto body = aws.fetch("s3://bucket/dir/a.jpg");
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, "bytes");

  opts.endpoint = "http://minio:9000/";
  vv::S3Fetcher minio(client, opts);
  ASSERT_TRUE(minio.fetch("s3://bucket/a.jpg").has_value());

  const auto sent = client->requests();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].url, "https://bucket.s3.ap-northeast-2.amazonaws.com/dir/a.jpg");
  ASSERT_TRUE(sent[0].aws_sigv4.has_value());
  EXPECT_EQ(sent[0].aws_sigv4->region, "ap-northeast-2");
  EXPECT_EQ(sent[0].aws_sigv4->session_token, "tok");
  EXPECT_EQ(sent[1].url, "http://minio:9000/bucket/a.jpg");
}

TEST(S3Fetcher, PercentEncodesKeySegments) {
  EXPECT_EQ(vv::encode_s3_key("plain/a.jpg"), "plain/a.jpg");
  EXPECT_EQ(vv::encode_s3_key("a b/c#d"), "a%20b/c%23d");
  EXPECT_EQ(vv::encode_s3_key("x/100%/y?z"), "x/100%25/y%3Fz");
  EXPECT_EQ(vv::encode_s3_key("dir//file~_-.png"), "dir//file~_-.png");

  auto client = vt::FakeHttpClient::returning(200, "bytes");
  vv::S3Options opts;
  opts.access_key = "AKIA";
  opts.secret_key = "secret";
  ASSERT_TRUE(vv::S3Fetcher(client, opts).fetch("s3://bucket/photos/cat #1 ?.jpg").has_value());
  opts.endpoint = "http://minio:9000";
  ASSERT_TRUE(vv::S3Fetcher(client, opts).fetch("s3://bucket/a#b.jpg").has_value());

  const auto sent = client->requests();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].url, "https://bucket.s3.us-east-1.amazonaws.com/photos/cat%20%231%20%3F.jpg");
  EXPECT_EQ(sent[0].url.find(' '), std::string::npos);
  EXPECT_EQ(sent[0].url.find('#'), std::string::npos);
  EXPECT_EQ(sent[1].url, "http://minio:9000/bucket/a%23b.jpg");
}

TEST(S3Fetcher, DisabledOrUnconfiguredFails) {
  auto client = vt::FakeHttpClient::returning(200, "bytes");
  vv::S3Options disabled;
  disabled.enabled = false;
  disabled.access_key = "a";
  disabled.secret_key = "b";
  auto r1 = vv::S3Fetcher(client, disabled).fetch("s3://b/k");
  ASSERT_FALSE(r1.has_value());
  EXPECT_EQ(r1.error().code, vc::ErrorCode::TransportFailed);

  auto r2 = vv::S3Fetcher(client, vv::S3Options{}).fetch("s3://b/k");
  ASSERT_FALSE(r2.has_value());
  EXPECT_NE(r2.error().message.find("credentials"), std::string::npos);
  EXPECT_TRUE(client->requests().empty());
}
