#include <vinfer/app/request_codec.hpp>
#include <gtest/gtest.h>
#include <regex>
#include <set>

namespace va = vinfer::app;
namespace vc = vinfer::core;

TEST(RequestCodec, ParsesAsyncBody) {
  auto req = va::parse_infer_request(
      R"({"request_id":"r1","urls":["file:///a.jpg","http://x/b.png"],
          "callback_url":"https://backend/cb","params":{"imgsz":320,"conf":0.4}})",
      va::DeliveryMode::Async);
  ASSERT_TRUE(req.has_value()) << req.error().message;
  EXPECT_EQ(req->request_id, "r1");
  ASSERT_EQ(req->sources.size(), 2u);
  EXPECT_EQ(req->sources[1], "http://x/b.png");
  EXPECT_EQ(req->callback_url.value(), "https://backend/cb");
  EXPECT_EQ(req->params.imgsz.value(), 320u);
  EXPECT_FLOAT_EQ(req->params.conf.value(), 0.4f);
  EXPECT_FALSE(req->params.iou.has_value());
}

TEST(RequestCodec, TopLevelParamsAndNestedWins) {
  auto req = va::parse_infer_request(
      R"({"urls":[],"conf":0.1,"iou":0.6,"params":{"conf":0.9}})", va::DeliveryMode::Sync);
  ASSERT_TRUE(req.has_value());
  EXPECT_FLOAT_EQ(req->params.conf.value(), 0.9f);
  EXPECT_FLOAT_EQ(req->params.iou.value(), 0.6f);
  EXPECT_FALSE(req->callback_url.has_value());
}

TEST(RequestCodec, GeneratesRequestIdWhenAbsent) {
  auto req = va::parse_infer_request(R"({"urls":["a.jpg"]})", va::DeliveryMode::Sync);
  ASSERT_TRUE(req.has_value());
  const std::regex uuid4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  EXPECT_TRUE(std::regex_match(req->request_id, uuid4)) << req->request_id;

  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) ids.insert(va::generate_request_id());
  EXPECT_EQ(ids.size(), 100u);
}

TEST(RequestCodec, RejectsBadBodies) {
  auto code = [](std::string_view body, va::DeliveryMode mode) {
    auto r = va::parse_infer_request(body, mode);
    return r ? vc::ErrorCode::None : r.error().code;
  };
  const auto bad = vc::ErrorCode::InvalidRequest;
  EXPECT_EQ(code("{not json", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code("[1,2]", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":"a.jpg"})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[1]})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[],"request_id":5})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[]})", va::DeliveryMode::Async), bad);
  EXPECT_EQ(code(R"({"urls":[],"callback_url":"ftp://x"})", va::DeliveryMode::Async), bad);
  EXPECT_EQ(code(R"({"urls":[],"conf":1.5})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[],"params":{"iou":-0.2}})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[],"imgsz":0})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[],"imgsz":"640"})", va::DeliveryMode::Sync), bad);
  EXPECT_EQ(code(R"({"urls":[],"params":3})", va::DeliveryMode::Sync), bad);
}

TEST(RequestCodec, SourcesAliasAccepted) {
  auto req = va::parse_infer_request(R"({"sources":["x.png"]})", va::DeliveryMode::Sync);
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->sources.at(0), "x.png");
}

TEST(BearerCheck, Rules) {
  EXPECT_TRUE(va::check_bearer("", "").has_value());
  EXPECT_TRUE(va::check_bearer("", "Bearer anything").has_value());
  EXPECT_TRUE(va::check_bearer("tok", "Bearer tok").has_value());
  EXPECT_TRUE(va::check_bearer("tok", "Bearer  tok ").has_value());

  for (const char* header : {"", "tok", "Basic tok", "Bearer nope", "Bearer tok2"}) {
    auto r = va::check_bearer("tok", header);
    ASSERT_FALSE(r.has_value()) << header;
    EXPECT_EQ(r.error().code, vc::ErrorCode::Unauthorized);
  }
}
