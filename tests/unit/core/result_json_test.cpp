#include <vinfer/core/batch_result.hpp>
#include <vinfer/core/result_json.hpp>
#include <vinfer/core/rounding.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

namespace vc = vinfer::core;
using nlohmann::json;

namespace {

vc::BatchResult sample_batch() {
  vc::ClassificationPayload cls;
  cls.top_k_confidences = {0.912345678, 0.05};
  cls.predictions = {{3, "cat", 0.912345678}, {1, "dog", 0.05}};

  vc::DetectionPayload det;
  det.detections.push_back({{1.23456789, 2.0, 30.5, 40.000001}, 0.8765432, 0, "person"});

  vc::BatchResult batch;
  batch.request_id = "r-1";
  batch.results.push_back(vc::InferenceSuccess{"file:///a.jpg", cls, {1.111111, 2.222222, 3.333333}});
  batch.results.push_back(vc::InferenceSuccess{"s3://b/k.png", det, {0.0, 0.0, 0.0}});
  batch.results.push_back(
      vc::InferenceFailure{"http://bad", {vc::ErrorCode::TransportFailed, "HTTP 404"}});
  return batch;
}

}  // namespace

TEST(RoundTo, RoundsHalfAwayFromZero) {
  EXPECT_DOUBLE_EQ(vc::round_to(0.123456, 5), 0.12346);
  EXPECT_DOUBLE_EQ(vc::round_to(-0.123456, 5), -0.12346);
  EXPECT_DOUBLE_EQ(vc::round_to(2.5, 0), 3.0);
  EXPECT_DOUBLE_EQ(vc::round_to(1.0, 5), 1.0);
}

TEST(RoundTo, IsIdempotent) {
  for (double v : {0.1234567, 98.7654321, -3.33333333, 1e-7}) {
    const double once = vc::round_to(v, 5);
    EXPECT_EQ(vc::round_to(once, 5), once);
  }
}

TEST(RoundTo, LeavesNonFiniteUnchanged) {
  EXPECT_TRUE(std::isnan(vc::round_to(std::numeric_limits<double>::quiet_NaN(), 5)));
  EXPECT_TRUE(std::isinf(vc::round_to(std::numeric_limits<double>::infinity(), 5)));
}

TEST(RoundFloats, RecursesAndLeavesOtherTypesAlone) {
  json doc = {
      {"a", 0.123456789},
      {"list", {1.987654321, 2, "3.14159265"}},
      {"nested", {{"x", {{"y", 0.000004}}}, {"n", nullptr}, {"i", 42}, {"b", true}}},
  };
  vc::round_floats(doc, 3);
  EXPECT_DOUBLE_EQ(doc["a"].get<double>(), 0.123);
  EXPECT_DOUBLE_EQ(doc["list"][0].get<double>(), 1.988);
  EXPECT_TRUE(doc["list"][1].is_number_integer());
  EXPECT_EQ(doc["list"][1].get<int>(), 2);
  EXPECT_EQ(doc["list"][2].get<std::string>(), "3.14159265");
  EXPECT_DOUBLE_EQ(doc["nested"]["x"]["y"].get<double>(), 0.0);
  EXPECT_TRUE(doc["nested"]["n"].is_null());
  EXPECT_EQ(doc["nested"]["i"].get<int>(), 42);
  EXPECT_TRUE(doc["nested"]["b"].get<bool>());
}

TEST(ResultJson, WireShapeOfEachOutcome) {
  const json doc = vc::batch_result_to_json(sample_batch(), 5);
  EXPECT_EQ(doc["request_id"], "r-1");
  ASSERT_EQ(doc["results"].size(), 3u);

  const json& cls = doc["results"][0];
  EXPECT_EQ(cls["source"], "file:///a.jpg");
  EXPECT_EQ(cls["result"]["task"], "classification");
  EXPECT_DOUBLE_EQ(cls["result"]["probs"]["top5conf"][0].get<double>(), 0.91235);
  EXPECT_EQ(cls["result"]["preds"][0]["label"], "cat");
  EXPECT_EQ(cls["result"]["preds"][0]["class_id"], 3);
  EXPECT_DOUBLE_EQ(cls["result"]["speed_ms"]["inference"].get<double>(), 2.22222);

  const json& det = doc["results"][1];
  EXPECT_EQ(det["result"]["task"], "detection");
  EXPECT_DOUBLE_EQ(det["result"]["detections"][0]["bbox_xyxy"][0].get<double>(), 1.23457);
  EXPECT_DOUBLE_EQ(det["result"]["detections"][0]["score"].get<double>(), 0.87654);
  EXPECT_EQ(det["result"]["detections"][0]["label"], "person");

  const json& fail = doc["results"][2];
  EXPECT_EQ(fail["source"], "http://bad");
  EXPECT_EQ(fail["error"], "HTTP 404");
  EXPECT_EQ(fail["error_kind"], "transport");
  EXPECT_FALSE(fail.contains("result"));
}

TEST(ResultJson, SerializationIsCompactSortedAndStable) {
  const std::string first = vc::serialize_batch_result(sample_batch(), 5);
  const std::string second = vc::serialize_batch_result(sample_batch(), 5);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.find(' '), std::string::npos);
  EXPECT_EQ(first.find('\n'), std::string::npos);
  EXPECT_LT(first.find("\"request_id\""), first.find("\"results\""));
}

TEST(ResultJson, ParseRestoresOutcomes) {
  const json doc = vc::batch_result_to_json(sample_batch(), 5);
  auto parsed = vc::parse_batch_result(doc);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
  EXPECT_EQ(parsed->request_id, "r-1");
  ASSERT_EQ(parsed->results.size(), 3u);
  ASSERT_TRUE(std::holds_alternative<vc::InferenceSuccess>(parsed->results[0]));
  EXPECT_EQ(std::get<vc::InferenceSuccess>(parsed->results[0]).task(),
            vc::TaskKind::Classification);
  ASSERT_TRUE(std::holds_alternative<vc::InferenceFailure>(parsed->results[2]));
  EXPECT_EQ(std::get<vc::InferenceFailure>(parsed->results[2]).error.code,
            vc::ErrorCode::TransportFailed);
  // Serializing the parsed document gives the same bytes.
  EXPECT_EQ(vc::serialize_batch_result(*parsed, 5), doc.dump());
}

TEST(ResultJson, ParseRejectsWrongShape) {
  EXPECT_FALSE(vc::parse_batch_result(json::array()).has_value());
  EXPECT_FALSE(vc::parse_batch_result(json{{"results", json::array()}}).has_value());
  EXPECT_FALSE(vc::parse_batch_result(json{{"request_id", "x"}, {"results", {{{"nope", 1}}}}})
                   .has_value());
  auto bad_task = vc::parse_batch_result(
      json{{"request_id", "x"},
           {"results", {{{"source", "a"}, {"result", {{"task", "segment"}}}}}}});
  ASSERT_FALSE(bad_task.has_value());
  EXPECT_EQ(bad_task.error().code, vc::ErrorCode::InvalidRequest);
}
