#pragma once

#include <vinfer/core/batch_result.hpp>
#include <vinfer/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace vinfer::core {

/// JSON wire form of results.
///
/// Success: {"source", "result": {"task", "speed_ms": {...}, "probs": {"top5conf"}, "preds"}}
///      or  {"source", "result": {"task", "speed_ms": {...}, "detections"}}
/// Failure: {"source", "error", "error_kind"}

void to_json(nlohmann::json& j, const StageTimings& t);
void to_json(nlohmann::json& j, const ClassPrediction& p);
void to_json(nlohmann::json& j, const Detection& d);

[[nodiscard]] nlohmann::json outcome_to_json(const InferenceOutcome& outcome);

/// {"request_id", "results"} with every float rounded to \p precision.
[[nodiscard]] nlohmann::json batch_result_to_json(const BatchResult& batch, int precision);

/// Round every floating value in \p value to \p precision decimal places,
/// recursing through arrays and objects. Strings, integers, booleans and null
/// are left untouched.
void round_floats(nlohmann::json& value, int precision);

/// Canonical payload bytes: compact UTF-8 JSON, sorted keys, rounded floats.
[[nodiscard]] std::string serialize_batch_result(const BatchResult& batch, int precision);

/// Inverse of batch_result_to_json. InvalidRequest if the document does not
/// have the expected shape.
[[nodiscard]] std::expected<BatchResult, Error> parse_batch_result(const nlohmann::json& doc);

}  // namespace vinfer::core
