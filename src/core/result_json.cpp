#include <vinfer/core/result_json.hpp>
#include <vinfer/core/rounding.hpp>

#include <cmath>
#include <type_traits>

namespace vinfer::core {

namespace {

using nlohmann::json;

std::unexpected<Error> shape_error(std::string what) {
  return std::unexpected(Error{ErrorCode::InvalidRequest, std::move(what)});
}

json payload_to_json(const TaskPayload& payload) {
  return std::visit(
      [](const auto& p) -> json {
        using T = std::decay_t<decltype(p)>;
        json out = json::object();
        if constexpr (std::is_same_v<T, ClassificationPayload>) {
          out["probs"] = json{{"top5conf", p.top_k_confidences}};
          out["preds"] = p.predictions;
        } else {
          out["detections"] = p.detections;
        }
        return out;
      },
      payload);
}

std::expected<StageTimings, Error> parse_timings(const json& j) {
  if (!j.is_object()) return shape_error("speed_ms must be an object");
  StageTimings t;
  t.preprocess_ms = j.value("preprocess", 0.0);
  t.inference_ms = j.value("inference", 0.0);
  t.postprocess_ms = j.value("postprocess", 0.0);
  return t;
}

std::expected<TaskPayload, Error> parse_payload(const json& result) {
  const std::string task = result.value("task", std::string{});
  if (task == "classification") {
    ClassificationPayload p;
    if (result.contains("probs") && result["probs"].contains("top5conf")) {
      p.top_k_confidences = result["probs"]["top5conf"].get<std::vector<double>>();
    }
    for (const auto& pred : result.value("preds", json::array())) {
      ClassPrediction cp;
      cp.class_id = pred.at("class_id").get<std::int64_t>();
      cp.label = pred.value("label", std::string{});
      cp.score = pred.at("score").get<double>();
      p.predictions.push_back(std::move(cp));
    }
    return p;
  }
  if (task == "detection") {
    DetectionPayload p;
    for (const auto& det : result.value("detections", json::array())) {
      Detection d;
      d.bbox_xyxy = det.at("bbox_xyxy").get<std::array<double, 4>>();
      d.score = det.at("score").get<double>();
      d.class_id = det.at("class_id").get<std::int64_t>();
      d.label = det.value("label", std::string{});
      p.detections.push_back(std::move(d));
    }
    return p;
  }
  return shape_error("unknown task '" + task + "'");
}

std::expected<InferenceOutcome, Error> parse_outcome(const json& item) {
  if (!item.is_object() || !item.contains("source") || !item["source"].is_string()) {
    return shape_error("result item needs a string 'source'");
  }
  std::string source = item["source"].get<std::string>();
  if (item.contains("error")) {
    ErrorCode code = error_code_from_string(item.value("error_kind", std::string{}));
    if (!is_item_error(code)) code = ErrorCode::InferenceFailed;
    return InferenceFailure{std::move(source),
                            Error{code, item["error"].is_string()
                                            ? item["error"].get<std::string>()
                                            : item["error"].dump()}};
  }
  if (!item.contains("result") || !item["result"].is_object()) {
    return shape_error("result item needs 'result' or 'error'");
  }
  const json& result = item["result"];
  auto payload = parse_payload(result);
  if (!payload) return std::unexpected(payload.error());
  StageTimings speed;
  if (result.contains("speed_ms")) {
    auto t = parse_timings(result["speed_ms"]);
    if (!t) return std::unexpected(t.error());
    speed = *t;
  }
  return InferenceSuccess{std::move(source), std::move(*payload), speed};
}

}  // namespace

void to_json(nlohmann::json& j, const StageTimings& t) {
  j = nlohmann::json{{"preprocess", t.preprocess_ms},
                     {"inference", t.inference_ms},
                     {"postprocess", t.postprocess_ms}};
}

void to_json(nlohmann::json& j, const ClassPrediction& p) {
  j = nlohmann::json{{"class_id", p.class_id}, {"label", p.label}, {"score", p.score}};
}

void to_json(nlohmann::json& j, const Detection& d) {
  j = nlohmann::json{{"bbox_xyxy", d.bbox_xyxy},
                     {"score", d.score},
                     {"class_id", d.class_id},
                     {"label", d.label}};
}

nlohmann::json outcome_to_json(const InferenceOutcome& outcome) {
  return std::visit(
      [](const auto& o) -> nlohmann::json {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, InferenceSuccess>) {
          nlohmann::json result = payload_to_json(o.payload);
          result["task"] = to_string(o.task());
          result["speed_ms"] = o.speed_ms;
          return nlohmann::json{{"source", o.source}, {"result", std::move(result)}};
        } else {
          return nlohmann::json{{"source", o.source},
                                {"error", o.error.message},
                                {"error_kind", std::string(to_string(o.error.code))}};
        }
      },
      outcome);
}

nlohmann::json batch_result_to_json(const BatchResult& batch, int precision) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& outcome : batch.results) {
    results.push_back(outcome_to_json(outcome));
  }
  nlohmann::json doc{{"request_id", batch.request_id}, {"results", std::move(results)}};
  round_floats(doc, precision);
  return doc;
}

void round_floats(nlohmann::json& value, int precision) {
  if (value.is_number_float()) {
    value = round_to(value.get<double>(), precision);
    return;
  }
  if (value.is_array() || value.is_object()) {
    for (auto& child : value) {
      round_floats(child, precision);
    }
  }
}

std::string serialize_batch_result(const BatchResult& batch, int precision) {
  // nlohmann::json objects are std::map backed, so keys come out sorted.
  return batch_result_to_json(batch, precision).dump();
}

std::expected<BatchResult, Error> parse_batch_result(const nlohmann::json& doc) {
  if (!doc.is_object()) return shape_error("batch result must be an object");
  if (!doc.contains("request_id") || !doc["request_id"].is_string()) {
    return shape_error("missing 'request_id'");
  }
  if (!doc.contains("results") || !doc["results"].is_array()) {
    return shape_error("missing 'results' array");
  }
  BatchResult batch;
  batch.request_id = doc["request_id"].get<std::string>();
  try {
    for (const auto& item : doc["results"]) {
      auto outcome = parse_outcome(item);
      if (!outcome) return std::unexpected(outcome.error());
      batch.results.push_back(std::move(*outcome));
    }
  } catch (const nlohmann::json::exception& e) {
    return shape_error(std::string("malformed result: ") + e.what());
  }
  return batch;
}

}  // namespace vinfer::core
