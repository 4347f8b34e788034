#include <vinfer/app/inference_service.hpp>
#include <vinfer/core/log.hpp>
#include <vinfer/core/result_json.hpp>
#include <vinfer/net/signature.hpp>

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace vinfer::app {

namespace {

namespace vc = vinfer::core;
using nlohmann::json;

Reply error_reply(const vc::Error& error) {
  return Reply{http_status_for(error.code), error_body(error.message)};
}

}  // namespace

std::string error_body(std::string_view message) {
  return json{{"error", std::string(message)}}.dump();
}

int http_status_for(vc::ErrorCode code) noexcept {
  switch (code) {
    case vc::ErrorCode::Unauthorized:
      return 401;
    case vc::ErrorCode::NotFound:
      return 404;
    case vc::ErrorCode::InvalidRequest:
      return 400;
    default:
      return 500;
  }
}

InferenceService::InferenceService(ServiceContext context) : ctx_(std::move(context)) {
  if (!ctx_.orchestrator || !ctx_.dispatcher || !ctx_.tracker || !ctx_.jobs) {
    throw std::invalid_argument("InferenceService: incomplete service context");
  }
}

InferenceService::~InferenceService() { drain(); }

Reply InferenceService::healthz() const { return Reply{200, json{{"ok", true}}.dump()}; }

Reply InferenceService::infer_async(std::string_view body, std::string_view authorization) {
  if (auto auth = check_bearer(ctx_.config.inbound_token, authorization); !auth) {
    VINFER_LOGW("/infer rejected: ", auth.error().message);
    return error_reply(auth.error());
  }
  auto request = parse_infer_request(body, DeliveryMode::Async);
  if (!request) return error_reply(request.error());

  const std::string request_id = request->request_id;
  const std::size_t n = request->sources.size();
  if (!submit(std::move(*request))) {
    return Reply{503, error_body("server is shutting down")};
  }
  VINFER_LOGI("job accepted request_id=", request_id, " sources=", n);
  return Reply{202, json{{"request_id", request_id}, {"status", "accepted"}}.dump()};
}

Reply InferenceService::infer_sync(std::string_view body, std::string_view authorization) {
  if (auto auth = check_bearer(ctx_.config.inbound_token, authorization); !auth) {
    VINFER_LOGW("/infer_sync rejected: ", auth.error().message);
    return error_reply(auth.error());
  }
  auto request = parse_infer_request(body, DeliveryMode::Sync);
  if (!request) return error_reply(request.error());

  vc::BatchResult batch = ctx_.orchestrator->run(*request);
  std::string payload = vc::serialize_batch_result(batch, ctx_.config.round_precision);
  if (ctx_.config.test_mode) ctx_.tracker->put(batch.request_id, std::move(batch));
  return Reply{200, std::move(payload)};
}

Reply InferenceService::last(const std::string& request_id) {
  auto batch = ctx_.tracker->get(request_id);
  if (!batch) return Reply{404, error_body("not found")};
  return Reply{200, vc::serialize_batch_result(*batch, ctx_.config.round_precision)};
}

Reply InferenceService::receive_callback(std::string_view body, std::string_view signature_header) {
  if (!ctx_.config.shared_secret.empty() && !signature_header.empty() &&
      !vinfer::net::verify_signature(ctx_.config.shared_secret, body, signature_header)) {
    VINFER_LOGW("/callback rejected: signature mismatch");
    return Reply{400, error_body("invalid signature")};
  }
  const json doc = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) return Reply{400, error_body("malformed JSON body")};
  auto batch = vc::parse_batch_result(doc);
  if (!batch) return error_reply(batch.error());
  const std::string id = batch->request_id;
  ctx_.tracker->put(id, std::move(*batch));
  return Reply{200, json{{"ok", true}}.dump()};
}

bool InferenceService::submit(vc::InferenceRequest request) {
  std::string name = "infer:" + request.request_id;
  return ctx_.jobs->submit(std::move(name), [this, request = std::move(request)]() {
    run_job(request);
  });
}

void InferenceService::run_job(const vc::InferenceRequest& request) {
  vc::BatchResult batch = ctx_.orchestrator->run(request);
  if (request.callback_url) {
    auto outcome = ctx_.dispatcher->deliver(batch, *request.callback_url);
    if (!outcome.delivered) ctx_.jobs->record_delivery_failure();
  }
  if (ctx_.config.test_mode) ctx_.tracker->put(batch.request_id, std::move(batch));
}

void InferenceService::drain() {
  if (ctx_.jobs->accepting()) {
    VINFER_LOGI("draining ", ctx_.jobs->pending(), " background job(s)");
  }
  ctx_.jobs->shutdown();
}

}  // namespace vinfer::app
