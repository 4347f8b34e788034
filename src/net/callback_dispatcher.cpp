#include <vinfer/net/callback_dispatcher.hpp>
#include <vinfer/core/log.hpp>
#include <vinfer/core/result_json.hpp>
#include <vinfer/net/signature.hpp>

#include <stdexcept>
#include <thread>

namespace vinfer::net {

CallbackDispatcher::CallbackDispatcher(std::shared_ptr<IHttpClient> client,
                                       CallbackOptions options)
    : client_(std::move(client)), options_(std::move(options)) {
  if (!client_) throw std::invalid_argument("CallbackDispatcher: http client is null");
  if (options_.max_retries < 0) options_.max_retries = 0;
}

HttpRequest CallbackDispatcher::build_request(const std::string& payload,
                                              const std::string& callback_url) const {
  HttpRequest req;
  req.method = "POST";
  req.url = callback_url;
  req.body = payload;
  req.timeout = options_.timeout;
  req.headers.emplace_back("Content-Type: application/json");
  if (!options_.shared_secret.empty()) {
    req.headers.push_back(std::string(kSignatureHeader) + ": " +
                          signature_header_value(options_.shared_secret, payload));
  }
  return req;
}

DeliveryOutcome CallbackDispatcher::deliver(const vinfer::core::BatchResult& batch,
                                            const std::string& callback_url) const {
  const std::string payload = vinfer::core::serialize_batch_result(batch, options_.precision);
  const HttpRequest req = build_request(payload, callback_url);

  DeliveryOutcome outcome;
  const int total_attempts = 1 + options_.max_retries;
  for (int attempt = 1; attempt <= total_attempts; ++attempt) {
    if (attempt > 1) {
      std::this_thread::sleep_for(options_.retry_backoff * (attempt - 1));
    }
    outcome.attempts = attempt;
    auto resp = client_->perform(req);
    if (!resp) {
      outcome.http_status = 0;
      outcome.error = resp.error().message;
    } else if (!resp->ok()) {
      outcome.http_status = resp->status;
      outcome.error = "callback returned HTTP " + std::to_string(resp->status);
    } else {
      outcome.http_status = resp->status;
      outcome.error.clear();
      outcome.delivered = true;
      VINFER_LOGI("callback delivered request_id=", batch.request_id, " status=",
                  resp->status, " attempts=", attempt);
      return outcome;
    }
    VINFER_LOGW("callback attempt ", attempt, "/", total_attempts, " failed request_id=",
                batch.request_id, ": ", outcome.error);
  }
  VINFER_LOGE("callback delivery failed request_id=", batch.request_id, " url=", callback_url,
              ": ", outcome.error);
  return outcome;
}

}  // namespace vinfer::net
