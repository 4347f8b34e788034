#pragma once

#include <vinfer/app/request_codec.hpp>
#include <vinfer/app/service_context.hpp>
#include <vinfer/core/inference_request.hpp>
#include <string>
#include <string_view>

namespace vinfer::app {

/// Status code plus JSON body text of one HTTP answer.
struct Reply {
  int status{200};
  std::string body;
};

/// Request handling behind the HTTP routes, independent of the HTTP library.
///
/// Async jobs are handed to the context's JobRunner: orchestrate, deliver the
/// signed callback, then (test mode) record the result in the tracker. A
/// failed delivery is logged and counted; it never re-runs inference.
class InferenceService {
 public:
  explicit InferenceService(ServiceContext context);

  /// Drains: queued jobs hold a pointer to this service.
  ~InferenceService();

  InferenceService(const InferenceService&) = delete;
  InferenceService& operator=(const InferenceService&) = delete;

  /// GET /healthz
  [[nodiscard]] Reply healthz() const;

  /// POST /infer: 202 {request_id, status: "accepted"} once the job is queued.
  [[nodiscard]] Reply infer_async(std::string_view body, std::string_view authorization);

  /// POST /infer_sync: 200 {request_id, results}.
  [[nodiscard]] Reply infer_sync(std::string_view body, std::string_view authorization);

  /// GET /last/{request_id}: tracked result or 404.
  [[nodiscard]] Reply last(const std::string& request_id);

  /// POST /callback (test mode): verify, parse and track a delivered result.
  [[nodiscard]] Reply receive_callback(std::string_view body, std::string_view signature_header);

  /// Queue the background job for an accepted async request.
  /// False if the job runner no longer accepts work.
  bool submit(vinfer::core::InferenceRequest request);

  /// Stop accepting jobs and wait for the running ones.
  void drain();

  [[nodiscard]] const ServiceContext& context() const noexcept { return ctx_; }

 private:
  void run_job(const vinfer::core::InferenceRequest& request);

  ServiceContext ctx_;
};

/// {"error": message}
[[nodiscard]] std::string error_body(std::string_view message);

/// HTTP status used for a request-level error code.
[[nodiscard]] int http_status_for(vinfer::core::ErrorCode code) noexcept;

}  // namespace vinfer::app
