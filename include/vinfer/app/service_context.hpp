#pragma once

#include <vinfer/app/batch_orchestrator.hpp>
#include <vinfer/app/config.hpp>
#include <vinfer/app/job_runner.hpp>
#include <vinfer/app/request_tracker.hpp>
#include <vinfer/net/callback_dispatcher.hpp>
#include <vinfer/net/http_client.hpp>
#include <vinfer/vision/image_source.hpp>
#include <vinfer/vision/inference_executor.hpp>
#include <vinfer/vision/model.hpp>
#include <vinfer/vision/result_normalizer.hpp>
#include <memory>

namespace vinfer::app {

/// Every long-lived component of the service, built once at startup and
/// passed to whoever needs it. There is no global state.
struct ServiceContext {
  ServiceConfig config;
  std::shared_ptr<vinfer::vision::IModel> model;
  std::shared_ptr<vinfer::vision::InferenceExecutor> executor;
  std::shared_ptr<const vinfer::vision::ResultNormalizer> normalizer;
  std::shared_ptr<const vinfer::vision::ImageSourceResolver> resolver;
  std::shared_ptr<BatchOrchestrator> orchestrator;
  std::shared_ptr<vinfer::net::CallbackDispatcher> dispatcher;
  std::shared_ptr<RequestTracker> tracker;
  std::shared_ptr<JobRunner> jobs;
};

/// Wire the components around an already loaded model and an HTTP transport.
/// \p resolver may be null, in which case one is built over \p http from config.
/// \throws std::invalid_argument on null model or client.
ServiceContext make_service_context(
    ServiceConfig config,
    std::shared_ptr<vinfer::vision::IModel> model,
    std::shared_ptr<vinfer::net::IHttpClient> http,
    std::shared_ptr<const vinfer::vision::ImageSourceResolver> resolver = nullptr);

/// Resolver with file, http(s) and s3 fetchers configured from \p config.
std::shared_ptr<const vinfer::vision::ImageSourceResolver>
make_resolver(const ServiceConfig& config, std::shared_ptr<vinfer::net::IHttpClient> http);

/// Production wiring: OnnxModel from config.model_path (warmed up) and libcurl.
/// \throws std::runtime_error (or Ort::Exception) if the model cannot be loaded.
ServiceContext make_production_context(ServiceConfig config);

}  // namespace vinfer::app
