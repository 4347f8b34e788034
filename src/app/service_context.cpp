#include <vinfer/app/service_context.hpp>
#include <vinfer/core/log.hpp>
#include <vinfer/vision/onnx_model.hpp>

#include <stdexcept>

namespace vinfer::app {

namespace vv = vinfer::vision;
namespace vn = vinfer::net;

std::shared_ptr<const vv::ImageSourceResolver>
make_resolver(const ServiceConfig& config, std::shared_ptr<vn::IHttpClient> http) {
  vv::HttpFetchOptions fetch;
  fetch.timeout = config.http_timeout;

  vv::S3Options s3;
  s3.enabled = config.enable_s3;
  s3.endpoint = config.s3_endpoint;
  s3.region = config.aws_region;
  s3.access_key = config.aws_access_key_id;
  s3.secret_key = config.aws_secret_access_key;
  s3.session_token = config.aws_session_token;
  s3.http = fetch;

  return std::make_shared<const vv::ImageSourceResolver>(
      std::make_shared<vv::FileFetcher>(), std::make_shared<vv::HttpFetcher>(http, fetch),
      std::make_shared<vv::S3Fetcher>(http, std::move(s3)));
}

ServiceContext make_service_context(ServiceConfig config,
                                    std::shared_ptr<vv::IModel> model,
                                    std::shared_ptr<vn::IHttpClient> http,
                                    std::shared_ptr<const vv::ImageSourceResolver> resolver) {
  if (!model) throw std::invalid_argument("make_service_context: model is null");
  if (!http) throw std::invalid_argument("make_service_context: http client is null");

  ServiceContext ctx;
  ctx.model = model;
  ctx.executor = std::make_shared<vv::InferenceExecutor>(model, config.max_inflight, config.predict);

  vv::NormalizerOptions norm;
  norm.top_k = config.top_k;
  norm.precision = config.round_precision;
  ctx.normalizer = std::make_shared<const vv::ResultNormalizer>(norm, model->labels());

  ctx.resolver = resolver ? std::move(resolver) : make_resolver(config, http);
  ctx.orchestrator = std::make_shared<BatchOrchestrator>(ctx.resolver, ctx.executor, ctx.normalizer,
                                                         config.io_concurrency);

  vn::CallbackOptions cb;
  cb.shared_secret = config.shared_secret;
  cb.timeout = config.post_timeout;
  cb.max_retries = config.callback_max_retries;
  cb.retry_backoff = config.callback_retry_backoff;
  cb.precision = config.round_precision;
  ctx.dispatcher = std::make_shared<vn::CallbackDispatcher>(http, std::move(cb));

  ctx.tracker = std::make_shared<RequestTracker>(config.tracker_capacity);
  ctx.jobs = std::make_shared<JobRunner>(config.max_jobs);
  ctx.config = std::move(config);
  return ctx;
}

ServiceContext make_production_context(ServiceConfig config) {
  VINFER_LOGI("loading model ", config.model_path, " on ", config.device);
  auto model = std::make_shared<vv::OnnxModel>(config.model_path, config.device, config.labels_path);
  model->warmup();
  VINFER_LOGI("model loaded: ", model->is_classifier() ? "classification" : "detection", ", ",
              model->labels().size(), " labels");
  return make_service_context(std::move(config), std::move(model),
                              std::make_shared<vn::CurlHttpClient>());
}

}  // namespace vinfer::app
