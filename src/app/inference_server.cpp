#include <vinfer/app/inference_server.hpp>
#include <vinfer/core/log.hpp>
#include <vinfer/net/signature.hpp>

#include <httplib.h>
#include <stdexcept>

namespace vinfer::app {

namespace {

void set_reply(httplib::Response& response, const Reply& reply) {
  response.status = reply.status;
  response.set_content(reply.body, "application/json");
}

}  // namespace

InferenceServer::InferenceServer(std::shared_ptr<InferenceService> service,
                                 std::size_t thread_count)
    : service_(std::move(service)), server_(std::make_unique<httplib::Server>()) {
  if (!service_) throw std::invalid_argument("InferenceServer: service is null");
  if (thread_count > 0) {
    server_->new_task_queue = [thread_count] {
      return new httplib::ThreadPool(thread_count);
    };
  }
  register_routes();
}

InferenceServer::~InferenceServer() { stop(); }

void InferenceServer::register_routes() {
  auto* svc = service_.get();

  server_->Get("/healthz", [svc](const httplib::Request&, httplib::Response& res) {
    set_reply(res, svc->healthz());
  });

  server_->Post("/infer", [svc](const httplib::Request& req, httplib::Response& res) {
    set_reply(res, svc->infer_async(req.body, req.get_header_value("Authorization")));
  });

  if (!svc->context().config.test_mode) return;

  server_->Post("/infer_sync", [svc](const httplib::Request& req, httplib::Response& res) {
    set_reply(res, svc->infer_sync(req.body, req.get_header_value("Authorization")));
  });

  server_->Get(R"(/last/([^/]+))", [svc](const httplib::Request& req, httplib::Response& res) {
    set_reply(res, svc->last(req.matches[1].str()));
  });

  server_->Post("/callback", [svc](const httplib::Request& req, httplib::Response& res) {
    const std::string sig(vinfer::net::kSignatureHeader);
    set_reply(res, svc->receive_callback(req.body, req.get_header_value(sig.c_str())));
  });
}

int InferenceServer::bind(const std::string& host, int port) {
  if (port == 0) return server_->bind_to_any_port(host);
  return server_->bind_to_port(host, port) ? port : -1;
}

bool InferenceServer::listen() {
  VINFER_LOGI("listening");
  return server_->listen_after_bind();
}

void InferenceServer::stop() {
  if (server_ && server_->is_running()) server_->stop();
}

bool InferenceServer::is_running() const { return server_->is_running(); }

}  // namespace vinfer::app
