#pragma once

#include <vinfer/app/inference_service.hpp>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace vinfer::app {

/// cpp-httplib front end over InferenceService.
///
/// Routes: GET /healthz, POST /infer. In test mode also POST /infer_sync,
/// GET /last/{request_id} and POST /callback.
class InferenceServer {
 public:
  /// \param thread_count HTTP worker threads (0 = library default).
  explicit InferenceServer(std::shared_ptr<InferenceService> service, std::size_t thread_count = 0);
  ~InferenceServer();

  InferenceServer(const InferenceServer&) = delete;
  InferenceServer& operator=(const InferenceServer&) = delete;

  /// Bind to host:port. Port 0 picks a free port. Returns the bound port, -1 on failure.
  [[nodiscard]] int bind(const std::string& host, int port);

  /// Serve until stop(). Returns false if the server could not run.
  bool listen();

  /// Stop accepting connections; listen() returns. Safe from another thread.
  void stop();

  [[nodiscard]] bool is_running() const;

 private:
  void register_routes();

  std::shared_ptr<InferenceService> service_;
  std::unique_ptr<httplib::Server> server_;
};

}  // namespace vinfer::app
