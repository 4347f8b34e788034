/**
 * vinfer-server: batch image inference service (HTTP).
 * Build: cmake -B build && cmake --build build
 * Run:   MODEL_PATH=model.onnx ./build/vinfer-server [--config path]
 * Settings come from built-in defaults, then --config (key=value), then the environment.
 */

#include <vinfer/app/config.hpp>
#include <vinfer/app/inference_server.hpp>
#include <vinfer/app/inference_service.hpp>
#include <vinfer/app/service_context.hpp>
#include <vinfer/core/log.hpp>

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

constexpr int kConfigErrorExit = 2;

void print_usage() {
  std::cout << "Usage: vinfer-server [options]\n"
            << "  --config <path>   Settings file (key=value); environment overrides it\n"
            << "  --model <path>    Override MODEL_PATH\n"
            << "  --host <addr>     Override HOST (default 0.0.0.0)\n"
            << "  --port <n>        Override PORT (default 8000)\n"
            << "  --test-mode       Enable /infer_sync, /last/{id} and /callback\n";
}

}  // namespace

int main(int argc, char *argv[]) {
  std::optional<std::string> config_path;
  std::optional<std::string> model_override;
  std::optional<std::string> host_override;
  std::optional<std::string> port_override;
  bool test_mode_override = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--host" && i + 1 < argc) {
      host_override = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      port_override = argv[++i];
    } else if (arg == "--test-mode") {
      test_mode_override = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  // Command-line overrides sit on top of the environment layer.
  const vinfer::app::EnvLookup base_env = vinfer::app::process_env();
  const vinfer::app::EnvLookup env = [&](const std::string& name) -> std::optional<std::string> {
    if (name == "MODEL_PATH" && model_override) return model_override;
    if (name == "HOST" && host_override) return host_override;
    if (name == "PORT" && port_override) return port_override;
    if (name == "TEST_MODE" && test_mode_override) return std::string("1");
    return base_env(name);
  };

  auto cfg = vinfer::app::load_service_config(config_path, env);
  if (!cfg) {
    std::cerr << "Config error: " << cfg.error().message << "\n";
    return kConfigErrorExit;
  }
  if (auto level = vinfer::log::parse_level(cfg->log_level)) vinfer::log::set_level(*level);
  VINFER_LOGI("config: ", vinfer::app::describe(*cfg));

  // Block SIGINT/SIGTERM in every thread; a dedicated thread waits for them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::shared_ptr<vinfer::app::InferenceService> service;
  try {
    service = std::make_shared<vinfer::app::InferenceService>(
        vinfer::app::make_production_context(*cfg));
  } catch (const std::exception& e) {
    std::cerr << "Config error: cannot load model: " << e.what() << "\n";
    return kConfigErrorExit;
  }

  vinfer::app::InferenceServer server(service);
  const int port = server.bind(cfg->host, cfg->port);
  if (port < 0) {
    std::cerr << "Failed to bind " << cfg->host << ":" << cfg->port << "\n";
    return 1;
  }
  VINFER_LOGI("bound ", cfg->host, ":", port, cfg->test_mode ? " (test mode)" : "");

  std::atomic<bool> finished{false};
  std::thread signal_thread([&]() {
    int sig = 0;
    sigwait(&signals, &sig);
    if (!finished.load()) VINFER_LOGI("signal ", sig, " received, shutting down");
    server.stop();
  });

  const bool served = server.listen();
  finished.store(true);
  ::kill(::getpid(), SIGTERM);  // wake the signal thread if listen() ended on its own
  signal_thread.join();

  service->drain();
  const auto counters = service->context().jobs->counters();
  VINFER_LOGI("stopped: jobs submitted=", counters.submitted, " completed=", counters.completed,
              " failed=", counters.failed, " delivery_failures=", counters.delivery_failures);
  return served ? 0 : 1;
}
