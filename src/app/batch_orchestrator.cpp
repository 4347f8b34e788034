#include <vinfer/app/batch_orchestrator.hpp>
#include <vinfer/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace vinfer::app {

namespace {

namespace vc = vinfer::core;

vc::InferenceOutcome failure(const std::string& source, vc::Error error) {
  VINFER_LOGW("item failed source=", source, " kind=", vc::to_string(error.code), ": ",
              error.message);
  return vc::InferenceFailure{source, std::move(error)};
}

/// Joins every started thread on scope exit.
class JoinGuard {
 public:
  explicit JoinGuard(std::vector<std::thread>& threads) : threads_(threads) {}
  ~JoinGuard() {
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }
  JoinGuard(const JoinGuard&) = delete;
  JoinGuard& operator=(const JoinGuard&) = delete;

 private:
  std::vector<std::thread>& threads_;
};

}  // namespace

void run_worker_threads(std::size_t count,
                        const std::function<void()>& worker,
                        const ThreadStarter& start) {
  std::vector<std::thread> threads;
  threads.reserve(count);
  JoinGuard guard(threads);
  try {
    for (std::size_t i = 0; i < count; ++i) {
      threads.push_back(start ? start(worker) : std::thread(worker));
    }
  } catch (const std::system_error& e) {
    VINFER_LOGW("started ", threads.size(), " of ", count,
                " worker threads, running the rest inline: ", e.what());
    worker();
  }
}

BatchOrchestrator::BatchOrchestrator(
    std::shared_ptr<const vinfer::vision::ImageSourceResolver> resolver,
    std::shared_ptr<vinfer::vision::InferenceExecutor> executor,
    std::shared_ptr<const vinfer::vision::ResultNormalizer> normalizer,
    std::size_t io_concurrency)
    : resolver_(std::move(resolver)),
      executor_(std::move(executor)),
      normalizer_(std::move(normalizer)),
      io_concurrency_(io_concurrency) {
  if (!resolver_ || !executor_ || !normalizer_) {
    throw std::invalid_argument("BatchOrchestrator: null component");
  }
  if (io_concurrency_ == 0) {
    throw std::invalid_argument("BatchOrchestrator: io_concurrency must be >= 1");
  }
}

vc::InferenceOutcome BatchOrchestrator::run_one(const std::string& source,
                                                const vc::InferenceParams& params) const {
  try {
    auto image = resolver_->resolve(source);
    if (!image) return failure(source, image.error());

    auto raw = executor_->infer(image->image, params);
    if (!raw) return failure(source, raw.error());

    auto normalized = normalizer_->normalize(*raw);
    return vc::InferenceSuccess{source, std::move(normalized.payload), normalized.speed_ms};
  } catch (const std::exception& e) {
    return failure(source, vc::Error{vc::ErrorCode::InferenceFailed, e.what()});
  }
}

vc::BatchResult BatchOrchestrator::run(const std::string& request_id,
                                       const std::vector<std::string>& sources,
                                       const vc::InferenceParams& params) const {
  const auto start = std::chrono::steady_clock::now();
  const std::size_t n = sources.size();

  vc::BatchResult batch;
  batch.request_id = request_id;
  batch.results.resize(n);

  const std::size_t workers = std::min(io_concurrency_, n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) {
      batch.results[i] = run_one(sources[i], params);
    }
  } else {
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
      while (true) {
        const std::size_t idx = next.fetch_add(1);
        if (idx >= n) break;
        batch.results[idx] = run_one(sources[idx], params);
      }
    };

    run_worker_threads(workers, worker);
  }

  const auto ok = static_cast<std::size_t>(
      std::count_if(batch.results.begin(), batch.results.end(), [](const auto& o) {
        return std::holds_alternative<vc::InferenceSuccess>(o);
      }));
  const double wall_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  VINFER_LOGI("batch done request_id=", request_id, " ok=", ok, " failed=", n - ok,
              " wall_ms=", wall_ms);
  return batch;
}

}  // namespace vinfer::app
