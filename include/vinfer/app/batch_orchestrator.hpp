#pragma once

#include <vinfer/core/batch_result.hpp>
#include <vinfer/core/inference_request.hpp>
#include <vinfer/vision/image_source.hpp>
#include <vinfer/vision/inference_executor.hpp>
#include <vinfer/vision/result_normalizer.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace vinfer::app {

using ThreadStarter = std::function<std::thread(const std::function<void()>&)>;

/// Run \p worker on \p count threads and join them all. If a thread cannot
/// be started the caller also runs \p worker, so workers pulling from a
/// shared index still finish every item. \p start defaults to std::thread.
void run_worker_threads(std::size_t count,
                        const std::function<void()>& worker,
                        const ThreadStarter& start = {});

/// Runs resolve -> infer -> normalize for every source of a batch.
///
/// Items run on up to io_concurrency worker threads; each writes only its own
/// positional slot, so results[i] always belongs to sources[i]. A failure at
/// any stage yields a Failure outcome for that item only. Model calls are
/// further limited by the executor's admission semaphore, which is shared
/// across batches.
class BatchOrchestrator {
 public:
  /// \throws std::invalid_argument if a component is null or io_concurrency is 0.
  BatchOrchestrator(std::shared_ptr<const vinfer::vision::ImageSourceResolver> resolver,
                    std::shared_ptr<vinfer::vision::InferenceExecutor> executor,
                    std::shared_ptr<const vinfer::vision::ResultNormalizer> normalizer,
                    std::size_t io_concurrency);

  /// Always returns one outcome per source, in input order.
  [[nodiscard]] vinfer::core::BatchResult run(const std::string& request_id,
                                              const std::vector<std::string>& sources,
                                              const vinfer::core::InferenceParams& params) const;

  [[nodiscard]] vinfer::core::BatchResult run(const vinfer::core::InferenceRequest& request) const {
    return run(request.request_id, request.sources, request.params);
  }

  /// One source as a single unit of work.
  [[nodiscard]] vinfer::core::InferenceOutcome
  run_one(const std::string& source, const vinfer::core::InferenceParams& params) const;

  [[nodiscard]] std::size_t io_concurrency() const noexcept { return io_concurrency_; }

 private:
  std::shared_ptr<const vinfer::vision::ImageSourceResolver> resolver_;
  std::shared_ptr<vinfer::vision::InferenceExecutor> executor_;
  std::shared_ptr<const vinfer::vision::ResultNormalizer> normalizer_;
  std::size_t io_concurrency_;
};

}  // namespace vinfer::app
