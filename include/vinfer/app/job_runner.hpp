#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

namespace vinfer::app {

/// Snapshot of background job counters.
struct JobCounters {
  std::uint64_t submitted{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t delivery_failures{0};
};

/// Supervised pool for detached jobs (accepted /infer requests).
///
/// Jobs run on a oneTBB task_group inside a task_arena capped at
/// max_concurrent_jobs. The worker pool is widened so that many jobs can run
/// without a thread waiting on the group. An exception escaping a job is
/// reported to the error sink and counted as failed; it never reaches the
/// submitter.
class JobRunner {
 public:
  using Job = std::function<void()>;
  /// (job name, reason). Called from worker threads.
  using ErrorSink = std::function<void(const std::string&, const std::string&)>;

  /// \throws std::invalid_argument if max_concurrent_jobs is 0.
  explicit JobRunner(std::size_t max_concurrent_jobs, ErrorSink sink = {});

  /// Waits for outstanding jobs.
  ~JobRunner();

  JobRunner(const JobRunner&) = delete;
  JobRunner& operator=(const JobRunner&) = delete;

  /// Queue \p job; returns immediately. False once shutdown() has begun.
  bool submit(std::string name, Job job);

  /// Block until every submitted job has finished.
  void wait();

  /// Refuse new jobs, then wait for the outstanding ones.
  void shutdown();

  void record_delivery_failure() noexcept { delivery_failures_.fetch_add(1); }

  [[nodiscard]] JobCounters counters() const noexcept;

  /// Jobs submitted but not yet finished.
  [[nodiscard]] std::uint64_t pending() const noexcept;

  [[nodiscard]] bool accepting() const noexcept { return accepting_.load(); }

 private:
  void report(const std::string& name, const std::string& what);

  ErrorSink sink_;
  std::atomic<bool> accepting_{true};
  std::atomic<std::uint64_t> submitted_{0};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> delivery_failures_{0};
  tbb::global_control parallelism_;
  tbb::task_arena arena_;
  tbb::task_group group_;
};

}  // namespace vinfer::app
