#include <vinfer/app/job_runner.hpp>
#include <vinfer/core/log.hpp>

#include <tbb/info.h>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace vinfer::app {

namespace {

int arena_slots(std::size_t max_concurrent_jobs) {
  return max_concurrent_jobs == 0 ? 1 : static_cast<int>(max_concurrent_jobs);
}

}  // namespace

// No slot is reserved for external threads: all max_concurrent_jobs slots go
// to TBB workers, which pick jobs up as soon as they are submitted.
JobRunner::JobRunner(std::size_t max_concurrent_jobs, ErrorSink sink)
    : sink_(std::move(sink)),
      parallelism_(tbb::global_control::max_allowed_parallelism,
                   static_cast<std::size_t>(
                       std::max(tbb::info::default_concurrency(),
                                arena_slots(max_concurrent_jobs) + 1))),
      arena_(arena_slots(max_concurrent_jobs), 0) {
  if (max_concurrent_jobs == 0) {
    throw std::invalid_argument("JobRunner: max_concurrent_jobs must be >= 1");
  }
}

JobRunner::~JobRunner() { shutdown(); }

bool JobRunner::submit(std::string name, Job job) {
  if (!accepting_.load() || !job) return false;
  submitted_.fetch_add(1);
  arena_.execute([this, name = std::move(name), job = std::move(job)]() mutable {
    group_.run([this, name = std::move(name), job = std::move(job)]() {
      try {
        job();
        completed_.fetch_add(1);
      } catch (const std::exception& e) {
        failed_.fetch_add(1);
        report(name, e.what());
      } catch (...) {
        failed_.fetch_add(1);
        report(name, "unknown exception");
      }
    });
  });
  return true;
}

void JobRunner::wait() {
  arena_.execute([this]() { group_.wait(); });
}

void JobRunner::shutdown() {
  accepting_.store(false);
  wait();
}

void JobRunner::report(const std::string& name, const std::string& what) {
  VINFER_LOGE("background job '", name, "' failed: ", what);
  if (!sink_) return;
  try {
    sink_(name, what);
  } catch (const std::exception& e) {
    VINFER_LOGE("job error sink threw: ", e.what());
  }
}

JobCounters JobRunner::counters() const noexcept {
  return JobCounters{submitted_.load(), completed_.load(), failed_.load(),
                     delivery_failures_.load()};
}

std::uint64_t JobRunner::pending() const noexcept {
  return submitted_.load() - completed_.load() - failed_.load();
}

}  // namespace vinfer::app
