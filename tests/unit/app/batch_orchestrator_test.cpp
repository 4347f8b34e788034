#include "support/fakes.hpp"
#include <vinfer/app/batch_orchestrator.hpp>
#include <vinfer/vision/mock_model.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace va = vinfer::app;
namespace vv = vinfer::vision;
namespace vc = vinfer::core;
namespace vt = vinfer::testing;

namespace {

struct Harness {
  std::shared_ptr<vv::MockModel> model;
  std::shared_ptr<vt::StubFetcher> fetcher;
  std::shared_ptr<vv::InferenceExecutor> executor;
  std::unique_ptr<va::BatchOrchestrator> orchestrator;
};

Harness make_harness(std::size_t max_inflight, std::size_t io_concurrency) {
  Harness h;
  h.model = std::make_shared<vv::MockModel>(vv::LabelMap({"cat", "dog", "bird"}));
  h.model->set_prediction(vv::ClassProbabilities{{0.7f, 0.2f, 0.1f}});
  h.fetcher = std::make_shared<vt::StubFetcher>();
  auto resolver = std::make_shared<const vv::ImageSourceResolver>(
      std::make_shared<vv::FileFetcher>(), h.fetcher, h.fetcher);
  h.executor = std::make_shared<vv::InferenceExecutor>(h.model, max_inflight);
  auto normalizer = std::make_shared<const vv::ResultNormalizer>(vv::NormalizerOptions{},
                                                                 h.model->labels());
  h.orchestrator =
      std::make_unique<va::BatchOrchestrator>(resolver, h.executor, normalizer, io_concurrency);
  return h;
}

}  // namespace

TEST(BatchOrchestrator, RejectsBadConstruction) {
  auto h = make_harness(1, 1);
  EXPECT_THROW(va::BatchOrchestrator(nullptr, h.executor, nullptr, 1), std::invalid_argument);
}

TEST(BatchOrchestrator, FileSuccessAndHttpFailureScenario) {
  const auto path = std::filesystem::temp_directory_path() / "vinfer_orch_a.png";
  {
    std::ofstream f(path, std::ios::binary);
    f << vt::encode_png();
  }
  auto h = make_harness(2, 4);
  const std::string file_uri = "file://" + path.string();

  auto batch = h.orchestrator->run("t1", {file_uri, "http://bad"}, {});
  std::filesystem::remove(path);

  EXPECT_EQ(batch.request_id, "t1");
  ASSERT_EQ(batch.results.size(), 2u);

  ASSERT_TRUE(std::holds_alternative<vc::InferenceSuccess>(batch.results[0]));
  const auto& ok = std::get<vc::InferenceSuccess>(batch.results[0]);
  EXPECT_EQ(ok.source, file_uri);
  EXPECT_EQ(ok.task(), vc::TaskKind::Classification);
  const auto& cls = std::get<vc::ClassificationPayload>(ok.payload);
  EXPECT_EQ(cls.predictions[0].label, "cat");
  EXPECT_DOUBLE_EQ(cls.predictions[0].score, 0.7);

  ASSERT_TRUE(std::holds_alternative<vc::InferenceFailure>(batch.results[1]));
  const auto& fail = std::get<vc::InferenceFailure>(batch.results[1]);
  EXPECT_EQ(fail.source, "http://bad");
  EXPECT_EQ(fail.error.code, vc::ErrorCode::TransportFailed);
  EXPECT_FALSE(fail.error.message.empty());
}

TEST(BatchOrchestrator, PreservesInputOrderUnderConcurrency) {
  auto h = make_harness(3, 8);
  h.model->set_delay(std::chrono::milliseconds(5));
  std::vector<std::string> sources;
  for (int i = 0; i < 30; ++i) {
    const std::string uri = "https://img.example/" + std::to_string(i) + ".png";
    if (i % 4 != 0) h.fetcher->add(uri, vt::encode_png(4 + i, 4));
    sources.push_back(uri);
  }

  auto batch = h.orchestrator->run("order", sources, {});
  ASSERT_EQ(batch.results.size(), sources.size());
  for (std::size_t i = 0; i < sources.size(); ++i) {
    EXPECT_EQ(vc::source_of(batch.results[i]), sources[i]);
    EXPECT_EQ(std::holds_alternative<vc::InferenceFailure>(batch.results[i]), i % 4 == 0) << i;
  }
  EXPECT_LE(h.model->peak_concurrency(), 3u);
}

TEST(BatchOrchestrator, MaxInflightOneWithFiveSources) {
  auto h = make_harness(1, 5);
  h.model->set_delay(std::chrono::milliseconds(15));
  std::vector<std::string> sources;
  for (int i = 0; i < 5; ++i) {
    const std::string uri = "s3://bucket/" + std::to_string(i) + ".png";
    h.fetcher->add(uri, vt::encode_png());
    sources.push_back(uri);
  }
  auto batch = h.orchestrator->run("m1", sources, {});
  ASSERT_EQ(batch.results.size(), 5u);
  for (const auto& r : batch.results) {
    EXPECT_TRUE(std::holds_alternative<vc::InferenceSuccess>(r));
  }
  EXPECT_EQ(h.model->call_count(), 5u);
  EXPECT_EQ(h.model->peak_concurrency(), 1u);
}

TEST(BatchOrchestrator, AllItemsFailingStillYieldsBatch) {
  auto h = make_harness(2, 2);
  h.model->set_throw(true);
  h.fetcher->add("http://a", vt::encode_png());
  h.fetcher->add("http://b", "garbage");

  auto batch = h.orchestrator->run("fail", {"http://a", "http://b", "gopher://c"}, {});
  ASSERT_EQ(batch.results.size(), 3u);
  EXPECT_EQ(std::get<vc::InferenceFailure>(batch.results[0]).error.code,
            vc::ErrorCode::InferenceFailed);
  EXPECT_EQ(std::get<vc::InferenceFailure>(batch.results[1]).error.code,
            vc::ErrorCode::DecodeFailed);
  EXPECT_EQ(std::get<vc::InferenceFailure>(batch.results[2]).error.code,
            vc::ErrorCode::UnsupportedScheme);
  EXPECT_EQ(h.executor->in_flight(), 0u);
}

TEST(BatchOrchestrator, EmptyBatch) {
  auto h = make_harness(1, 4);
  auto batch = h.orchestrator->run("empty", {}, {});
  EXPECT_EQ(batch.request_id, "empty");
  EXPECT_TRUE(batch.results.empty());
}

TEST(WorkerThreads, FinishesInlineWhenThreadsCannotStart) {
  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> done{0};
  constexpr std::size_t kItems = 20;
  auto worker = [&]() {
    while (next.fetch_add(1) < kItems) done.fetch_add(1);
  };

  std::size_t started = 0;
  auto starts_one = [&](const std::function<void()>& fn) -> std::thread {
    if (started++ == 0) return std::thread(fn);
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
  };
  va::run_worker_threads(4, worker, starts_one);
  EXPECT_EQ(done.load(), kItems);
  EXPECT_EQ(started, 2u);

  next = 0;
  done = 0;
  auto starts_none = [](const std::function<void()>&) -> std::thread {
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
  };
  va::run_worker_threads(3, worker, starts_none);
  EXPECT_EQ(done.load(), kItems);
}

TEST(WorkerThreads, DefaultStarterRunsEveryWorker) {
  std::atomic<int> runs{0};
  va::run_worker_threads(3, [&]() { runs.fetch_add(1); });
  EXPECT_EQ(runs.load(), 3);
}
