// Repository: Retrovue-wavecast
// Component: Generation Worker Tests
// Purpose: Queue admission, duplicate output rejection, cancellation of
//          queued and running jobs, and shutdown.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../fixtures/FakeAudioDecoder.hpp"
#include "../../fixtures/FakeFrameEncoder.hpp"
#include "../../fixtures/FakeResourceReader.hpp"
#include "../../support/DeterministicTimeSource.hpp"
#include "../../support/DeterministicWaitStrategy.hpp"
#include "wavecast/pipeline/GenerationWorker.hpp"

namespace wavecast::pipeline::testing {
namespace {

using tests::fixtures::FakeAudioDecoder;
using tests::fixtures::FakeAudioScript;
using tests::fixtures::FakeEncoderLog;
using tests::fixtures::FakeEncoderScript;
using tests::fixtures::FakeFrameEncoder;
using tests::fixtures::FakeResourceReader;

constexpr auto kJobTimeout = std::chrono::seconds(30);

// Records on_complete results by job id.
struct CompletionLog {
  std::mutex mutex;
  std::map<std::string, GenerationResult> results;

  JobCallbacks Callbacks() {
    JobCallbacks callbacks;
    callbacks.on_complete = [this](const std::string& id, const GenerationResult& result) {
      std::lock_guard<std::mutex> lock(mutex);
      results.emplace(id, result);
    };
    return callbacks;
  }

  bool Has(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return results.count(id) > 0;
  }

  GenerationResult Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return results.at(id);
  }
};

class GenerationWorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<timing::DeterministicTimeSource>(0);
    wait_ = std::make_shared<timing::DeterministicWaitStrategy>(clock_);
    enc_script_ = std::make_shared<FakeEncoderScript>();
    enc_log_ = std::make_shared<FakeEncoderLog>();
    audio_script_.total_frames = 22050;
  }

  void TearDown() override {
    if (worker_) worker_->Stop();
    for (const std::string& path : created_) {
      std::remove(path.c_str());
      std::remove((path + ".partial").c_str());
    }
  }

  void MakeWorker(size_t depth = kDefaultMaxQueueDepth) {
    PipelineDependencies deps;
    const FakeAudioScript script = audio_script_;
    deps.make_decoder = [script](const decode::DecoderConfig& config) {
      return std::unique_ptr<decode::IAudioDecoder>(
          std::make_unique<FakeAudioDecoder>(config, script));
    };
    auto enc_script = enc_script_;
    auto enc_log = enc_log_;
    deps.make_encoder = [enc_script, enc_log]() {
      return std::unique_ptr<mux::IFrameEncoder>(
          std::make_unique<FakeFrameEncoder>(enc_script, enc_log));
    };
    deps.resource_reader = std::make_shared<FakeResourceReader>();
    deps.clock = clock_;
    deps.wait = wait_;
    PipelineConfig config;
    config.waveform_points = 20;
    worker_ = std::make_unique<GenerationWorker>(
        std::make_unique<PipelineController>(std::move(deps), config), depth);
  }

  GenerationRequest Request(const std::string& name, const std::string& job_id = "") {
    GenerationRequest request;
    request.job_id = job_id;
    request.input_uri = "fake://" + name;
    request.output_path = ::testing::TempDir() + "wavecast_worker_" + name + ".mp4";
    created_.push_back(request.output_path);
    return request;
  }

  std::shared_ptr<timing::DeterministicTimeSource> clock_;
  std::shared_ptr<timing::DeterministicWaitStrategy> wait_;
  std::shared_ptr<FakeEncoderScript> enc_script_;
  std::shared_ptr<FakeEncoderLog> enc_log_;
  FakeAudioScript audio_script_;
  std::unique_ptr<GenerationWorker> worker_;
  std::vector<std::string> created_;
};

// =============================================================================
// Admission (worker not started, jobs stay queued)
// =============================================================================

TEST_F(GenerationWorkerTest, AssignsJobIdsWhenMissing) {
  MakeWorker();
  std::string a;
  std::string b;
  ASSERT_EQ(worker_->Submit(Request("a"), JobCallbacks(), &a), SubmitStatus::kAccepted);
  ASSERT_EQ(worker_->Submit(Request("b", "custom"), JobCallbacks(), &b), SubmitStatus::kAccepted);
  EXPECT_EQ(a, "job-1");
  EXPECT_EQ(b, "custom");
  EXPECT_EQ(worker_->QueueDepth(), 2u);
  EXPECT_TRUE(worker_->Busy());
}

TEST_F(GenerationWorkerTest, DuplicateOutputPathIsRejected) {
  MakeWorker();
  GenerationRequest first = Request("same");
  GenerationRequest second = first;
  second.input_uri = "fake://other";
  std::string id;
  ASSERT_EQ(worker_->Submit(first, JobCallbacks(), &id), SubmitStatus::kAccepted);
  EXPECT_EQ(worker_->Submit(second, JobCallbacks(), nullptr), SubmitStatus::kDuplicateOutput);
  EXPECT_EQ(worker_->QueueDepth(), 1u);
}

TEST_F(GenerationWorkerTest, FullQueueIsRejected) {
  MakeWorker(2);
  EXPECT_EQ(worker_->Submit(Request("q1"), JobCallbacks(), nullptr), SubmitStatus::kAccepted);
  EXPECT_EQ(worker_->Submit(Request("q2"), JobCallbacks(), nullptr), SubmitStatus::kAccepted);
  EXPECT_EQ(worker_->Submit(Request("q3"), JobCallbacks(), nullptr), SubmitStatus::kQueueFull);
}

TEST_F(GenerationWorkerTest, InvalidRequestIsRejected) {
  MakeWorker();
  GenerationRequest request = Request("bad");
  request.input_uri.clear();
  EXPECT_EQ(worker_->Submit(request, JobCallbacks(), nullptr), SubmitStatus::kInvalidRequest);
  EXPECT_EQ(worker_->QueueDepth(), 0u);
}

TEST_F(GenerationWorkerTest, CancellingQueuedJobCompletesItAndFreesPath) {
  MakeWorker();
  CompletionLog log;
  GenerationRequest request = Request("queued");
  std::string id;
  ASSERT_EQ(worker_->Submit(request, log.Callbacks(), &id), SubmitStatus::kAccepted);

  EXPECT_TRUE(worker_->Cancel(id));
  ASSERT_TRUE(log.Has(id));
  EXPECT_EQ(log.Get(id).error, GenerationError::kCancelled);
  EXPECT_EQ(log.Get(id).attempts, 0);
  EXPECT_EQ(worker_->QueueDepth(), 0u);

  // The output path is free again.
  EXPECT_EQ(worker_->Submit(request, JobCallbacks(), nullptr), SubmitStatus::kAccepted);
}

TEST_F(GenerationWorkerTest, CancelUnknownJobReturnsFalse) {
  MakeWorker();
  EXPECT_FALSE(worker_->Cancel("job-404"));
}

TEST_F(GenerationWorkerTest, StopCompletesQueuedJobsAndRefusesNewOnes) {
  MakeWorker();
  CompletionLog log;
  std::string a;
  std::string b;
  ASSERT_EQ(worker_->Submit(Request("s1"), log.Callbacks(), &a), SubmitStatus::kAccepted);
  ASSERT_EQ(worker_->Submit(Request("s2"), log.Callbacks(), &b), SubmitStatus::kAccepted);
  worker_->Stop();
  EXPECT_EQ(log.Get(a).error, GenerationError::kCancelled);
  EXPECT_EQ(log.Get(b).error, GenerationError::kCancelled);
  EXPECT_EQ(worker_->Submit(Request("s3"), JobCallbacks(), nullptr),
            SubmitStatus::kShuttingDown);
}

// =============================================================================
// Running jobs
// =============================================================================

TEST_F(GenerationWorkerTest, RunsJobAndReportsCompletion) {
  MakeWorker();
  std::promise<GenerationResult> done;
  JobCallbacks callbacks;
  callbacks.on_complete = [&done](const std::string&, const GenerationResult& result) {
    done.set_value(result);
  };
  worker_->Start();
  std::string id;
  ASSERT_EQ(worker_->Submit(Request("run"), std::move(callbacks), &id), SubmitStatus::kAccepted);

  std::future<GenerationResult> future = done.get_future();
  ASSERT_EQ(future.wait_for(kJobTimeout), std::future_status::ready);
  const GenerationResult result = future.get();
  EXPECT_TRUE(result.success) << result.detail;
  EXPECT_EQ(result.attempts, 1);
}

TEST_F(GenerationWorkerTest, CancellingRunningJobStopsIt) {
  std::promise<void> started;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  enc_script_->on_video = [&started, released](int64_t index) {
    if (index != 0) return;
    started.set_value();
    released.wait();
  };
  MakeWorker();

  std::promise<GenerationResult> done;
  JobCallbacks callbacks;
  callbacks.on_complete = [&done](const std::string&, const GenerationResult& result) {
    done.set_value(result);
  };
  worker_->Start();
  std::string id;
  ASSERT_EQ(worker_->Submit(Request("cancel_running"), std::move(callbacks), &id),
            SubmitStatus::kAccepted);

  ASSERT_EQ(started.get_future().wait_for(kJobTimeout), std::future_status::ready);
  EXPECT_TRUE(worker_->Cancel(id));
  release.set_value();

  std::future<GenerationResult> future = done.get_future();
  ASSERT_EQ(future.wait_for(kJobTimeout), std::future_status::ready);
  const GenerationResult result = future.get();
  EXPECT_EQ(result.error, GenerationError::kCancelled);
  EXPECT_EQ(result.attempts, 1);
}

}  // namespace
}  // namespace wavecast::pipeline::testing
