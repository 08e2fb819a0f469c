// Repository: Retrovue-wavecast
// Component: Mux Session Tests
// Purpose: Readiness gating, presentation order, audio copy, finalize and
//          stop handling against a recording encoder.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "../../fixtures/FakeAudioDecoder.hpp"
#include "../../fixtures/FakeFrameEncoder.hpp"
#include "../../support/DeterministicTimeSource.hpp"
#include "../../support/DeterministicWaitStrategy.hpp"
#include "wavecast/mux/MuxSession.hpp"
#include "wavecast/render/PixelBufferPool.hpp"

namespace wavecast::mux::testing {
namespace {

using tests::fixtures::FakeAudioDecoder;
using tests::fixtures::FakeAudioScript;
using tests::fixtures::FakeEncoderLog;
using tests::fixtures::FakeEncoderScript;
using tests::fixtures::FakeFrameEncoder;

class MuxSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<timing::DeterministicTimeSource>(1000);
    wait_ = std::make_shared<timing::DeterministicWaitStrategy>(clock_);
    script_ = std::make_shared<FakeEncoderScript>();
    log_ = std::make_shared<FakeEncoderLog>();
    path_ = ::testing::TempDir() + "wavecast_mux_session_test.mp4";
    video_.width = 32;
    video_.height = 18;
    pool_ = std::make_unique<render::PixelBufferPool>(video_.width, video_.height, 3);
  }

  void TearDown() override { std::remove(path_.c_str()); }

  MuxResult Create(std::unique_ptr<MuxSession>* out,
                   const timing::StopSignal& stop = timing::StopSignal(),
                   const MuxSessionOptions& options = MuxSessionOptions()) {
    return MuxSession::Create(path_, video_, audio_,
                              std::make_unique<FakeFrameEncoder>(script_, log_), *clock_,
                              *wait_, stop, out, options);
  }

  render::RenderedFrame Frame(uint32_t index) {
    render::FrameRequest request{index, video_.fps};
    return render::RenderedFrame(request, pool_->Acquire());
  }

  MuxResult ReadyAndAppend(MuxSession& session, uint32_t index) {
    MuxResult r = session.AwaitVideoReady();
    if (!r.ok) return r;
    return session.AppendFrame(Frame(index));
  }

  std::shared_ptr<timing::DeterministicTimeSource> clock_;
  std::shared_ptr<timing::DeterministicWaitStrategy> wait_;
  std::shared_ptr<FakeEncoderScript> script_;
  std::shared_ptr<FakeEncoderLog> log_;
  std::string path_;
  VideoTrackConfig video_;
  AudioTrackConfig audio_;
  std::unique_ptr<render::PixelBufferPool> pool_;
};

// =============================================================================
// Setup
// =============================================================================

TEST_F(MuxSessionTest, WriterOpenFailureIsWriterSetupFailed) {
  script_->fail_open_on = {1};
  std::unique_ptr<MuxSession> session;
  const MuxResult r = Create(&session);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, MuxError::kWriterSetupFailed);
  EXPECT_EQ(session, nullptr);
}

// =============================================================================
// Frame order and readiness
// =============================================================================

TEST_F(MuxSessionTest, FramesAreAcceptedInOrderFromZero) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  for (uint32_t i = 0; i < 5; ++i) {
    ASSERT_TRUE(ReadyAndAppend(*session, i).ok) << "frame " << i;
  }
  EXPECT_EQ(log_->video_indices, (std::vector<int64_t>{0, 1, 2, 3, 4}));
  EXPECT_EQ(session->FramesAppended(), 5u);
}

TEST_F(MuxSessionTest, AppendWithoutReadinessIsRejected) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  EXPECT_EQ(session->AppendFrame(Frame(0)).error, MuxError::kNotReady);

  // One ready signal admits exactly one frame.
  ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);
  EXPECT_EQ(session->AppendFrame(Frame(1)).error, MuxError::kNotReady);
}

TEST_F(MuxSessionTest, FirstFrameMustBeIndexZero) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  EXPECT_EQ(ReadyAndAppend(*session, 1).error, MuxError::kOutOfOrder);
}

TEST_F(MuxSessionTest, DuplicateOrBackwardIndexIsOutOfOrder) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 1).ok);
  EXPECT_EQ(ReadyAndAppend(*session, 1).error, MuxError::kOutOfOrder);
  EXPECT_EQ(ReadyAndAppend(*session, 0).error, MuxError::kOutOfOrder);
  EXPECT_EQ(log_->video_indices.size(), 2u);
}

TEST_F(MuxSessionTest, ReadinessIsPolledEveryTenMilliseconds) {
  script_->video_not_ready_polls = 3;
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);
  EXPECT_EQ(wait_->Waits(), (std::vector<int64_t>{10, 10, 10}));
}

TEST_F(MuxSessionTest, ReadinessTimeoutIsNotReady) {
  script_->video_not_ready_polls = 1000000;
  MuxSessionOptions options;
  options.ready_timeout_ms = 100;
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session, timing::StopSignal(), options).ok);
  EXPECT_EQ(session->AwaitVideoReady().error, MuxError::kNotReady);
  EXPECT_GE(wait_->TotalWaitedMs(), 100);
}

TEST_F(MuxSessionTest, CancelDuringReadinessWaitIsCancelled) {
  script_->video_not_ready_polls = 1000000;
  std::atomic<bool> cancel{false};
  wait_->SetOnWait([&cancel](int64_t) { cancel.store(true); });
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session, timing::StopSignal(&cancel, clock_.get(),
                                                  timing::StopSignal::kNoDeadline)).ok);
  const MuxResult r = session->AwaitVideoReady();
  EXPECT_EQ(r.error, MuxError::kCancelled);
  EXPECT_NE(r.detail.find("cancelled"), std::string::npos);
}

TEST_F(MuxSessionTest, EncoderRejectionIsFrameAppendFailed) {
  script_->fail_video_at = 2;
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 1).ok);
  EXPECT_EQ(ReadyAndAppend(*session, 2).error, MuxError::kFrameAppendFailed);
}

// =============================================================================
// Audio and finalize
// =============================================================================

TEST_F(MuxSessionTest, AudioCopyStreamsEveryFrameAndReportsProgress) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);

  FakeAudioScript script;
  script.total_frames = 22050;
  script.skip_chunks = {1};
  decode::DecoderConfig config;
  config.input_uri = "fake://audio";
  FakeAudioDecoder decoder(config, script);

  std::vector<double> progress;
  const MuxResult r =
      session->AppendAudio(decoder, 0.5, [&progress](double f) { progress.push_back(f); });
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(log_->audio_frames, 22050u);
  EXPECT_EQ(session->AudioFramesAppended(), 22050u);
  ASSERT_FALSE(progress.empty());
  EXPECT_DOUBLE_EQ(progress.back(), 1.0);
  for (size_t i = 1; i < progress.size(); ++i) EXPECT_GE(progress[i], progress[i - 1]);
  EXPECT_FALSE(decoder.IsOpen());
}

TEST_F(MuxSessionTest, FinishReportsCountsAndIsTerminal) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  for (uint32_t i = 0; i < 3; ++i) ASSERT_TRUE(ReadyAndAppend(*session, i).ok);

  OutputHandle handle;
  ASSERT_TRUE(session->Finish(&handle).ok);
  EXPECT_EQ(handle.path, path_);
  EXPECT_EQ(handle.video_frames, 3u);
  EXPECT_EQ(session->state(), MuxSession::State::kFinished);
  EXPECT_EQ(log_->finishes, 1);

  EXPECT_EQ(session->AwaitVideoReady().error, MuxError::kInvalidState);
  EXPECT_EQ(session->Finish(&handle).error, MuxError::kInvalidState);
}

TEST_F(MuxSessionTest, FinishWithoutFramesIsIncomplete) {
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  EXPECT_EQ(session->Finish(nullptr).error, MuxError::kIncomplete);
  EXPECT_EQ(session->state(), MuxSession::State::kAborted);
  EXPECT_EQ(log_->finishes, 0);
}

TEST_F(MuxSessionTest, EncoderFinishFailureIsIncomplete) {
  script_->fail_finish = true;
  std::unique_ptr<MuxSession> session;
  ASSERT_TRUE(Create(&session).ok);
  ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);
  EXPECT_EQ(session->Finish(nullptr).error, MuxError::kIncomplete);
}

TEST_F(MuxSessionTest, DestroyingOpenSessionAborts) {
  {
    std::unique_ptr<MuxSession> session;
    ASSERT_TRUE(Create(&session).ok);
    ASSERT_TRUE(ReadyAndAppend(*session, 0).ok);
  }
  EXPECT_EQ(log_->aborts, 1);
  EXPECT_EQ(log_->finishes, 0);
}

}  // namespace
}  // namespace wavecast::mux::testing
