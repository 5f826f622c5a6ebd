// Repository: Redub
// Component: Segment Processor Contract Tests
// Purpose: Backend call sequencing, retry/backoff, voice fallback, CPU
//          fallback, silent segments, and artifact resume.
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "FakeSpeechBackend.h"
#include "SyntheticAudio.h"
#include "TempDir.h"
#include "redub/backend/RetryPolicy.hpp"
#include "redub/job/JobStore.hpp"
#include "redub/pipeline/SegmentProcessor.hpp"
#include "redub/util/Logger.hpp"

using namespace redub;
using backend::BackendStatus;
using backend::ComputeDevice;
using pipeline::SegmentOutcome;
using pipeline::SegmentProcessor;
using pipeline::SegmentWork;
using tests::fixtures::FakeSpeechBackend;

namespace {

SegmentWork Work(int32_t id, int64_t start_ms, int64_t duration_ms,
                 const std::string& voice = "az-AZ-BabekNeural") {
  SegmentWork w;
  w.segment.id = id;
  w.segment.start_ms = start_ms;
  w.segment.end_ms = start_ms + duration_ms;
  w.segment.is_speech = true;
  w.audio = tests::fixtures::Tone(duration_ms, 120.0);
  w.profile.segment_id = id;
  w.profile.voice_id = voice;
  return w;
}

class SegmentProcessorContract : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.pipeline.source_language = "en";
    config_.pipeline.target_language = "az";
    config_.pipeline.max_attempts = 3;
    config_.pipeline.initial_backoff_ms = 1000;
    config_.pipeline.max_backoff_ms = 8000;
  }

  SegmentProcessor MakeProcessor(job::JobStore* store = nullptr) {
    return SegmentProcessor(config_, backend_, store,
                            [this](int64_t ms) { sleeps_.push_back(ms); });
  }

  core::JobConfig config_;
  FakeSpeechBackend backend_;
  std::vector<int64_t> sleeps_;
};

}  // namespace

// =============================================================================
// Retry policy
// =============================================================================

TEST(RetryPolicyContract, BackoffDoublesUpToCap) {
  backend::RetryPolicy p;
  p.initial_backoff_ms = 1000;
  p.max_backoff_ms = 8000;
  EXPECT_EQ(p.BackoffBeforeAttempt(2), 1000);
  EXPECT_EQ(p.BackoffBeforeAttempt(3), 2000);
  EXPECT_EQ(p.BackoffBeforeAttempt(4), 4000);
  EXPECT_EQ(p.BackoffBeforeAttempt(5), 8000);
  EXPECT_EQ(p.BackoffBeforeAttempt(9), 8000);
}

TEST(RetryPolicyContract, OnlyTimeoutAndTransientAreRetryable) {
  EXPECT_TRUE(backend::RetryPolicy::IsRetryable(BackendStatus::kTimeout));
  EXPECT_TRUE(backend::RetryPolicy::IsRetryable(BackendStatus::kTransientError));
  EXPECT_FALSE(backend::RetryPolicy::IsRetryable(BackendStatus::kPermanentError));
  EXPECT_FALSE(backend::RetryPolicy::IsRetryable(BackendStatus::kAcceleratorUnavailable));
}

// =============================================================================
// Happy path
// =============================================================================

TEST_F(SegmentProcessorContract, TranscribeTranslateSynthesize) {
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 5000, 2000));

  ASSERT_TRUE(out.ok);
  EXPECT_FALSE(out.silent);
  EXPECT_EQ(out.transcript.text, "segment 1");
  ASSERT_EQ(out.transcript.words.size(), 1u);
  EXPECT_EQ(out.transcript.words[0].start_ms, 5000);
  EXPECT_EQ(out.transcript.words[0].end_ms, 7000);
  EXPECT_EQ(out.translation.translated_text, "az: segment 1");
  EXPECT_EQ(out.translation.target_language, "az");
  ASSERT_TRUE(out.clip.has_value());
  EXPECT_EQ(out.clip->duration_ms(), 2000);
  EXPECT_EQ(out.clip->voice_id, "az-AZ-BabekNeural");
  EXPECT_FALSE(out.clip->used_fallback_voice);
  EXPECT_FALSE(out.failure.has_value());
  EXPECT_TRUE(sleeps_.empty());
  EXPECT_EQ(backend_.calls().size(), 3u);
}

TEST_F(SegmentProcessorContract, ConfidenceIsClampedToUnitRange) {
  backend_.SetConfidence(1, 1.7);
  backend_.SetConfidence(2, -0.3);
  auto processor = MakeProcessor();
  EXPECT_DOUBLE_EQ(processor.Process(Work(1, 0, 1000)).transcript.confidence, 1.0);
  EXPECT_DOUBLE_EQ(processor.Process(Work(2, 1000, 1000)).transcript.confidence, 0.0);
  EXPECT_DOUBLE_EQ(processor.Process(Work(3, 2000, 1000)).transcript.confidence, 0.9);
}

TEST_F(SegmentProcessorContract, SameLanguageSkipsTranslation) {
  config_.pipeline.source_language = "az";
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  ASSERT_TRUE(out.ok);
  EXPECT_EQ(out.translation.translated_text, "segment 1");
  EXPECT_EQ(backend_.CallCount("Translate"), 0);
}

TEST_F(SegmentProcessorContract, BlankTranscriptIsSilentSegment) {
  backend_.SetTranscript(1, "  \n");
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  EXPECT_TRUE(out.ok);
  EXPECT_TRUE(out.silent);
  EXPECT_FALSE(out.clip.has_value());
  EXPECT_EQ(backend_.CallCount("Translate"), 0);
  EXPECT_EQ(backend_.CallCount("Synthesize"), 0);
}

TEST_F(SegmentProcessorContract, BlankTranslationIsSilentSegment) {
  backend_.SetTranslation(1, "");
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  EXPECT_TRUE(out.ok);
  EXPECT_TRUE(out.silent);
  EXPECT_EQ(backend_.CallCount("Synthesize"), 0);
}

// =============================================================================
// Retries
// =============================================================================

TEST_F(SegmentProcessorContract, TransientErrorsAreRetriedWithBackoff) {
  backend_.QueueTranscribe(1, {BackendStatus::kTimeout, BackendStatus::kTransientError});
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  ASSERT_TRUE(out.ok);
  EXPECT_EQ(backend_.CallCount("Transcribe", 1), 3);
  EXPECT_EQ(sleeps_, (std::vector<int64_t>{1000, 2000}));
}

TEST_F(SegmentProcessorContract, RetriesAndFailuresAreLogged) {
  std::vector<std::string> warns;
  std::vector<std::string> errors;
  util::Logger::SetWarnSink([&warns](const std::string& line) { warns.push_back(line); });
  util::Logger::SetErrorSink([&errors](const std::string& line) { errors.push_back(line); });
  backend_.QueueSynthesize(1, {BackendStatus::kTimeout, BackendStatus::kPermanentError});
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  util::Logger::SetWarnSink(nullptr);
  util::Logger::SetErrorSink(nullptr);

  EXPECT_FALSE(out.ok);
  ASSERT_EQ(warns.size(), 1u);
  EXPECT_EQ(warns[0].rfind("[SegmentProcessor] RETRY segment_id=1 method=Synthesize", 0), 0u);
  EXPECT_NE(warns[0].find("status=TIMEOUT"), std::string::npos);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("SEGMENT_FAILED segment_id=1 stage="), std::string::npos);
  EXPECT_EQ(out.failure->detail.rfind("PERMANENT", 0), 0u);
}

TEST_F(SegmentProcessorContract, RetriesStopAtMaxAttempts) {
  backend_.QueueTranslate(1, {BackendStatus::kTransientError, BackendStatus::kTransientError,
                              BackendStatus::kTransientError, BackendStatus::kTransientError});
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));

  EXPECT_FALSE(out.ok);
  ASSERT_TRUE(out.failure.has_value());
  EXPECT_EQ(out.failure->stage, core::SegmentStage::kTranslation);
  EXPECT_EQ(out.failure->error, core::DubError::kTranslationFailed);
  EXPECT_EQ(out.failure->attempts, 3);
  EXPECT_EQ(backend_.CallCount("Translate", 1), 3);
  EXPECT_EQ(backend_.CallCount("Synthesize"), 0);
  EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(SegmentProcessorContract, PermanentErrorIsNotRetried) {
  backend_.QueueTranscribe(1, {BackendStatus::kPermanentError});
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.failure->error, core::DubError::kTranscriptionFailed);
  EXPECT_EQ(out.failure->attempts, 1);
  EXPECT_EQ(backend_.CallCount("Transcribe", 1), 1);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(SegmentProcessorContract, EmptyWaveformCountsAsTransient) {
  backend_.SetSynthDurationMs(1, 0);
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000, ""));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.failure->stage, core::SegmentStage::kSynthesis);
  EXPECT_EQ(out.failure->attempts, 3);
  EXPECT_NE(out.failure->detail.find("empty waveform"), std::string::npos);
}

// =============================================================================
// Voice fallback
// =============================================================================

TEST_F(SegmentProcessorContract, FailingVoiceFallsBackToDefault) {
  backend_.FailVoice(1, "studio-voice");
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000, "studio-voice"));
  ASSERT_TRUE(out.ok);
  EXPECT_TRUE(out.clip->used_fallback_voice);
  EXPECT_EQ(out.clip->voice_id, processor.default_voice());
  EXPECT_EQ(processor.default_voice(), "az-AZ-BabekNeural");
  EXPECT_EQ(backend_.CallCount("Synthesize", 1), 4);
  EXPECT_EQ(backend_.calls().back().voice_id, "az-AZ-BabekNeural");
}

TEST_F(SegmentProcessorContract, FallbackVoiceFailureFailsSegment) {
  backend_.FailVoice(1, "studio-voice");
  backend_.FailVoice(1, "az-AZ-BabekNeural");
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000, "studio-voice"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.failure->error, core::DubError::kSynthesisFailed);
  EXPECT_EQ(out.failure->attempts, 6);
}

TEST_F(SegmentProcessorContract, DefaultVoiceIsNotRetriedTwice) {
  backend_.FailVoice(1, "az-AZ-BabekNeural");
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(backend_.CallCount("Synthesize", 1), 3);
}

TEST_F(SegmentProcessorContract, ConfiguredDefaultVoiceIsUsed) {
  config_.synthesis.default_voice = "house-voice";
  backend_.FailVoice(1, "studio-voice");
  auto processor = MakeProcessor();
  SegmentOutcome out = processor.Process(Work(1, 0, 1000, "studio-voice"));
  ASSERT_TRUE(out.ok);
  EXPECT_EQ(out.clip->voice_id, "house-voice");
}

// =============================================================================
// CPU fallback
// =============================================================================

TEST_F(SegmentProcessorContract, AcceleratorLossSwitchesToCpuWithoutUsingAttempts) {
  config_.pipeline.max_attempts = 1;
  backend_.SetAcceleratorDown(true);
  auto processor = MakeProcessor();
  EXPECT_EQ(processor.device(), ComputeDevice::kAccelerator);

  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  ASSERT_TRUE(out.ok);
  EXPECT_TRUE(processor.cpu_fallback_active());
  EXPECT_EQ(processor.device(), ComputeDevice::kCpu);
  EXPECT_TRUE(sleeps_.empty());

  auto calls = backend_.calls();
  ASSERT_EQ(calls.size(), 4u);
  EXPECT_EQ(calls[0].device, ComputeDevice::kAccelerator);
  EXPECT_EQ(calls[1].method, "Transcribe");
  EXPECT_EQ(calls[1].device, ComputeDevice::kCpu);
  EXPECT_EQ(calls[2].device, ComputeDevice::kCpu);
  EXPECT_EQ(calls[3].device, ComputeDevice::kCpu);
}

TEST_F(SegmentProcessorContract, CpuFallbackIsSticky) {
  backend_.SetAcceleratorDown(true);
  auto processor = MakeProcessor();
  ASSERT_TRUE(processor.Process(Work(1, 0, 1000)).ok);
  backend_.SetAcceleratorDown(false);
  ASSERT_TRUE(processor.Process(Work(2, 1000, 1000)).ok);
  for (const auto& c : backend_.calls()) {
    if (c.segment_id == 2) {
      EXPECT_EQ(c.device, ComputeDevice::kCpu) << c.method;
    }
  }
}

// =============================================================================
// Artifacts and resume
// =============================================================================

TEST_F(SegmentProcessorContract, ResumeUsesStoredArtifacts) {
  tests::fixtures::TempDir dir;
  job::JobStore store(dir.path(), "job");
  {
    auto processor = MakeProcessor(&store);
    ASSERT_TRUE(processor.Process(Work(1, 0, 1500)).ok);
  }
  EXPECT_TRUE(tests::fixtures::FileExists(store.SegmentDir(1) + "/synth.wav"));

  FakeSpeechBackend fresh;
  config_.pipeline.resume = true;
  SegmentProcessor resumed(config_, fresh, &store, [](int64_t) {});
  SegmentOutcome out = resumed.Process(Work(1, 0, 1500));
  ASSERT_TRUE(out.ok);
  EXPECT_TRUE(fresh.calls().empty());
  EXPECT_EQ(out.transcript.text, "segment 1");
  EXPECT_EQ(out.translation.translated_text, "az: segment 1");
  EXPECT_EQ(out.clip->duration_ms(), 1500);
}

TEST_F(SegmentProcessorContract, ResumeContinuesFromLastSavedStage) {
  tests::fixtures::TempDir dir;
  job::JobStore store(dir.path(), "job");
  core::TranscriptSegment t;
  t.segment_id = 1;
  t.text = "stored text";
  store.SaveTranscript(t);

  config_.pipeline.resume = true;
  auto processor = MakeProcessor(&store);
  SegmentOutcome out = processor.Process(Work(1, 0, 1000));
  ASSERT_TRUE(out.ok);
  EXPECT_EQ(backend_.CallCount("Transcribe"), 0);
  EXPECT_EQ(backend_.CallCount("Translate"), 1);
  EXPECT_EQ(out.translation.translated_text, "az: stored text");
}
