// Repository: Redub
// Component: Segment Processor
// Purpose: Transcribe, translate and synthesize one speech segment through
//          the speech backend with retries, voice fallback and CPU fallback.
// Copyright (c) 2026 Redub

#ifndef REDUB_PIPELINE_SEGMENT_PROCESSOR_HPP_
#define REDUB_PIPELINE_SEGMENT_PROCESSOR_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "redub/backend/RetryPolicy.hpp"
#include "redub/backend/SpeechBackend.hpp"
#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/media/PcmBuffer.hpp"

namespace redub::job {
class JobStore;
}

namespace redub::pipeline {

struct SegmentWork {
  core::SourceSegment segment;
  media::PcmBuffer audio;  // This segment's slice
  core::SpeakerProfile profile;
};

struct SegmentOutcome {
  int32_t segment_id = 0;
  bool ok = false;
  // Nothing to say: empty transcript or translation. ok stays true and the
  // segment is assembled as silence.
  bool silent = false;
  core::TranscriptSegment transcript;
  core::TranslatedSegment translation;
  std::optional<core::SynthesizedClip> clip;
  std::optional<core::SegmentFailure> failure;
};

// SegmentProcessor is shared by all pool workers; Process() is thread-safe.
//
// Retry rules per backend call:
//   - timeout / transient error: retried after exponential backoff until
//     max_attempts calls have been made;
//   - accelerator unavailable: the processor switches every later call to
//     CPU (sticky) and retries at once without consuming an attempt;
//   - permanent error: no retry.
// A synthesis that still fails is retried once more from scratch with the
// default voice before the segment is marked failed.
//
// With a JobStore, each stage's artifact is saved on success; when resume is
// configured, stored artifacts are used instead of calling the backend.
class SegmentProcessor {
 public:
  using SleepFn = std::function<void(int64_t ms)>;

  // |store| may be null. |sleep| defaults to std::this_thread::sleep_for.
  SegmentProcessor(const core::JobConfig& config, backend::ISpeechBackend& backend,
                   job::JobStore* store, SleepFn sleep = nullptr);

  SegmentOutcome Process(const SegmentWork& work);

  backend::ComputeDevice device() const;
  bool cpu_fallback_active() const { return cpu_fallback_.load(std::memory_order_acquire); }

  // Voice used when the profile's voice keeps failing or the speaker is
  // unknown.
  const std::string& default_voice() const { return default_voice_; }

 private:
  template <typename Result, typename Call>
  Result CallWithRetry(const char* method, int32_t segment_id, Call&& call, int* attempts);

  bool Transcribe(const SegmentWork& work, SegmentOutcome* outcome);
  bool Translate(const SegmentWork& work, SegmentOutcome* outcome);
  bool Synthesize(const SegmentWork& work, SegmentOutcome* outcome);

  void Fail(SegmentOutcome* outcome, core::SegmentStage stage, core::DubError error,
            int attempts, const std::string& detail) const;

  core::JobConfig config_;
  backend::ISpeechBackend& backend_;
  job::JobStore* store_;
  SleepFn sleep_;
  backend::RetryPolicy retry_;
  std::string default_voice_;
  std::atomic<bool> cpu_fallback_{false};
};

}  // namespace redub::pipeline

#endif  // REDUB_PIPELINE_SEGMENT_PROCESSOR_HPP_
