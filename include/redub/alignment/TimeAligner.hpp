// Repository: Redub
// Component: Time Aligner
// Purpose: Maps variable-duration synthesized clips onto their source
//          segments' time slots in strict timeline order, bounding the
//          cumulative drift of the dubbed track.
// Copyright (c) 2026 Redub

#ifndef REDUB_ALIGNMENT_TIME_ALIGNER_HPP_
#define REDUB_ALIGNMENT_TIME_ALIGNER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/media/TimeStretcher.hpp"

namespace redub::alignment {

// Placement window of one speech segment on the source timeline.
struct AlignmentSlot {
  int32_t segment_id = 0;
  int64_t source_start_ms = 0;
  int64_t source_end_ms = 0;
  // Start of the next speech segment, or the end of the input timeline for
  // the last one. Silence up to here (less the natural pause) may be
  // borrowed by an overlong clip.
  int64_t next_speech_start_ms = 0;
  bool is_last = false;
  // Per-segment bounds; intersected with the global range.
  double min_rate = 0.0;
  double max_rate = 0.0;

  int64_t duration_ms() const { return source_end_ms - source_start_ms; }
};

// Slots for every speech segment of |segments|, in order. Rate bounds come
// from |profiles| when present, otherwise the global range.
std::vector<AlignmentSlot> BuildSlots(const std::vector<core::SourceSegment>& segments,
                                      const std::map<int32_t, core::SpeakerProfile>& profiles,
                                      int64_t timeline_end_ms,
                                      const core::AlignerConfig& config);

// TimeAligner: the single serialization point of the pipeline.
//
// Per clip, in order:
//   rate r = synth / slot, applied = clamp(r, min, max)
//   start = max(source_start + drift, previous final_end)
//   shorter than the slot: pad with trailing silence to the slot end
//   longer: borrow following silence (keeping min_pause_ms before the next
//           speech segment); any remainder pushes every later clip back and
//           adds to the cumulative drift
//   drift > drift_tolerance_ms: core::SyncError
//
// Durations are taken from the stretched waveform, never the planned one, so
// clips are never truncated. Every clip that needed more than max_rate gets
// a DriftWarning (absorbed or shifted).
//
// Threading: one thread.
class TimeAligner {
 public:
  using ClipSink = std::function<void(const core::AlignedClip&, int64_t cumulative_drift_ms)>;

  // |stretcher| may be null when only AlignDuration() is used.
  TimeAligner(const core::AlignerConfig& config, int64_t min_pause_ms,
              int output_sample_rate, media::ITimeStretcher* stretcher);

  // Called with each clip as soon as it is placed, before the next one.
  void SetClipSink(ClipSink sink) { sink_ = std::move(sink); }

  // Reset to an empty timeline.
  void Begin();

  // Continue after an already-aligned prefix (resume).
  void Restore(int64_t previous_end_ms, int64_t cumulative_drift_ms);

  core::AlignedClip AlignNext(const AlignmentSlot& slot, const core::SynthesizedClip& clip);

  // Placement only; the clip's waveform is left empty and its duration is
  // the planned ceil(synth_ms / applied_rate).
  core::AlignedClip AlignDuration(const AlignmentSlot& slot, int64_t synth_ms);

  // Aligns the clips whose segment ids match |slots|, in slot order. Slots
  // without a clip (silent or failed segments) are skipped.
  std::vector<core::AlignedClip> AlignAll(const std::vector<AlignmentSlot>& slots,
                                          const std::vector<core::SynthesizedClip>& clips);

  // Duration-only scheduling of (slot, synth_ms) pairs.
  std::vector<core::AlignedClip> AlignDurations(const std::vector<AlignmentSlot>& slots,
                                                const std::vector<int64_t>& synth_ms);

  // Logs the summary line; returns the end of the last placed clip.
  int64_t Finish();

  int64_t cumulative_drift_ms() const { return drift_ms_; }
  int64_t previous_end_ms() const { return previous_end_ms_; }
  const std::vector<core::DriftWarning>& warnings() const { return warnings_; }
  size_t aligned_count() const { return aligned_count_; }

 private:
  // Fills placement fields of |clip| for a rendered length of |actual_ms|.
  void Place(const AlignmentSlot& slot, double required_rate, double applied_rate,
             int64_t actual_ms, core::AlignedClip* clip);

  void Bounds(const AlignmentSlot& slot, double* lo, double* hi) const;

  core::AlignerConfig config_;
  int64_t min_pause_ms_;
  int output_sample_rate_;
  media::ITimeStretcher* stretcher_;
  ClipSink sink_;

  int64_t drift_ms_ = 0;
  int64_t previous_end_ms_ = 0;
  size_t aligned_count_ = 0;
  std::vector<core::DriftWarning> warnings_;
};

}  // namespace redub::alignment

#endif  // REDUB_ALIGNMENT_TIME_ALIGNER_HPP_
