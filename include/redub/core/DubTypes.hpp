// Repository: Redub
// Component: Dubbing Data Model
// Purpose: Typed artifacts exchanged between pipeline stages, error codes,
//          and the per-job failure/warning records.
// Copyright (c) 2026 Redub

#ifndef REDUB_CORE_DUB_TYPES_HPP_
#define REDUB_CORE_DUB_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "redub/media/PcmBuffer.hpp"

namespace redub::core {

// =============================================================================
// Error Codes
// =============================================================================

enum class DubError {
  kNone = 0,

  // Pre-flight configuration validation failed.
  kConfigInvalid,

  // Input audio sample rate differs from the configured analysis rate.
  kSampleRateMismatch,

  // Source container unreadable, corrupt, or without an audio stream.
  kAudioUnreadable,

  // Per-segment backend failures after retries were exhausted.
  kTranscriptionFailed,
  kTranslationFailed,
  kSynthesisFailed,

  // Cumulative drift exceeded the configured tolerance.
  kDriftExceeded,

  // Aligned clips overlap or are out of order at assembly.
  kOverlappingClips,

  // External mux tool failed.
  kMuxFailed,

  // Job working directory or artifact write failed.
  kIoError,

  // Job cancelled between segments.
  kCancelled,
};

const char* DubErrorToString(DubError error);

// =============================================================================
// Timeline Entities (all times in milliseconds on the source timeline)
// =============================================================================

// Contiguous slice of the input. The full list is ordered, non-overlapping,
// and covers [0, input duration] exactly.
struct SourceSegment {
  int32_t id = 0;
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  bool is_speech = false;

  // Audio reference: sample range in the extracted stream.
  int64_t sample_begin = 0;
  int64_t sample_end = 0;

  int64_t duration_ms() const { return end_ms - start_ms; }
};

struct WordTiming {
  std::string word;
  int64_t start_ms = 0;
  int64_t end_ms = 0;
};

struct TranscriptSegment {
  int32_t segment_id = 0;
  std::string text;
  std::vector<WordTiming> words;  // Ordered, absolute timeline
  double confidence = 0.0;
};

enum class Gender {
  kMale,
  kFemale,
  kUnknown,
};

const char* GenderName(Gender g);
Gender GenderFromName(const std::string& name);

struct SpeakerProfile {
  int32_t segment_id = 0;
  Gender gender = Gender::kUnknown;
  double pitch_hz = 0.0;     // Median F0 over voiced frames; 0 if none
  double confidence = 0.0;   // Combined weighted confidence in [0, 1]
  double energy_db = 0.0;
  double spectral_centroid_hz = 0.0;
  std::string voice_type;    // "bass", "tenor", "soprano", ... or "unknown"

  // Outputs consumed downstream.
  std::string voice_id;
  double volume = 1.0;
  int pitch_shift_hz = 0;
  double min_rate = 1.0;     // Time-stretch bounds for this segment
  double max_rate = 1.0;
};

struct TranslatedSegment {
  int32_t segment_id = 0;
  std::string translated_text;
  std::string target_language;
};

struct SynthesizedClip {
  int32_t segment_id = 0;
  media::PcmBuffer waveform;
  std::string voice_id;
  bool used_fallback_voice = false;

  int64_t duration_ms() const { return waveform.DurationMs(); }
  int sample_rate() const { return waveform.sample_rate; }
};

struct AlignedClip {
  int32_t segment_id = 0;
  int64_t source_start_ms = 0;
  int64_t source_end_ms = 0;
  int64_t final_start_ms = 0;
  int64_t final_end_ms = 0;
  double applied_rate = 1.0;
  int64_t pad_ms = 0;        // Trailing silence inside [final_start, final_end]
  int64_t absorbed_ms = 0;   // Borrowed from the following silence
  int64_t shift_ms = 0;      // final_start - source_start
  media::PcmBuffer waveform; // Rate-adjusted audio including trailing pad
};

// =============================================================================
// Job Records
// =============================================================================

enum class DriftKind {
  kAbsorbedIntoSilence,
  kCascadingShift,
};

const char* DriftKindName(DriftKind k);

struct DriftWarning {
  int32_t segment_id = 0;
  DriftKind kind = DriftKind::kAbsorbedIntoSilence;
  double required_rate = 1.0;
  double applied_rate = 1.0;
  int64_t overflow_ms = 0;         // Past the slot end at applied_rate
  int64_t absorbed_ms = 0;
  int64_t shift_ms = 0;            // Unabsorbed part pushed downstream
  int64_t cumulative_drift_ms = 0; // After this segment
};

enum class SegmentStage {
  kTranscription,
  kTranslation,
  kSynthesis,
};

const char* SegmentStageName(SegmentStage s);

struct SegmentFailure {
  int32_t segment_id = 0;
  SegmentStage stage = SegmentStage::kTranscription;
  DubError error = DubError::kNone;
  int attempts = 0;
  std::string detail;
};

}  // namespace redub::core

#endif  // REDUB_CORE_DUB_TYPES_HPP_
