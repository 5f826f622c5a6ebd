// Repository: Redub
// Component: Speaker Summary
// Purpose: Job-level aggregate of the per-segment speaker profiles: gender
//          distribution, segment duration statistics, pitch and energy.
// Copyright (c) 2026 Redub

#ifndef REDUB_PROFILING_SPEAKER_SUMMARY_HPP_
#define REDUB_PROFILING_SPEAKER_SUMMARY_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "redub/core/DubTypes.hpp"

namespace redub::profiling {

// Population statistics of one measure. All zero when count == 0.
struct ValueStats {
  size_t count = 0;
  double mean = 0.0;
  double stddev = 0.0;
  double min = 0.0;
  double max = 0.0;

  static ValueStats Of(const std::vector<double>& values);
};

struct GenderShare {
  size_t count = 0;
  int64_t duration_ms = 0;
  double percent = 0.0;  // Of speech segments, by count
};

struct SpeakerSummary {
  size_t speech_segments = 0;
  int64_t speech_ms = 0;
  GenderShare male;
  GenderShare female;
  GenderShare unknown;
  ValueStats segment_duration_ms;
  ValueStats pitch_hz;   // Voiced segments only
  ValueStats energy_db;
  std::map<std::string, size_t> voices;  // voice_id → segments

  std::string ToJson() const;
};

// Summarizes the speech segments of |segments| that have a profile.
SpeakerSummary SummarizeSpeakers(const std::vector<core::SourceSegment>& segments,
                                 const std::map<int32_t, core::SpeakerProfile>& profiles);

}  // namespace redub::profiling

#endif  // REDUB_PROFILING_SPEAKER_SUMMARY_HPP_
