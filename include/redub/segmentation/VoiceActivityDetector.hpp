// Repository: Redub
// Component: Voice Activity Detector
// Purpose: Frame-level speech/silence classification of one analysis window
//          and conversion of the frame decisions into padded, trimmed speech
//          regions.
// Copyright (c) 2026 Redub

#ifndef REDUB_SEGMENTATION_VOICE_ACTIVITY_DETECTOR_HPP_
#define REDUB_SEGMENTATION_VOICE_ACTIVITY_DETECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "redub/core/JobConfig.hpp"

namespace redub::segmentation {

// Half-open [start_ms, end_ms) relative to the start of the analysed span.
struct SpeechRegion {
  int64_t start_ms = 0;
  int64_t end_ms = 0;
};

class VoiceActivityDetector {
 public:
  explicit VoiceActivityDetector(const core::SegmenterConfig& config);

  // Speech probability in [0, 1] for a frame at |level_dbfs|.
  double SpeechProbability(double level_dbfs) const;

  // RMS level of each complete or trailing partial frame.
  std::vector<double> FrameLevels(const float* samples, size_t count) const;

  // Speech regions in [0, duration of |count| samples). Regions are ordered,
  // non-overlapping, and never extend past the span.
  std::vector<SpeechRegion> Detect(const float* samples, size_t count) const;

  int64_t frame_ms() const { return config_.frame_duration_ms; }

 private:
  // Frame-index runs [first, last) of speech frames.
  struct Run {
    size_t first;
    size_t last;
  };

  std::vector<Run> SpeechRuns(const std::vector<double>& levels) const;

  core::SegmenterConfig config_;
  size_t frame_samples_;
};

}  // namespace redub::segmentation

#endif  // REDUB_SEGMENTATION_VOICE_ACTIVITY_DETECTOR_HPP_
