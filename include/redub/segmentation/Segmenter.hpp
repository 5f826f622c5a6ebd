// Repository: Redub
// Component: Segmenter
// Purpose: Splits the extracted audio stream into an ordered, contiguous
//          list of speech and silence segments covering the whole input.
// Copyright (c) 2026 Redub

#ifndef REDUB_SEGMENTATION_SEGMENTER_HPP_
#define REDUB_SEGMENTATION_SEGMENTER_HPP_

#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/media/PcmBuffer.hpp"
#include "redub/segmentation/VoiceActivityDetector.hpp"

namespace redub::segmentation {

// Segmenter runs the detector over overlapping windows of chunk_duration_ms
// at a stride of (chunk_duration_ms - overlap_duration_ms), reconciles the
// detections of neighbouring windows, and only splits speech at silence runs
// of at least min_silence_duration_ms.
//
// Window reconciliation (per region of the later window that starts inside
// the overlap):
//   - speech running into the earlier window's right edge, or past it in the
//     later window, is one continuous region: the two partials are merged;
//   - otherwise both windows saw the same region: the later window's start
//     and the earlier window's end are kept, averaged instead when the two
//     estimates differ by less than one frame.
class Segmenter {
 public:
  explicit Segmenter(const core::SegmenterConfig& config);

  // Full timeline segmentation. Segment ids are sequential from 0; the last
  // segment ends at audio.DurationMs(). Empty input yields an empty list.
  // Throws core::ConfigError (kSampleRateMismatch) when audio.sample_rate
  // differs from the configured rate.
  std::vector<core::SourceSegment> Segment(const media::PcmBuffer& audio) const;

  // Reconciled speech regions on the absolute timeline, before the
  // conversion to segments.
  std::vector<SpeechRegion> DetectSpeech(const media::PcmBuffer& audio) const;

 private:
  void Reconcile(std::vector<SpeechRegion>* accumulated, int64_t accumulated_end_ms,
                 int64_t window_start_ms, const std::vector<SpeechRegion>& window) const;

  core::SegmenterConfig config_;
  VoiceActivityDetector vad_;
};

}  // namespace redub::segmentation

#endif  // REDUB_SEGMENTATION_SEGMENTER_HPP_
