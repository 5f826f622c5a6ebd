// Repository: Redub
// Component: Segmenter Implementation
// Purpose: Overlapping-window VAD with boundary reconciliation.
// Copyright (c) 2026 Redub

#include "redub/segmentation/Segmenter.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "redub/core/Errors.hpp"
#include "redub/util/Logger.hpp"

namespace redub::segmentation {

using core::SourceSegment;
using util::Logger;

namespace {

void SortAndMergeOverlapping(std::vector<SpeechRegion>* regions) {
  std::sort(regions->begin(), regions->end(),
            [](const SpeechRegion& a, const SpeechRegion& b) { return a.start_ms < b.start_ms; });
  std::vector<SpeechRegion> out;
  for (const SpeechRegion& r : *regions) {
    if (!out.empty() && r.start_ms <= out.back().end_ms) {
      out.back().end_ms = std::max(out.back().end_ms, r.end_ms);
    } else {
      out.push_back(r);
    }
  }
  regions->swap(out);
}

}  // namespace

Segmenter::Segmenter(const core::SegmenterConfig& config)
    : config_(config), vad_(config) {}

void Segmenter::Reconcile(std::vector<SpeechRegion>* accumulated, int64_t accumulated_end_ms,
                          int64_t window_start_ms,
                          const std::vector<SpeechRegion>& window) const {
  const int64_t frame_ms = config_.frame_duration_ms;

  for (const SpeechRegion& b : window) {
    if (b.start_ms >= accumulated_end_ms) {
      accumulated->push_back(b);
      continue;
    }

    // Earlier-window detections this region duplicates or continues.
    bool paired = false;
    SpeechRegion a;
    for (auto it = accumulated->begin(); it != accumulated->end();) {
      if (it->end_ms >= b.start_ms && it->start_ms <= b.end_ms) {
        if (!paired) {
          a = *it;
        } else {
          a.start_ms = std::min(a.start_ms, it->start_ms);
          a.end_ms = std::max(a.end_ms, it->end_ms);
        }
        paired = true;
        it = accumulated->erase(it);
      } else {
        ++it;
      }
    }
    if (!paired) {
      accumulated->push_back(b);
      continue;
    }

    SpeechRegion merged;
    merged.start_ms = std::min(a.start_ms, b.start_ms);
    merged.end_ms = std::max(a.end_ms, b.end_ms);

    const bool continuous = a.end_ms >= accumulated_end_ms || b.end_ms > accumulated_end_ms;
    if (!continuous) {
      // A later-window start at its own left edge is a window cut, not an
      // onset.
      int64_t start = b.start_ms > window_start_ms ? b.start_ms : a.start_ms;
      int64_t end = a.end_ms;
      if (a.start_ms != b.start_ms && std::llabs(a.start_ms - b.start_ms) < frame_ms) {
        start = (a.start_ms + b.start_ms) / 2;
      }
      if (a.end_ms != b.end_ms && std::llabs(a.end_ms - b.end_ms) < frame_ms) {
        end = (a.end_ms + b.end_ms) / 2;
      }
      if (start < end) {
        merged.start_ms = start;
        merged.end_ms = end;
      }
    }
    accumulated->push_back(merged);
  }

  SortAndMergeOverlapping(accumulated);
}

std::vector<SpeechRegion> Segmenter::DetectSpeech(const media::PcmBuffer& audio) const {
  if (audio.sample_rate != config_.sample_rate) {
    std::ostringstream oss;
    oss << "sample_rate: input is " << audio.sample_rate
        << " Hz, configured " << config_.sample_rate << " Hz";
    throw core::ConfigError(oss.str(), core::DubError::kSampleRateMismatch);
  }

  std::vector<SpeechRegion> regions;
  if (audio.empty()) return regions;

  const int64_t total = static_cast<int64_t>(audio.size());
  const int64_t chunk_samples = media::MsToSamples(config_.chunk_duration_ms, config_.sample_rate);
  const int64_t stride_ms = config_.chunk_duration_ms - config_.overlap_duration_ms;

  int64_t accumulated_end_ms = 0;
  int windows = 0;
  for (int64_t window_start_ms = 0;; window_start_ms += stride_ms) {
    const int64_t begin = media::MsToSamples(window_start_ms, config_.sample_rate);
    if (begin >= total) break;
    const int64_t end = std::min(begin + chunk_samples, total);

    std::vector<SpeechRegion> detected =
        vad_.Detect(audio.samples.data() + begin, static_cast<size_t>(end - begin));
    for (SpeechRegion& r : detected) {
      r.start_ms += window_start_ms;
      r.end_ms += window_start_ms;
    }

    if (windows == 0) {
      regions = std::move(detected);
    } else {
      Reconcile(&regions, accumulated_end_ms, window_start_ms, detected);
    }
    accumulated_end_ms = window_start_ms + media::SamplesToMs(end - begin, config_.sample_rate);
    ++windows;
    if (end >= total) break;
  }

  // Speech is only split at silence runs of at least min_silence_duration_ms.
  std::vector<SpeechRegion> joined;
  for (const SpeechRegion& r : regions) {
    if (!joined.empty() &&
        r.start_ms - joined.back().end_ms < config_.min_silence_duration_ms) {
      joined.back().end_ms = std::max(joined.back().end_ms, r.end_ms);
    } else {
      joined.push_back(r);
    }
  }

  std::ostringstream oss;
  oss << "[Segmenter] VAD_DONE windows=" << windows
      << " regions=" << joined.size()
      << " duration_ms=" << audio.DurationMs();
  Logger::Debug(oss.str());
  return joined;
}

std::vector<SourceSegment> Segmenter::Segment(const media::PcmBuffer& audio) const {
  const std::vector<SpeechRegion> speech = DetectSpeech(audio);

  std::vector<SourceSegment> segments;
  const int64_t total_ms = audio.DurationMs();
  if (audio.empty() || total_ms <= 0) return segments;

  auto emit = [&](int64_t start_ms, int64_t end_ms, bool is_speech) {
    if (end_ms <= start_ms) return;
    SourceSegment seg;
    seg.id = static_cast<int32_t>(segments.size());
    seg.start_ms = start_ms;
    seg.end_ms = end_ms;
    seg.is_speech = is_speech;
    seg.sample_begin = media::MsToSamples(start_ms, audio.sample_rate);
    seg.sample_end = media::MsToSamples(end_ms, audio.sample_rate);
    segments.push_back(seg);
  };

  int64_t cursor = 0;
  for (const SpeechRegion& r : speech) {
    const int64_t start = std::max(cursor, r.start_ms);
    const int64_t end = std::min(total_ms, r.end_ms);
    if (end <= start) continue;
    emit(cursor, start, false);
    emit(start, end, true);
    cursor = end;
  }
  emit(cursor, total_ms, false);

  // Trailing sub-millisecond samples belong to the last segment.
  segments.back().sample_end = static_cast<int64_t>(audio.size());

  size_t speech_count = 0;
  for (const SourceSegment& s : segments) {
    if (s.is_speech) ++speech_count;
  }
  std::ostringstream oss;
  oss << "[Segmenter] SEGMENTED segments=" << segments.size()
      << " speech=" << speech_count
      << " silence=" << (segments.size() - speech_count)
      << " duration_ms=" << total_ms;
  Logger::Info(oss.str());
  return segments;
}

}  // namespace redub::segmentation
