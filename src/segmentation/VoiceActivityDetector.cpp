// Repository: Redub
// Component: Voice Activity Detector Implementation
// Purpose: Energy-based speech probability per frame with run smoothing.
// Copyright (c) 2026 Redub

#include "redub/segmentation/VoiceActivityDetector.hpp"

#include <algorithm>
#include <cmath>

#include "redub/media/PcmBuffer.hpp"

namespace redub::segmentation {

VoiceActivityDetector::VoiceActivityDetector(const core::SegmenterConfig& config)
    : config_(config),
      frame_samples_(static_cast<size_t>(
          std::max<int64_t>(1, media::MsToSamples(config.frame_duration_ms, config.sample_rate)))) {}

double VoiceActivityDetector::SpeechProbability(double level_dbfs) const {
  const double centre = config_.silence_threshold_db + config_.vad_margin_db;
  return 1.0 / (1.0 + std::exp(-(level_dbfs - centre) / config_.vad_slope_db));
}

std::vector<double> VoiceActivityDetector::FrameLevels(const float* samples, size_t count) const {
  std::vector<double> levels;
  levels.reserve(count / frame_samples_ + 1);
  for (size_t off = 0; off < count; off += frame_samples_) {
    const size_t n = std::min(frame_samples_, count - off);
    levels.push_back(media::RmsDbfs(samples + off, n));
  }
  return levels;
}

std::vector<VoiceActivityDetector::Run> VoiceActivityDetector::SpeechRuns(
    const std::vector<double>& levels) const {
  const int64_t frame_ms = config_.frame_duration_ms;
  const size_t n = levels.size();

  std::vector<Run> runs;
  for (size_t i = 0; i < n;) {
    if (SpeechProbability(levels[i]) < config_.vad_threshold) {
      ++i;
      continue;
    }
    size_t j = i;
    while (j < n && SpeechProbability(levels[j]) >= config_.vad_threshold) ++j;
    runs.push_back({i, j});
    i = j;
  }

  // Short pauses inside speech (between words) are not silence.
  std::vector<Run> filled;
  for (const Run& r : runs) {
    if (!filled.empty()) {
      const int64_t gap_ms = static_cast<int64_t>(r.first - filled.back().last) * frame_ms;
      if (gap_ms < config_.vad_min_silence_duration_ms) {
        filled.back().last = r.last;
        continue;
      }
    }
    filled.push_back(r);
  }

  // Clicks and bursts.
  std::vector<Run> kept;
  for (const Run& r : filled) {
    if (static_cast<int64_t>(r.last - r.first) * frame_ms >= config_.min_speech_duration_ms) {
      kept.push_back(r);
    }
  }

  const size_t pad_frames = static_cast<size_t>(
      (config_.speech_pad_ms + frame_ms - 1) / frame_ms);
  std::vector<Run> out;
  for (Run r : kept) {
    r.first = r.first > pad_frames ? r.first - pad_frames : 0;
    r.last = std::min(n, r.last + pad_frames);

    // Padding keeps soft onsets and tails; anything under the silence floor
    // goes back.
    while (r.first < r.last && levels[r.first] < config_.silence_threshold_db) ++r.first;
    while (r.last > r.first && levels[r.last - 1] < config_.silence_threshold_db) --r.last;
    if (r.first >= r.last) continue;

    if (!out.empty() && r.first <= out.back().last) {
      out.back().last = std::max(out.back().last, r.last);
    } else {
      out.push_back(r);
    }
  }
  return out;
}

std::vector<SpeechRegion> VoiceActivityDetector::Detect(const float* samples, size_t count) const {
  std::vector<SpeechRegion> regions;
  if (count == 0) return regions;

  const int64_t span_ms = media::SamplesToMs(static_cast<int64_t>(count), config_.sample_rate);
  const int64_t frame_ms = config_.frame_duration_ms;
  for (const Run& r : SpeechRuns(FrameLevels(samples, count))) {
    SpeechRegion region;
    region.start_ms = static_cast<int64_t>(r.first) * frame_ms;
    region.end_ms = std::min(span_ms, static_cast<int64_t>(r.last) * frame_ms);
    if (region.end_ms > region.start_ms) regions.push_back(region);
  }
  return regions;
}

}  // namespace redub::segmentation
