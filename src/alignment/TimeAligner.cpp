// Repository: Redub
// Component: Time Aligner Implementation
// Copyright (c) 2026 Redub

#include "redub/alignment/TimeAligner.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "redub/core/Errors.hpp"
#include "redub/util/Logger.hpp"

namespace redub::alignment {

using core::AlignedClip;
using core::DriftKind;
using core::DriftWarning;
using util::Logger;

namespace {

// Rates this close to 1.0 are played unchanged.
constexpr double kUnityRateEpsilon = 1e-3;

}  // namespace

std::vector<AlignmentSlot> BuildSlots(const std::vector<core::SourceSegment>& segments,
                                      const std::map<int32_t, core::SpeakerProfile>& profiles,
                                      int64_t timeline_end_ms,
                                      const core::AlignerConfig& config) {
  std::vector<AlignmentSlot> slots;
  for (const auto& seg : segments) {
    if (!seg.is_speech) continue;
    AlignmentSlot slot;
    slot.segment_id = seg.id;
    slot.source_start_ms = seg.start_ms;
    slot.source_end_ms = seg.end_ms;
    slot.min_rate = config.min_rate;
    slot.max_rate = config.max_rate;
    auto it = profiles.find(seg.id);
    if (it != profiles.end() && it->second.max_rate > 0.0) {
      slot.min_rate = it->second.min_rate;
      slot.max_rate = it->second.max_rate;
    }
    slots.push_back(slot);
  }
  for (size_t i = 0; i < slots.size(); ++i) {
    const bool last = i + 1 == slots.size();
    slots[i].is_last = last;
    slots[i].next_speech_start_ms =
        last ? std::max(timeline_end_ms, slots[i].source_end_ms) : slots[i + 1].source_start_ms;
  }
  return slots;
}

TimeAligner::TimeAligner(const core::AlignerConfig& config, int64_t min_pause_ms,
                         int output_sample_rate, media::ITimeStretcher* stretcher)
    : config_(config),
      min_pause_ms_(min_pause_ms),
      output_sample_rate_(output_sample_rate),
      stretcher_(stretcher) {}

void TimeAligner::Begin() {
  drift_ms_ = 0;
  previous_end_ms_ = 0;
  aligned_count_ = 0;
  warnings_.clear();
}

void TimeAligner::Restore(int64_t previous_end_ms, int64_t cumulative_drift_ms) {
  previous_end_ms_ = previous_end_ms;
  drift_ms_ = cumulative_drift_ms;
}

void TimeAligner::Bounds(const AlignmentSlot& slot, double* lo, double* hi) const {
  *lo = config_.min_rate;
  *hi = config_.max_rate;
  if (slot.max_rate > 0.0) {
    const double l = std::max(config_.min_rate, slot.min_rate);
    const double h = std::min(config_.max_rate, slot.max_rate);
    if (l <= h) {
      *lo = l;
      *hi = h;
    }
  }
}

void TimeAligner::Place(const AlignmentSlot& slot, double required_rate, double applied_rate,
                        int64_t actual_ms, AlignedClip* clip) {
  const int64_t slot_ms = slot.duration_ms();
  const int64_t start = std::max(slot.source_start_ms + drift_ms_, previous_end_ms_);
  const int64_t target_end = start + slot_ms;

  clip->segment_id = slot.segment_id;
  clip->source_start_ms = slot.source_start_ms;
  clip->source_end_ms = slot.source_end_ms;
  clip->final_start_ms = start;
  clip->applied_rate = applied_rate;
  clip->shift_ms = start - slot.source_start_ms;
  clip->pad_ms = 0;
  clip->absorbed_ms = 0;

  if (actual_ms <= slot_ms) {
    // Short (or exact) clip: trailing silence fills the slot.
    clip->final_end_ms = target_end;
    clip->pad_ms = slot_ms - actual_ms;
  } else {
    const int64_t overflow = actual_ms - slot_ms;
    const int64_t reserve = slot.is_last ? 0 : min_pause_ms_;
    const int64_t budget =
        std::max<int64_t>(0, slot.next_speech_start_ms + drift_ms_ - reserve - target_end);
    const int64_t absorbed = std::min(overflow, budget);
    const int64_t unabsorbed = overflow - absorbed;
    clip->final_end_ms = start + actual_ms;
    clip->absorbed_ms = absorbed;

    double lo = 0.0;
    double hi = 0.0;
    Bounds(slot, &lo, &hi);
    if (unabsorbed > 0 || required_rate > hi + kUnityRateEpsilon) {
      DriftWarning w;
      w.segment_id = slot.segment_id;
      w.required_rate = required_rate;
      w.applied_rate = applied_rate;
      w.overflow_ms = overflow;
      w.absorbed_ms = absorbed;
      w.shift_ms = unabsorbed;
      w.kind = unabsorbed > 0 ? DriftKind::kCascadingShift : DriftKind::kAbsorbedIntoSilence;
      drift_ms_ += unabsorbed;
      w.cumulative_drift_ms = drift_ms_;
      warnings_.push_back(w);

      std::ostringstream oss;
      oss << "segment_id=" << slot.segment_id
          << " required_rate=" << required_rate
          << " applied_rate=" << applied_rate
          << " overflow_ms=" << overflow
          << " absorbed_ms=" << absorbed
          << " shift_ms=" << unabsorbed
          << " cumulative_drift_ms=" << drift_ms_;
      if (unabsorbed > 0) {
        Logger::Warn("[TimeAligner] DRIFT_WARNING " + oss.str());
      } else {
        Logger::Info("[TimeAligner] DRIFT_ABSORBED " + oss.str());
      }
    }
  }

  if (drift_ms_ > config_.drift_tolerance_ms) {
    std::ostringstream oss;
    oss << "[TimeAligner] DRIFT_EXCEEDED segment_id=" << slot.segment_id
        << " cumulative_drift_ms=" << drift_ms_
        << " tolerance_ms=" << config_.drift_tolerance_ms
        << " aligned=" << aligned_count_;
    Logger::Error(oss.str());
    throw core::SyncError(oss.str());
  }

  previous_end_ms_ = clip->final_end_ms;
  ++aligned_count_;
}

AlignedClip TimeAligner::AlignNext(const AlignmentSlot& slot, const core::SynthesizedClip& clip) {
  if (slot.duration_ms() <= 0) {
    throw core::SyncError("[TimeAligner] empty slot segment_id=" + std::to_string(slot.segment_id),
                          core::DubError::kOverlappingClips);
  }
  double lo = 0.0;
  double hi = 0.0;
  Bounds(slot, &lo, &hi);

  const double synth_ms = clip.waveform.sample_rate > 0
      ? static_cast<double>(clip.waveform.size()) * 1000.0 / clip.waveform.sample_rate
      : 0.0;
  const double required = synth_ms / static_cast<double>(slot.duration_ms());
  double applied = std::clamp(required, lo, hi);

  media::PcmBuffer stretched;
  if (std::fabs(applied - 1.0) < kUnityRateEpsilon &&
      clip.waveform.sample_rate == output_sample_rate_) {
    applied = 1.0;
    stretched = clip.waveform;
  } else {
    if (stretcher_ == nullptr) {
      throw std::invalid_argument("TimeAligner: time stretcher required for rate change");
    }
    stretched = stretcher_->Stretch(clip.waveform, applied, output_sample_rate_);
  }
  stretched.sample_rate = output_sample_rate_;

  const int64_t actual_ms =
      media::SamplesToMsCeil(static_cast<int64_t>(stretched.size()), output_sample_rate_);

  AlignedClip out;
  Place(slot, required, applied, actual_ms, &out);

  // Waveform spans [final_start, final_end]; the tail is the pad.
  const size_t span = static_cast<size_t>(
      media::MsToSamples(out.final_end_ms - out.final_start_ms, output_sample_rate_));
  if (stretched.size() < span) stretched.samples.resize(span, 0.0f);
  out.waveform = std::move(stretched);

  std::ostringstream oss;
  oss << "[TimeAligner] ALIGNED segment_id=" << out.segment_id
      << " source=[" << out.source_start_ms << "," << out.source_end_ms << ")"
      << " final=[" << out.final_start_ms << "," << out.final_end_ms << ")"
      << " rate=" << out.applied_rate
      << " pad_ms=" << out.pad_ms
      << " absorbed_ms=" << out.absorbed_ms
      << " shift_ms=" << out.shift_ms;
  Logger::Debug(oss.str());

  if (sink_) sink_(out, drift_ms_);
  return out;
}

AlignedClip TimeAligner::AlignDuration(const AlignmentSlot& slot, int64_t synth_ms) {
  if (slot.duration_ms() <= 0) {
    throw core::SyncError("[TimeAligner] empty slot segment_id=" + std::to_string(slot.segment_id),
                          core::DubError::kOverlappingClips);
  }
  double lo = 0.0;
  double hi = 0.0;
  Bounds(slot, &lo, &hi);
  const double required = static_cast<double>(synth_ms) / static_cast<double>(slot.duration_ms());
  const double applied = std::clamp(required, lo, hi);
  const int64_t actual_ms = static_cast<int64_t>(std::ceil(synth_ms / applied - 1e-9));

  AlignedClip out;
  Place(slot, required, applied, actual_ms, &out);
  if (sink_) sink_(out, drift_ms_);
  return out;
}

std::vector<AlignedClip> TimeAligner::AlignAll(const std::vector<AlignmentSlot>& slots,
                                               const std::vector<core::SynthesizedClip>& clips) {
  std::map<int32_t, const core::SynthesizedClip*> by_id;
  for (const auto& c : clips) by_id[c.segment_id] = &c;

  std::vector<AlignedClip> out;
  for (const auto& slot : slots) {
    auto it = by_id.find(slot.segment_id);
    if (it == by_id.end()) continue;
    out.push_back(AlignNext(slot, *it->second));
  }
  return out;
}

std::vector<AlignedClip> TimeAligner::AlignDurations(const std::vector<AlignmentSlot>& slots,
                                                     const std::vector<int64_t>& synth_ms) {
  if (slots.size() != synth_ms.size()) {
    throw std::invalid_argument("TimeAligner: slots and durations differ in length");
  }
  std::vector<AlignedClip> out;
  out.reserve(slots.size());
  for (size_t i = 0; i < slots.size(); ++i) {
    out.push_back(AlignDuration(slots[i], synth_ms[i]));
  }
  return out;
}

int64_t TimeAligner::Finish() {
  size_t shifted = 0;
  for (const auto& w : warnings_) {
    if (w.kind == DriftKind::kCascadingShift) ++shifted;
  }
  std::ostringstream oss;
  oss << "[TimeAligner] ALIGN_DONE clips=" << aligned_count_
      << " warnings=" << warnings_.size()
      << " shifted=" << shifted
      << " cumulative_drift_ms=" << drift_ms_
      << " end_ms=" << previous_end_ms_;
  Logger::Info(oss.str());
  return previous_end_ms_;
}

}  // namespace redub::alignment
