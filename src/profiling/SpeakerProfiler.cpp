// Repository: Redub
// Component: Speaker Profiler Implementation
// Purpose: Feature extraction, weighted gender confidence, voice selection.
// Copyright (c) 2026 Redub

#include "redub/profiling/SpeakerProfiler.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include "redub/media/LoudnessGain.hpp"
#include "redub/profiling/SpectralAnalysis.hpp"
#include "redub/util/Logger.hpp"

namespace redub::profiling {

using core::Gender;
using util::Logger;

namespace {

// Energy confidence saturates this far above the silence threshold.
constexpr double kEnergySpanDb = 30.0;

// Pitch-shift hints are only given inside this band.
constexpr double kPitchHintMinHz = 50.0;
constexpr double kPitchHintMaxHz = 300.0;
constexpr double kPitchHintScale = 50.0;

double Median(std::vector<double> values) {
  if (values.empty()) return 0.0;
  const size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  double m = values[mid];
  if (values.size() % 2 == 0) {
    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    m = 0.5 * (m + lower);
  }
  return m;
}

}  // namespace

SpeakerProfiler::SpeakerProfiler(const core::JobConfig& config)
    : config_(config.profiler),
      synthesis_(config.synthesis),
      aligner_(config.aligner),
      silence_threshold_db_(config.segmenter.silence_threshold_db),
      reference_level_dbfs_(config.assembly.target_loudness_dbfs),
      target_language_(config.pipeline.target_language),
      use_pitch_(config.profiler.features.pitch && config.profiler.pitch_weight > 0.0),
      use_energy_(config.profiler.features.energy && config.profiler.energy_weight > 0.0),
      use_spectral_(config.profiler.features.spectral && config.profiler.spectral_weight > 0.0) {
  std::ostringstream oss;
  oss << "[SpeakerProfiler] FEATURES pitch=" << use_pitch_
      << " energy=" << use_energy_
      << " spectral=" << use_spectral_;
  Logger::Debug(oss.str());
}

SegmentFeatures SpeakerProfiler::Analyse(const media::PcmBuffer& slice) const {
  SegmentFeatures f;
  f.energy_db = media::RmsDbfs(slice.samples.data(), slice.size());
  if (slice.empty()) return f;

  const size_t frame = static_cast<size_t>(
      std::max<int64_t>(1, media::MsToSamples(config_.analysis_frame_ms, slice.sample_rate)));
  const double min_hz = std::min(config_.male.min_hz, config_.female.min_hz);
  const double max_hz = std::max(config_.male.max_hz, config_.female.max_hz);

  std::vector<double> pitches;
  double centroid_sum = 0.0;
  for (size_t off = 0; off + frame <= slice.size(); off += frame) {
    const float* p = slice.samples.data() + off;
    if (media::RmsDbfs(p, frame) < silence_threshold_db_) continue;
    ++f.analysed_frames;
    if (use_spectral_) centroid_sum += SpectralCentroidHz(p, frame, slice.sample_rate);
    if (use_pitch_) {
      PitchEstimate est = EstimatePitch(p, frame, slice.sample_rate, min_hz, max_hz,
                                        config_.voicing_threshold);
      if (est.hz > 0.0) pitches.push_back(est.hz);
    }
  }

  f.voiced_frames = static_cast<int>(pitches.size());
  f.pitch_hz = Median(std::move(pitches));
  if (f.analysed_frames > 0) f.spectral_centroid_hz = centroid_sum / f.analysed_frames;
  return f;
}

Gender SpeakerProfiler::ClassifyPitch(double pitch_hz, double* confidence) const {
  const double d_male = std::fabs(pitch_hz - config_.male.base_hz);
  const double d_female = std::fabs(pitch_hz - config_.female.base_hz);
  const Gender gender = d_male <= d_female ? Gender::kMale : Gender::kFemale;

  const double d_self = std::min(d_male, d_female);
  const double d_other = std::max(d_male, d_female);
  double conf = (d_self + d_other) > 0.0 ? d_other / (d_self + d_other) : 0.5;
  if (!config_.male.Contains(pitch_hz) && !config_.female.Contains(pitch_hz)) {
    conf *= 0.5;
  }
  if (confidence) *confidence = conf;
  return gender;
}

double SpeakerProfiler::EnergyConfidence(double energy_db) const {
  return std::clamp((energy_db - silence_threshold_db_) / kEnergySpanDb, 0.0, 1.0);
}

double SpeakerProfiler::SpectralConfidence(Gender gender, double centroid_hz) const {
  const double split = config_.spectral_split_hz;
  const double distance = std::min(1.0, std::fabs(centroid_hz - split) / split);
  const bool votes_male = centroid_hz < split;
  const bool agrees = (gender == Gender::kMale) == votes_male;
  return agrees ? 0.5 + 0.5 * distance : 0.5 - 0.5 * distance;
}

std::string SpeakerProfiler::SelectVoice(Gender gender) const {
  switch (gender) {
    case Gender::kMale:
      return synthesis_.male_voice.empty() ? core::BuiltinVoice(target_language_, false)
                                           : synthesis_.male_voice;
    case Gender::kFemale:
      return synthesis_.female_voice.empty() ? core::BuiltinVoice(target_language_, true)
                                             : synthesis_.female_voice;
    case Gender::kUnknown:
      break;
  }
  return synthesis_.default_voice.empty() ? core::BuiltinVoice(target_language_, false)
                                          : synthesis_.default_voice;
}

std::string SpeakerProfiler::VoiceType(Gender gender, double pitch_hz) {
  switch (gender) {
    case Gender::kMale:
      if (pitch_hz < 120.0) return "bass";
      if (pitch_hz < 150.0) return "baritone";
      return "tenor";
    case Gender::kFemale:
      if (pitch_hz < 200.0) return "contralto";
      if (pitch_hz < 250.0) return "mezzo-soprano";
      return "soprano";
    case Gender::kUnknown:
      break;
  }
  return "unknown";
}

core::SpeakerProfile SpeakerProfiler::Profile(const core::SourceSegment& segment,
                                              const media::PcmBuffer& slice) const {
  const SegmentFeatures f = Analyse(slice);

  core::SpeakerProfile profile;
  profile.segment_id = segment.id;
  profile.pitch_hz = f.pitch_hz;
  profile.energy_db = f.energy_db;
  profile.spectral_centroid_hz = f.spectral_centroid_hz;

  // Provisional gender from the strongest available cue.
  Gender gender = Gender::kUnknown;
  double pitch_conf = 0.0;
  if (use_pitch_) {
    if (f.voiced_frames > 0) gender = ClassifyPitch(f.pitch_hz, &pitch_conf);
  } else if (use_spectral_ && f.spectral_centroid_hz > 0.0) {
    gender = f.spectral_centroid_hz < config_.spectral_split_hz ? Gender::kMale : Gender::kFemale;
  }

  double confidence = 0.0;
  if (gender != Gender::kUnknown) {
    double weighted = 0.0;
    double weights = 0.0;
    if (use_pitch_) {
      weighted += config_.pitch_weight * pitch_conf;
      weights += config_.pitch_weight;
    }
    if (use_energy_) {
      weighted += config_.energy_weight * EnergyConfidence(f.energy_db);
      weights += config_.energy_weight;
    }
    if (use_spectral_) {
      weighted += config_.spectral_weight * SpectralConfidence(gender, f.spectral_centroid_hz);
      weights += config_.spectral_weight;
    }
    confidence = weights > 0.0 ? weighted / weights : 0.0;
  }
  profile.confidence = confidence;
  if (confidence < config_.min_confidence) gender = Gender::kUnknown;
  profile.gender = gender;

  profile.voice_type = VoiceType(gender, f.pitch_hz);
  profile.voice_id = SelectVoice(gender);

  const double volume = f.energy_db <= media::kSilenceFloorDb
      ? synthesis_.min_volume
      : media::GainDbToLinear(static_cast<float>(f.energy_db - reference_level_dbfs_));
  profile.volume = std::clamp(volume, synthesis_.min_volume, synthesis_.max_volume);

  if (gender != Gender::kUnknown && f.pitch_hz >= kPitchHintMinHz &&
      f.pitch_hz <= kPitchHintMaxHz) {
    const double base = gender == Gender::kMale ? config_.male.base_hz : config_.female.base_hz;
    profile.pitch_shift_hz = static_cast<int>(((f.pitch_hz - base) / base) * kPitchHintScale);
  }

  if (gender == Gender::kUnknown) {
    const double h = config_.unknown_rate_headroom;
    profile.min_rate = 1.0 - (1.0 - aligner_.min_rate) * h;
    profile.max_rate = 1.0 + (aligner_.max_rate - 1.0) * h;
  } else {
    profile.min_rate = aligner_.min_rate;
    profile.max_rate = aligner_.max_rate;
  }

  std::ostringstream oss;
  oss << "[SpeakerProfiler] PROFILE segment_id=" << segment.id
      << " gender=" << core::GenderName(profile.gender)
      << " pitch_hz=" << profile.pitch_hz
      << " confidence=" << profile.confidence
      << " voice=" << profile.voice_id
      << " voice_type=" << profile.voice_type;
  Logger::Debug(oss.str());
  return profile;
}

}  // namespace redub::profiling
