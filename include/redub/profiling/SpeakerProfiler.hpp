// Repository: Redub
// Component: Speaker Profiler
// Purpose: Per-segment gender/voice profile from pitch, energy and spectral
//          features; selects the synthesis voice and the aligner rate bounds.
// Copyright (c) 2026 Redub

#ifndef REDUB_PROFILING_SPEAKER_PROFILER_HPP_
#define REDUB_PROFILING_SPEAKER_PROFILER_HPP_

#include <string>

#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/media/PcmBuffer.hpp"

namespace redub::profiling {

// Acoustic summary of one segment before classification.
struct SegmentFeatures {
  double pitch_hz = 0.0;             // Median F0 over voiced frames
  int voiced_frames = 0;
  int analysed_frames = 0;           // Frames above the silence threshold
  double energy_db = 0.0;            // RMS level of the whole slice
  double spectral_centroid_hz = 0.0; // Mean over analysed frames
};

class SpeakerProfiler {
 public:
  // The enabled feature set and its weights are fixed here for the lifetime
  // of the profiler.
  explicit SpeakerProfiler(const core::JobConfig& config);

  // Profile of one speech segment; |slice| holds that segment's audio.
  core::SpeakerProfile Profile(const core::SourceSegment& segment,
                               const media::PcmBuffer& slice) const;

  SegmentFeatures Analyse(const media::PcmBuffer& slice) const;

  // Nearest-base classification. |confidence| receives the normalized
  // inverse distance, halved when the pitch lies outside every range.
  core::Gender ClassifyPitch(double pitch_hz, double* confidence) const;

  std::string SelectVoice(core::Gender gender) const;

  static std::string VoiceType(core::Gender gender, double pitch_hz);

 private:
  double EnergyConfidence(double energy_db) const;
  double SpectralConfidence(core::Gender gender, double centroid_hz) const;

  core::ProfilerConfig config_;
  core::SynthesisConfig synthesis_;
  core::AlignerConfig aligner_;
  double silence_threshold_db_;
  double reference_level_dbfs_;
  std::string target_language_;

  const bool use_pitch_;
  const bool use_energy_;
  const bool use_spectral_;
};

}  // namespace redub::profiling

#endif  // REDUB_PROFILING_SPEAKER_PROFILER_HPP_
