// Repository: Redub
// Component: Job Config Validator Implementation
// Copyright (c) 2026 Redub

#include "redub/core/ConfigValidator.hpp"

#include <algorithm>
#include <sstream>

#include "redub/core/Errors.hpp"

namespace redub::core {

namespace {

constexpr int kMinSampleRate = 8000;
constexpr int kMaxSampleRate = 192000;

// atempo chains cover any rate, but beyond 4x speech is unintelligible.
constexpr double kMaxSupportedRate = 4.0;

bool SampleRateInRange(int rate) {
  return rate >= kMinSampleRate && rate <= kMaxSampleRate;
}

}  // namespace

ConfigValidator::ValidationResult ConfigValidator::Validate(const JobConfig& config) const {
  auto result = ValidateSegmenter(config.segmenter);
  if (!result.valid) return result;

  result = ValidateProfiler(config.profiler);
  if (!result.valid) return result;

  result = ValidateAligner(config.aligner);
  if (!result.valid) return result;

  result = ValidateSynthesis(config.synthesis);
  if (!result.valid) return result;

  result = ValidateSubtitles(config.subtitles);
  if (!result.valid) return result;

  result = ValidateAssembly(config.assembly);
  if (!result.valid) return result;

  result = ValidateMux(config.mux);
  if (!result.valid) return result;

  return ValidatePipeline(config.pipeline);
}

void ConfigValidator::ValidateOrThrow(const JobConfig& config) const {
  auto result = Validate(config);
  if (!result.valid) {
    throw ConfigError(result.field + ": " + result.detail);
  }
}

ConfigValidator::ValidationResult ConfigValidator::ValidateSegmenter(
    const SegmenterConfig& c) const {
  if (!SampleRateInRange(c.sample_rate)) {
    std::ostringstream detail;
    detail << c.sample_rate << " outside [" << kMinSampleRate << ", " << kMaxSampleRate << "]";
    return ValidationResult::Failure("sample_rate", detail.str());
  }
  if (c.frame_duration_ms <= 0) {
    return ValidationResult::Failure("frame_duration_ms", "must be positive");
  }
  if (c.chunk_duration_ms <= 0) {
    return ValidationResult::Failure("chunk_duration_ms", "must be positive");
  }
  if (c.overlap_duration_ms < 0 || c.overlap_duration_ms >= c.chunk_duration_ms) {
    std::ostringstream detail;
    detail << "overlap (" << c.overlap_duration_ms << ") must be in [0, chunk_duration_ms ("
           << c.chunk_duration_ms << "))";
    return ValidationResult::Failure("overlap_duration_ms", detail.str());
  }
  // Window starts must land on the frame grid so overlapping windows
  // classify identical frames.
  if (c.chunk_duration_ms % c.frame_duration_ms != 0 ||
      c.overlap_duration_ms % c.frame_duration_ms != 0) {
    std::ostringstream detail;
    detail << "chunk (" << c.chunk_duration_ms << ") and overlap (" << c.overlap_duration_ms
           << ") must be multiples of frame_duration_ms (" << c.frame_duration_ms << ")";
    return ValidationResult::Failure("chunk_duration_ms", detail.str());
  }
  if (c.silence_threshold_db >= 0.0 || c.silence_threshold_db < -120.0) {
    return ValidationResult::Failure("silence_threshold_db", "must be in [-120, 0) dBFS");
  }
  if (c.min_silence_duration_ms <= 0) {
    return ValidationResult::Failure("min_silence_duration_ms", "must be positive");
  }
  if (c.vad_threshold <= 0.0 || c.vad_threshold >= 1.0) {
    return ValidationResult::Failure("vad_threshold", "must be in (0, 1)");
  }
  if (c.min_speech_duration_ms < 0) {
    return ValidationResult::Failure("min_speech_duration_ms", "must be non-negative");
  }
  if (c.vad_min_silence_duration_ms < 0) {
    return ValidationResult::Failure("vad_min_silence_duration_ms", "must be non-negative");
  }
  if (c.speech_pad_ms < 0) {
    return ValidationResult::Failure("speech_pad_ms", "must be non-negative");
  }
  if (c.vad_slope_db <= 0.0) {
    return ValidationResult::Failure("vad_slope_db", "must be positive");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidateProfiler(
    const ProfilerConfig& c) const {
  auto check_range = [](const PitchRange& r, const std::string& prefix) {
    if (r.min_hz <= 0.0 || r.max_hz <= r.min_hz) {
      std::ostringstream detail;
      detail << "range [" << r.min_hz << ", " << r.max_hz << "] is empty or non-positive";
      return ValidationResult::Failure(prefix + "_pitch_min_hz", detail.str());
    }
    if (!r.Contains(r.base_hz)) {
      std::ostringstream detail;
      detail << "base " << r.base_hz << " outside [" << r.min_hz << ", " << r.max_hz << "]";
      return ValidationResult::Failure(prefix + "_pitch_base_hz", detail.str());
    }
    return ValidationResult::Success();
  };

  auto result = check_range(c.male, "male");
  if (!result.valid) return result;
  result = check_range(c.female, "female");
  if (!result.valid) return result;

  if (c.male.base_hz >= c.female.base_hz) {
    return ValidationResult::Failure("male_pitch_base_hz", "must be below female_pitch_base_hz");
  }
  if (c.min_confidence < 0.0 || c.min_confidence > 1.0) {
    return ValidationResult::Failure("min_confidence", "must be in [0, 1]");
  }
  if (!c.features.pitch && !c.features.spectral) {
    return ValidationResult::Failure("feature_pitch",
                                     "pitch or spectral feature is required for gender");
  }
  if (c.pitch_weight < 0.0 || c.energy_weight < 0.0 || c.spectral_weight < 0.0) {
    return ValidationResult::Failure("pitch_weight", "feature weights must be non-negative");
  }
  double enabled_weight = (c.features.pitch ? c.pitch_weight : 0.0) +
                          (c.features.energy ? c.energy_weight : 0.0) +
                          (c.features.spectral ? c.spectral_weight : 0.0);
  if (enabled_weight <= 0.0) {
    return ValidationResult::Failure("pitch_weight", "enabled feature weights sum to zero");
  }
  if (c.analysis_frame_ms <= 0) {
    return ValidationResult::Failure("analysis_frame_ms", "must be positive");
  }
  // Autocorrelation needs at least one full period of the lowest pitch.
  double lowest = std::min(c.male.min_hz, c.female.min_hz);
  if (static_cast<double>(c.analysis_frame_ms) < 2000.0 / lowest) {
    std::ostringstream detail;
    detail << c.analysis_frame_ms << " ms frame too short for " << lowest << " Hz";
    return ValidationResult::Failure("analysis_frame_ms", detail.str());
  }
  if (c.voicing_threshold <= 0.0 || c.voicing_threshold >= 1.0) {
    return ValidationResult::Failure("voicing_threshold", "must be in (0, 1)");
  }
  if (c.spectral_split_hz <= 0.0) {
    return ValidationResult::Failure("spectral_split_hz", "must be positive");
  }
  if (c.unknown_rate_headroom < 0.0 || c.unknown_rate_headroom > 1.0) {
    return ValidationResult::Failure("unknown_rate_headroom", "must be in [0, 1]");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidateAligner(
    const AlignerConfig& c) const {
  if (c.min_rate <= 0.0 || c.min_rate > 1.0) {
    std::ostringstream detail;
    detail << c.min_rate << " must be in (0, 1]";
    return ValidationResult::Failure("min_rate", detail.str());
  }
  if (c.max_rate < 1.0 || c.max_rate > kMaxSupportedRate) {
    std::ostringstream detail;
    detail << c.max_rate << " must be in [1, " << kMaxSupportedRate << "]";
    return ValidationResult::Failure("max_rate", detail.str());
  }
  if (c.drift_tolerance_ms < 0) {
    return ValidationResult::Failure("drift_tolerance_ms", "must be non-negative");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidateSynthesis(
    const SynthesisConfig& c) const {
  if (c.min_volume <= 0.0 || c.max_volume < c.min_volume) {
    std::ostringstream detail;
    detail << "volume bounds [" << c.min_volume << ", " << c.max_volume << "] invalid";
    return ValidationResult::Failure("min_volume", detail.str());
  }
  if (c.default_rate <= 0.0) {
    return ValidationResult::Failure("default_rate", "must be positive");
  }
  if (!SampleRateInRange(c.sample_rate)) {
    return ValidationResult::Failure("synthesis_sample_rate", "outside supported range");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidateSubtitles(
    const SubtitleConfig& c) const {
  if (c.max_chars_per_line < 1) {
    return ValidationResult::Failure("max_chars_per_line", "must be at least 1");
  }
  if (c.max_lines_per_cue < 1) {
    return ValidationResult::Failure("max_lines_per_cue", "must be at least 1");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidateAssembly(
    const AssemblyConfig& c) const {
  if (!SampleRateInRange(c.output_sample_rate)) {
    std::ostringstream detail;
    detail << c.output_sample_rate << " outside [" << kMinSampleRate << ", " << kMaxSampleRate << "]";
    return ValidationResult::Failure("output_sample_rate", detail.str());
  }
  if (c.target_loudness_dbfs >= 0.0) {
    return ValidationResult::Failure("target_loudness_dbfs", "must be below 0 dBFS");
  }
  if (c.max_gain_db < 0.0) {
    return ValidationResult::Failure("max_gain_db", "must be non-negative");
  }
  if (c.clip_fade_ms < 0) {
    return ValidationResult::Failure("clip_fade_ms", "must be non-negative");
  }
  if (c.original_audio_gain < 0.0 || c.original_audio_gain > 1.0) {
    return ValidationResult::Failure("original_audio_gain", "must be in [0, 1]");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidateMux(const MuxConfig& c) const {
  const BurnStyle& s = c.burn_style;
  // The font name is embedded in a comma-separated force_style list.
  if (s.font.empty() || s.font.find_first_of(",'=") != std::string::npos) {
    return ValidationResult::Failure("subtitle_font", "must be non-empty without , ' or =");
  }
  if (s.font_size <= 0) {
    return ValidationResult::Failure("subtitle_font_size", "must be positive");
  }
  std::string ass;
  if (!ToAssColour(s.primary_colour, &ass)) {
    return ValidationResult::Failure("subtitle_primary_colour",
                                     "unknown colour '" + s.primary_colour + "'");
  }
  if (!ToAssColour(s.outline_colour, &ass)) {
    return ValidationResult::Failure("subtitle_outline_colour",
                                     "unknown colour '" + s.outline_colour + "'");
  }
  if (s.outline < 0 || s.shadow < 0) {
    return ValidationResult::Failure("subtitle_outline", "outline and shadow must be >= 0");
  }
  if (s.alignment < 1 || s.alignment > 9) {
    return ValidationResult::Failure("subtitle_alignment", "must be in [1, 9]");
  }
  if (s.margin_v < 0 || s.margin_h < 0) {
    return ValidationResult::Failure("subtitle_margin_v", "margins must be >= 0");
  }
  return ValidationResult::Success();
}

ConfigValidator::ValidationResult ConfigValidator::ValidatePipeline(
    const PipelineConfig& c) const {
  if (c.target_language.empty()) {
    return ValidationResult::Failure("target_language", "must not be empty");
  }
  if (c.work_root.empty()) {
    return ValidationResult::Failure("work_root", "must not be empty");
  }
  if (c.worker_threads < 1) {
    return ValidationResult::Failure("worker_threads", "must be at least 1");
  }
  if (c.call_timeout_ms <= 0) {
    return ValidationResult::Failure("call_timeout_ms", "must be positive");
  }
  if (c.max_attempts < 1) {
    return ValidationResult::Failure("max_attempts", "must be at least 1");
  }
  if (c.initial_backoff_ms < 0 || c.max_backoff_ms < c.initial_backoff_ms) {
    std::ostringstream detail;
    detail << "backoff [" << c.initial_backoff_ms << ", " << c.max_backoff_ms << "] invalid";
    return ValidationResult::Failure("initial_backoff_ms", detail.str());
  }
  if (c.job_id.find('/') != std::string::npos) {
    return ValidationResult::Failure("job_id", "must not contain '/'");
  }
  return ValidationResult::Success();
}

}  // namespace redub::core
