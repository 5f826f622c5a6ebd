// Repository: Redub
// Component: Job Configuration
// Purpose: One immutable configuration per dubbing job, grouped by the
//          component that consumes it. Defaults match the reference pipeline.
// Copyright (c) 2026 Redub

#ifndef REDUB_CORE_JOB_CONFIG_HPP_
#define REDUB_CORE_JOB_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace redub::core {

struct SegmenterConfig {
  int sample_rate = 16000;
  int64_t chunk_duration_ms = 30000;
  int64_t overlap_duration_ms = 1000;
  double silence_threshold_db = -35.0;
  int64_t min_silence_duration_ms = 500;

  // Voice activity detection.
  int64_t frame_duration_ms = 20;
  double vad_threshold = 0.5;
  int64_t min_speech_duration_ms = 250;
  int64_t vad_min_silence_duration_ms = 100;
  int64_t speech_pad_ms = 30;
  // Frame level → speech probability: logistic centred vad_margin_db above
  // silence_threshold_db with a vad_slope_db scale.
  double vad_margin_db = 6.0;
  double vad_slope_db = 3.0;
};

struct PitchRange {
  double min_hz = 0.0;
  double max_hz = 0.0;
  double base_hz = 0.0;  // Range centre used for classification

  bool Contains(double hz) const { return hz >= min_hz && hz <= max_hz; }
};

// Capability flags for the Speaker Profiler. Read once when the profiler is
// constructed.
struct FeatureSet {
  bool pitch = true;
  bool energy = true;
  bool spectral = true;
};

struct ProfilerConfig {
  PitchRange male{50.0, 180.0, 120.0};
  PitchRange female{150.0, 300.0, 210.0};
  double min_confidence = 0.6;
  FeatureSet features;
  double pitch_weight = 0.6;
  double energy_weight = 0.2;
  double spectral_weight = 0.2;
  int64_t analysis_frame_ms = 40;
  double voicing_threshold = 0.3;
  // Centroids below this vote male, above vote female.
  double spectral_split_hz = 1500.0;
  // Fraction of the global rate range granted to unknown-gender segments.
  double unknown_rate_headroom = 0.5;
};

struct AlignerConfig {
  double min_rate = 0.8;
  double max_rate = 1.5;
  int64_t drift_tolerance_ms = 5000;
};

struct SynthesisConfig {
  // Empty means "use the built-in voice for the target language".
  std::string male_voice;
  std::string female_voice;
  std::string default_voice;
  double default_rate = 1.0;
  double min_volume = 0.5;
  double max_volume = 2.0;
  int sample_rate = 16000;  // Requested from the synthesis backend
};

struct SubtitleConfig {
  int max_chars_per_line = 42;
  int max_lines_per_cue = 2;
  bool write_srt = true;
  bool write_vtt = true;
};

struct AssemblyConfig {
  int output_sample_rate = 16000;
  double target_loudness_dbfs = -20.0;
  double max_gain_db = 20.0;
  int64_t clip_fade_ms = 10;
  bool keep_original_audio = false;
  double original_audio_gain = 0.1;
};

// How captions reach the output video.
enum class SubtitleMode {
  kSoft,  // Selectable mov_text stream
  kBurn,  // Rendered into the picture by ffmpeg's subtitles filter
  kNone,
};

const char* SubtitleModeName(SubtitleMode m);
bool ParseSubtitleMode(const std::string& name, SubtitleMode* out);

// Look of burned captions (libass style fields). Colours are named
// ("white", "yellow", ...) or ASS "&HAABBGGRR" literals.
struct BurnStyle {
  std::string font = "Arial";
  int font_size = 24;
  std::string primary_colour = "white";
  std::string outline_colour = "black";
  int outline = 2;
  int shadow = 0;
  bool bold = false;
  bool italic = false;
  int alignment = 2;  // Numpad layout, 2 = bottom centre
  int margin_v = 10;
  int margin_h = 10;
};

// "default", "modern" or "classic". Returns false for other names.
bool BurnStylePreset(const std::string& name, BurnStyle* out);

// Named or "&H..." colour → ASS "&HAABBGGRR". Returns false if unrecognised.
bool ToAssColour(const std::string& colour, std::string* out);

struct MuxConfig {
  SubtitleMode subtitle_mode = SubtitleMode::kSoft;
  BurnStyle burn_style;
};

struct PipelineConfig {
  std::string job_id;  // Empty: derived from UTC time at job start
  std::string work_root = "redub_work";
  std::string source_language = "en";
  std::string target_language = "az";
  std::string backend_address = "localhost:50061";
  size_t worker_threads = 4;
  int64_t call_timeout_ms = 60000;
  int max_attempts = 3;
  int64_t initial_backoff_ms = 1000;
  int64_t max_backoff_ms = 8000;
  bool strict = false;
  bool resume = false;
  std::string ffmpeg_path = "ffmpeg";
  std::string output_video_path;  // Empty: no mux step
};

struct JobConfig {
  SegmenterConfig segmenter;
  ProfilerConfig profiler;
  AlignerConfig aligner;
  SynthesisConfig synthesis;
  SubtitleConfig subtitles;
  AssemblyConfig assembly;
  MuxConfig mux;
  PipelineConfig pipeline;

  // Natural pause kept before the next speech segment when a clip borrows
  // trailing silence. Tied to the VAD split threshold: 2/5 of
  // min_silence_duration_ms (200 ms at the 500 ms default).
  int64_t MinPauseMs() const { return segmenter.min_silence_duration_ms * 2 / 5; }
};

// Loads a flat JSON object of "key": value pairs into |config|. Keys not
// present keep their current value; unknown keys are ignored. Returns false
// with |error| set if the file cannot be read or a value has the wrong type.
bool LoadJobConfigFile(const std::string& path, JobConfig* config, std::string* error);

// Same as LoadJobConfigFile but from an in-memory JSON document.
bool ApplyJobConfigJson(const std::string& json, JobConfig* config, std::string* error);

// Built-in synthesis voices per target language ("az", "en", "tr").
// Returns an empty string for unknown languages.
std::string BuiltinVoice(const std::string& language, bool female);

}  // namespace redub::core

#endif  // REDUB_CORE_JOB_CONFIG_HPP_
