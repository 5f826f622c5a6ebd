// Repository: Redub
// Component: Job Configuration Loader
// Purpose: Flat JSON config file → JobConfig.
// Copyright (c) 2026 Redub

#include "redub/core/JobConfig.hpp"

#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <vector>

#include "redub/core/FlatJson.hpp"

namespace redub::core {

namespace {

// One recognised config key. |apply| returns false when the value has the
// wrong JSON type.
struct ConfigKey {
  const char* name;
  std::function<bool(const std::string& json, JobConfig* c)> apply;
};

ConfigKey IntKey(const char* name, std::function<void(JobConfig*, int64_t)> set) {
  return {name, [name, set](const std::string& json, JobConfig* c) {
            int64_t v = 0;
            if (!JsonFindInt64(json, name, &v)) return false;
            set(c, v);
            return true;
          }};
}

ConfigKey DoubleKey(const char* name, std::function<void(JobConfig*, double)> set) {
  return {name, [name, set](const std::string& json, JobConfig* c) {
            double v = 0.0;
            if (!JsonFindDouble(json, name, &v)) return false;
            set(c, v);
            return true;
          }};
}

ConfigKey BoolKey(const char* name, std::function<void(JobConfig*, bool)> set) {
  return {name, [name, set](const std::string& json, JobConfig* c) {
            bool v = false;
            if (!JsonFindBool(json, name, &v)) return false;
            set(c, v);
            return true;
          }};
}

ConfigKey StringKey(const char* name, std::function<void(JobConfig*, const std::string&)> set) {
  return {name, [name, set](const std::string& json, JobConfig* c) {
            std::string v;
            if (!JsonFindString(json, name, &v)) return false;
            set(c, v);
            return true;
          }};
}

// String values restricted to a fixed set; an unknown value fails the key.
ConfigKey ChoiceKey(const char* name, std::function<bool(JobConfig*, const std::string&)> set) {
  return {name, [name, set](const std::string& json, JobConfig* c) {
            std::string v;
            if (!JsonFindString(json, name, &v)) return false;
            return set(c, v);
          }};
}

const std::vector<ConfigKey>& Keys() {
  static const std::vector<ConfigKey> keys = {
      // Segmenter
      IntKey("sample_rate", [](JobConfig* c, int64_t v) { c->segmenter.sample_rate = static_cast<int>(v); }),
      IntKey("chunk_duration_ms", [](JobConfig* c, int64_t v) { c->segmenter.chunk_duration_ms = v; }),
      IntKey("overlap_duration_ms", [](JobConfig* c, int64_t v) { c->segmenter.overlap_duration_ms = v; }),
      DoubleKey("silence_threshold_db", [](JobConfig* c, double v) { c->segmenter.silence_threshold_db = v; }),
      IntKey("min_silence_duration_ms", [](JobConfig* c, int64_t v) { c->segmenter.min_silence_duration_ms = v; }),
      IntKey("frame_duration_ms", [](JobConfig* c, int64_t v) { c->segmenter.frame_duration_ms = v; }),
      DoubleKey("vad_threshold", [](JobConfig* c, double v) { c->segmenter.vad_threshold = v; }),
      IntKey("min_speech_duration_ms", [](JobConfig* c, int64_t v) { c->segmenter.min_speech_duration_ms = v; }),
      IntKey("vad_min_silence_duration_ms", [](JobConfig* c, int64_t v) { c->segmenter.vad_min_silence_duration_ms = v; }),
      IntKey("speech_pad_ms", [](JobConfig* c, int64_t v) { c->segmenter.speech_pad_ms = v; }),
      DoubleKey("vad_margin_db", [](JobConfig* c, double v) { c->segmenter.vad_margin_db = v; }),
      DoubleKey("vad_slope_db", [](JobConfig* c, double v) { c->segmenter.vad_slope_db = v; }),

      // Speaker profiler
      DoubleKey("male_pitch_min_hz", [](JobConfig* c, double v) { c->profiler.male.min_hz = v; }),
      DoubleKey("male_pitch_max_hz", [](JobConfig* c, double v) { c->profiler.male.max_hz = v; }),
      DoubleKey("male_pitch_base_hz", [](JobConfig* c, double v) { c->profiler.male.base_hz = v; }),
      DoubleKey("female_pitch_min_hz", [](JobConfig* c, double v) { c->profiler.female.min_hz = v; }),
      DoubleKey("female_pitch_max_hz", [](JobConfig* c, double v) { c->profiler.female.max_hz = v; }),
      DoubleKey("female_pitch_base_hz", [](JobConfig* c, double v) { c->profiler.female.base_hz = v; }),
      DoubleKey("min_confidence", [](JobConfig* c, double v) { c->profiler.min_confidence = v; }),
      BoolKey("feature_pitch", [](JobConfig* c, bool v) { c->profiler.features.pitch = v; }),
      BoolKey("feature_energy", [](JobConfig* c, bool v) { c->profiler.features.energy = v; }),
      BoolKey("feature_spectral", [](JobConfig* c, bool v) { c->profiler.features.spectral = v; }),
      DoubleKey("pitch_weight", [](JobConfig* c, double v) { c->profiler.pitch_weight = v; }),
      DoubleKey("energy_weight", [](JobConfig* c, double v) { c->profiler.energy_weight = v; }),
      DoubleKey("spectral_weight", [](JobConfig* c, double v) { c->profiler.spectral_weight = v; }),
      IntKey("analysis_frame_ms", [](JobConfig* c, int64_t v) { c->profiler.analysis_frame_ms = v; }),
      DoubleKey("voicing_threshold", [](JobConfig* c, double v) { c->profiler.voicing_threshold = v; }),
      DoubleKey("spectral_split_hz", [](JobConfig* c, double v) { c->profiler.spectral_split_hz = v; }),
      DoubleKey("unknown_rate_headroom", [](JobConfig* c, double v) { c->profiler.unknown_rate_headroom = v; }),

      // Time aligner
      DoubleKey("min_rate", [](JobConfig* c, double v) { c->aligner.min_rate = v; }),
      DoubleKey("max_rate", [](JobConfig* c, double v) { c->aligner.max_rate = v; }),
      IntKey("drift_tolerance_ms", [](JobConfig* c, int64_t v) { c->aligner.drift_tolerance_ms = v; }),

      // Synthesis
      StringKey("male_voice", [](JobConfig* c, const std::string& v) { c->synthesis.male_voice = v; }),
      StringKey("female_voice", [](JobConfig* c, const std::string& v) { c->synthesis.female_voice = v; }),
      StringKey("default_voice", [](JobConfig* c, const std::string& v) { c->synthesis.default_voice = v; }),
      DoubleKey("default_rate", [](JobConfig* c, double v) { c->synthesis.default_rate = v; }),
      DoubleKey("min_volume", [](JobConfig* c, double v) { c->synthesis.min_volume = v; }),
      DoubleKey("max_volume", [](JobConfig* c, double v) { c->synthesis.max_volume = v; }),
      IntKey("synthesis_sample_rate", [](JobConfig* c, int64_t v) { c->synthesis.sample_rate = static_cast<int>(v); }),

      // Subtitles
      IntKey("max_chars_per_line", [](JobConfig* c, int64_t v) { c->subtitles.max_chars_per_line = static_cast<int>(v); }),
      IntKey("max_lines_per_cue", [](JobConfig* c, int64_t v) { c->subtitles.max_lines_per_cue = static_cast<int>(v); }),
      BoolKey("write_srt", [](JobConfig* c, bool v) { c->subtitles.write_srt = v; }),
      BoolKey("write_vtt", [](JobConfig* c, bool v) { c->subtitles.write_vtt = v; }),

      // Mux. The style preset comes before the individual style keys so
      // they can refine it.
      ChoiceKey("subtitle_mode", [](JobConfig* c, const std::string& v) { return ParseSubtitleMode(v, &c->mux.subtitle_mode); }),
      ChoiceKey("subtitle_style", [](JobConfig* c, const std::string& v) { return BurnStylePreset(v, &c->mux.burn_style); }),
      StringKey("subtitle_font", [](JobConfig* c, const std::string& v) { c->mux.burn_style.font = v; }),
      IntKey("subtitle_font_size", [](JobConfig* c, int64_t v) { c->mux.burn_style.font_size = static_cast<int>(v); }),
      StringKey("subtitle_primary_colour", [](JobConfig* c, const std::string& v) { c->mux.burn_style.primary_colour = v; }),
      StringKey("subtitle_outline_colour", [](JobConfig* c, const std::string& v) { c->mux.burn_style.outline_colour = v; }),
      IntKey("subtitle_outline", [](JobConfig* c, int64_t v) { c->mux.burn_style.outline = static_cast<int>(v); }),
      IntKey("subtitle_shadow", [](JobConfig* c, int64_t v) { c->mux.burn_style.shadow = static_cast<int>(v); }),
      BoolKey("subtitle_bold", [](JobConfig* c, bool v) { c->mux.burn_style.bold = v; }),
      BoolKey("subtitle_italic", [](JobConfig* c, bool v) { c->mux.burn_style.italic = v; }),
      IntKey("subtitle_alignment", [](JobConfig* c, int64_t v) { c->mux.burn_style.alignment = static_cast<int>(v); }),
      IntKey("subtitle_margin_v", [](JobConfig* c, int64_t v) { c->mux.burn_style.margin_v = static_cast<int>(v); }),
      IntKey("subtitle_margin_h", [](JobConfig* c, int64_t v) { c->mux.burn_style.margin_h = static_cast<int>(v); }),

      // Assembly
      IntKey("output_sample_rate", [](JobConfig* c, int64_t v) { c->assembly.output_sample_rate = static_cast<int>(v); }),
      DoubleKey("target_loudness_dbfs", [](JobConfig* c, double v) { c->assembly.target_loudness_dbfs = v; }),
      DoubleKey("max_gain_db", [](JobConfig* c, double v) { c->assembly.max_gain_db = v; }),
      IntKey("clip_fade_ms", [](JobConfig* c, int64_t v) { c->assembly.clip_fade_ms = v; }),
      BoolKey("keep_original_audio", [](JobConfig* c, bool v) { c->assembly.keep_original_audio = v; }),
      DoubleKey("original_audio_gain", [](JobConfig* c, double v) { c->assembly.original_audio_gain = v; }),

      // Pipeline
      StringKey("job_id", [](JobConfig* c, const std::string& v) { c->pipeline.job_id = v; }),
      StringKey("work_root", [](JobConfig* c, const std::string& v) { c->pipeline.work_root = v; }),
      StringKey("source_language", [](JobConfig* c, const std::string& v) { c->pipeline.source_language = v; }),
      StringKey("target_language", [](JobConfig* c, const std::string& v) { c->pipeline.target_language = v; }),
      StringKey("backend_address", [](JobConfig* c, const std::string& v) { c->pipeline.backend_address = v; }),
      IntKey("worker_threads", [](JobConfig* c, int64_t v) { c->pipeline.worker_threads = v < 0 ? 0 : static_cast<size_t>(v); }),
      IntKey("call_timeout_ms", [](JobConfig* c, int64_t v) { c->pipeline.call_timeout_ms = v; }),
      IntKey("max_attempts", [](JobConfig* c, int64_t v) { c->pipeline.max_attempts = static_cast<int>(v); }),
      IntKey("initial_backoff_ms", [](JobConfig* c, int64_t v) { c->pipeline.initial_backoff_ms = v; }),
      IntKey("max_backoff_ms", [](JobConfig* c, int64_t v) { c->pipeline.max_backoff_ms = v; }),
      BoolKey("strict", [](JobConfig* c, bool v) { c->pipeline.strict = v; }),
      BoolKey("resume", [](JobConfig* c, bool v) { c->pipeline.resume = v; }),
      StringKey("ffmpeg_path", [](JobConfig* c, const std::string& v) { c->pipeline.ffmpeg_path = v; }),
      StringKey("output_video_path", [](JobConfig* c, const std::string& v) { c->pipeline.output_video_path = v; }),
  };
  return keys;
}

}  // namespace

bool ApplyJobConfigJson(const std::string& json, JobConfig* config, std::string* error) {
  size_t first = json.find_first_not_of(" \t\r\n");
  size_t last = json.find_last_not_of(" \t\r\n");
  if (first == std::string::npos || json[first] != '{' || json[last] != '}') {
    if (error) *error = "config is not a JSON object";
    return false;
  }

  // Apply to a copy so a bad value leaves |config| unchanged.
  JobConfig staged = *config;
  for (const auto& key : Keys()) {
    if (!JsonHasKey(json, key.name)) continue;
    if (!key.apply(json, &staged)) {
      if (error) *error = std::string("config key '") + key.name + "' has the wrong type or value";
      return false;
    }
  }
  *config = staged;
  return true;
}

bool LoadJobConfigFile(const std::string& path, JobConfig* config, std::string* error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error) *error = "cannot open config file " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ApplyJobConfigJson(buffer.str(), config, error);
}

const char* SubtitleModeName(SubtitleMode m) {
  switch (m) {
    case SubtitleMode::kSoft: return "soft";
    case SubtitleMode::kBurn: return "burn";
    case SubtitleMode::kNone: return "none";
  }
  return "unknown";
}

bool ParseSubtitleMode(const std::string& name, SubtitleMode* out) {
  for (SubtitleMode m : {SubtitleMode::kSoft, SubtitleMode::kBurn, SubtitleMode::kNone}) {
    if (name == SubtitleModeName(m)) {
      *out = m;
      return true;
    }
  }
  return false;
}

bool BurnStylePreset(const std::string& name, BurnStyle* out) {
  BurnStyle style;
  if (name == "modern") {
    style.font_size = 28;
    style.outline = 1;
    style.margin_v = 20;
  } else if (name == "classic") {
    style.font_size = 26;
    style.outline = 1;
    style.margin_v = 20;
  } else if (name != "default") {
    return false;
  }
  *out = style;
  return true;
}

bool ToAssColour(const std::string& colour, std::string* out) {
  static const struct {
    const char* name;
    const char* ass;
  } kNamed[] = {
      {"white", "&H00FFFFFF"}, {"black", "&H00000000"}, {"yellow", "&H0000FFFF"},
      {"red", "&H000000FF"},   {"green", "&H0000FF00"}, {"blue", "&H00FF0000"},
      {"cyan", "&H00FFFF00"},  {"magenta", "&H00FF00FF"},
  };
  for (const auto& n : kNamed) {
    if (colour == n.name) {
      *out = n.ass;
      return true;
    }
  }
  // &H followed by 6 (BBGGRR) or 8 (AABBGGRR) hex digits.
  if (colour.size() != 8 && colour.size() != 10) return false;
  if (colour.compare(0, 2, "&H") != 0) return false;
  for (size_t i = 2; i < colour.size(); ++i) {
    if (!std::isxdigit(static_cast<unsigned char>(colour[i]))) return false;
  }
  std::string hex = colour.substr(2);
  if (hex.size() == 6) hex = "00" + hex;
  for (char& ch : hex) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  *out = "&H" + hex;
  return true;
}

std::string BuiltinVoice(const std::string& language, bool female) {
  if (language == "az") return female ? "az-AZ-BanuNeural" : "az-AZ-BabekNeural";
  if (language == "en") return female ? "en-US-JennyNeural" : "en-US-GuyNeural";
  if (language == "tr") return female ? "tr-TR-EmelNeural" : "tr-TR-AhmetNeural";
  return "";
}

}  // namespace redub::core
