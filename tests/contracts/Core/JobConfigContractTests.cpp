// Repository: Redub
// Component: Job Configuration Contract Tests
// Purpose: Defaults, flat JSON loading, and fail-fast pre-flight validation.
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "TempDir.h"
#include "redub/core/ConfigValidator.hpp"
#include "redub/core/Errors.hpp"
#include "redub/core/JobConfig.hpp"

using namespace redub;
using core::ConfigValidator;
using core::JobConfig;

namespace {

ConfigValidator::ValidationResult Check(const JobConfig& c) {
  return ConfigValidator().Validate(c);
}

}  // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(JobConfigContract, DefaultsMatchReferencePipeline) {
  JobConfig c;
  EXPECT_EQ(c.segmenter.chunk_duration_ms, 30000);
  EXPECT_EQ(c.segmenter.overlap_duration_ms, 1000);
  EXPECT_DOUBLE_EQ(c.segmenter.silence_threshold_db, -35.0);
  EXPECT_EQ(c.segmenter.min_silence_duration_ms, 500);
  EXPECT_DOUBLE_EQ(c.profiler.male.min_hz, 50.0);
  EXPECT_DOUBLE_EQ(c.profiler.male.max_hz, 180.0);
  EXPECT_DOUBLE_EQ(c.profiler.female.min_hz, 150.0);
  EXPECT_DOUBLE_EQ(c.profiler.female.max_hz, 300.0);
  EXPECT_DOUBLE_EQ(c.profiler.min_confidence, 0.6);
  EXPECT_DOUBLE_EQ(c.aligner.min_rate, 0.8);
  EXPECT_DOUBLE_EQ(c.aligner.max_rate, 1.5);
  EXPECT_DOUBLE_EQ(c.synthesis.min_volume, 0.5);
  EXPECT_DOUBLE_EQ(c.synthesis.max_volume, 2.0);
  EXPECT_EQ(c.assembly.output_sample_rate, 16000);
  EXPECT_TRUE(Check(c).valid);
}

TEST(JobConfigContract, MinPauseIsTwoFifthsOfMinSilence) {
  JobConfig c;
  EXPECT_EQ(c.MinPauseMs(), 200);
  c.segmenter.min_silence_duration_ms = 1000;
  EXPECT_EQ(c.MinPauseMs(), 400);
}

TEST(JobConfigContract, BuiltinVoicesPerLanguage) {
  EXPECT_EQ(core::BuiltinVoice("az", false), "az-AZ-BabekNeural");
  EXPECT_EQ(core::BuiltinVoice("az", true), "az-AZ-BanuNeural");
  EXPECT_EQ(core::BuiltinVoice("tr", true), "tr-TR-EmelNeural");
  EXPECT_EQ(core::BuiltinVoice("xx", true), "");
}

// =============================================================================
// JSON loading
// =============================================================================

TEST(JobConfigContract, JsonOverridesOnlyPresentKeys) {
  JobConfig c;
  std::string error;
  ASSERT_TRUE(core::ApplyJobConfigJson(
      R"({"chunk_duration_ms": 20000, "max_rate": 1.25, "strict": true,
          "target_language": "tr", "male_voice": "custom-male"})",
      &c, &error))
      << error;
  EXPECT_EQ(c.segmenter.chunk_duration_ms, 20000);
  EXPECT_DOUBLE_EQ(c.aligner.max_rate, 1.25);
  EXPECT_TRUE(c.pipeline.strict);
  EXPECT_EQ(c.pipeline.target_language, "tr");
  EXPECT_EQ(c.synthesis.male_voice, "custom-male");
  // Untouched
  EXPECT_EQ(c.segmenter.overlap_duration_ms, 1000);
  EXPECT_DOUBLE_EQ(c.aligner.min_rate, 0.8);
}

TEST(JobConfigContract, IntegerLiteralAcceptedForDoubleKey) {
  JobConfig c;
  std::string error;
  ASSERT_TRUE(core::ApplyJobConfigJson(R"({"max_rate": 2})", &c, &error)) << error;
  EXPECT_DOUBLE_EQ(c.aligner.max_rate, 2.0);
}

TEST(JobConfigContract, WrongTypeRejectedAndConfigUnchanged) {
  JobConfig c;
  std::string error;
  EXPECT_FALSE(core::ApplyJobConfigJson(
      R"({"chunk_duration_ms": 1000, "strict": "yes"})", &c, &error));
  EXPECT_NE(error.find("strict"), std::string::npos);
  EXPECT_EQ(c.segmenter.chunk_duration_ms, 30000);
  EXPECT_FALSE(c.pipeline.strict);
}

TEST(JobConfigContract, NonObjectRejected) {
  JobConfig c;
  std::string error;
  EXPECT_FALSE(core::ApplyJobConfigJson("[1, 2]", &c, &error));
  EXPECT_FALSE(error.empty());
}

TEST(JobConfigContract, LoadsFromFile) {
  tests::fixtures::TempDir dir;
  const std::string path = dir.Join("job.json");
  {
    std::ofstream f(path);
    f << "{\n  \"worker_threads\": 2,\n  \"drift_tolerance_ms\": 3000\n}\n";
  }
  JobConfig c;
  std::string error;
  ASSERT_TRUE(core::LoadJobConfigFile(path, &c, &error)) << error;
  EXPECT_EQ(c.pipeline.worker_threads, 2u);
  EXPECT_EQ(c.aligner.drift_tolerance_ms, 3000);

  EXPECT_FALSE(core::LoadJobConfigFile(dir.Join("missing.json"), &c, &error));
}

TEST(JobConfigContract, SubtitleModeAndStyleKeys) {
  JobConfig c;
  EXPECT_EQ(c.mux.subtitle_mode, core::SubtitleMode::kSoft);
  std::string error;
  ASSERT_TRUE(core::ApplyJobConfigJson(
      R"({"subtitle_mode": "burn", "subtitle_style": "classic",
          "subtitle_font_size": 30, "subtitle_primary_colour": "yellow"})",
      &c, &error))
      << error;
  EXPECT_EQ(c.mux.subtitle_mode, core::SubtitleMode::kBurn);
  // Individual keys refine the preset.
  EXPECT_EQ(c.mux.burn_style.font_size, 30);
  EXPECT_EQ(c.mux.burn_style.outline, 1);
  EXPECT_EQ(c.mux.burn_style.margin_v, 20);
  EXPECT_EQ(c.mux.burn_style.primary_colour, "yellow");

  EXPECT_FALSE(core::ApplyJobConfigJson(R"({"subtitle_mode": "hard"})", &c, &error));
  EXPECT_NE(error.find("subtitle_mode"), std::string::npos);
  EXPECT_FALSE(core::ApplyJobConfigJson(R"({"subtitle_style": "fancy"})", &c, &error));
  EXPECT_EQ(c.mux.subtitle_mode, core::SubtitleMode::kBurn);
}

TEST(JobConfigContract, BurnStylePresets) {
  core::BurnStyle s;
  ASSERT_TRUE(core::BurnStylePreset("default", &s));
  EXPECT_EQ(s.font, "Arial");
  EXPECT_EQ(s.font_size, 24);
  EXPECT_EQ(s.outline, 2);
  EXPECT_EQ(s.margin_v, 10);
  ASSERT_TRUE(core::BurnStylePreset("modern", &s));
  EXPECT_EQ(s.font_size, 28);
  EXPECT_EQ(s.outline, 1);
  EXPECT_EQ(s.margin_v, 20);
  EXPECT_EQ(s.margin_h, 10);
  ASSERT_TRUE(core::BurnStylePreset("classic", &s));
  EXPECT_EQ(s.font_size, 26);
  EXPECT_FALSE(core::BurnStylePreset("neon", &s));
}

TEST(JobConfigContract, AssColours) {
  std::string ass;
  ASSERT_TRUE(core::ToAssColour("white", &ass));
  EXPECT_EQ(ass, "&H00FFFFFF");
  ASSERT_TRUE(core::ToAssColour("&H80ff00", &ass));
  EXPECT_EQ(ass, "&H0080FF00");
  ASSERT_TRUE(core::ToAssColour("&H4000FFFF", &ass));
  EXPECT_EQ(ass, "&H4000FFFF");
  EXPECT_FALSE(core::ToAssColour("orange", &ass));
  EXPECT_FALSE(core::ToAssColour("&HFFF", &ass));
  EXPECT_FALSE(core::ToAssColour("&HGG0000", &ass));
}

// =============================================================================
// Validation: each invalid field is reported by name
// =============================================================================

TEST(ConfigValidatorContract, OverlapNotShorterThanChunk) {
  JobConfig c;
  c.segmenter.overlap_duration_ms = c.segmenter.chunk_duration_ms;
  auto r = Check(c);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.field, "overlap_duration_ms");
  EXPECT_EQ(r.error, core::DubError::kConfigInvalid);
}

TEST(ConfigValidatorContract, ChunkOffFrameGrid) {
  JobConfig c;
  c.segmenter.chunk_duration_ms = 30010;
  EXPECT_EQ(Check(c).field, "chunk_duration_ms");
}

TEST(ConfigValidatorContract, SilenceThresholdMustBeNegative) {
  JobConfig c;
  c.segmenter.silence_threshold_db = 3.0;
  EXPECT_EQ(Check(c).field, "silence_threshold_db");
}

TEST(ConfigValidatorContract, VadThresholdInOpenUnitInterval) {
  JobConfig c;
  c.segmenter.vad_threshold = 1.0;
  EXPECT_EQ(Check(c).field, "vad_threshold");
}

TEST(ConfigValidatorContract, EmptyPitchRange) {
  JobConfig c;
  c.profiler.male.max_hz = 40.0;
  EXPECT_EQ(Check(c).field, "male_pitch_min_hz");
}

TEST(ConfigValidatorContract, MinConfidenceInUnitInterval) {
  JobConfig c;
  c.profiler.min_confidence = 1.5;
  EXPECT_EQ(Check(c).field, "min_confidence");
}

TEST(ConfigValidatorContract, GenderNeedsPitchOrSpectral) {
  JobConfig c;
  c.profiler.features.pitch = false;
  c.profiler.features.spectral = false;
  EXPECT_EQ(Check(c).field, "feature_pitch");
}

TEST(ConfigValidatorContract, RateBoundsBracketUnity) {
  JobConfig c;
  c.aligner.min_rate = 1.2;
  EXPECT_EQ(Check(c).field, "min_rate");

  c = JobConfig();
  c.aligner.max_rate = 0.9;
  EXPECT_EQ(Check(c).field, "max_rate");
}

TEST(ConfigValidatorContract, VolumeBounds) {
  JobConfig c;
  c.synthesis.max_volume = 0.1;
  EXPECT_EQ(Check(c).field, "min_volume");
}

TEST(ConfigValidatorContract, OutputSampleRateRange) {
  JobConfig c;
  c.assembly.output_sample_rate = 1000;
  EXPECT_EQ(Check(c).field, "output_sample_rate");
}

TEST(ConfigValidatorContract, NegativeDriftTolerance) {
  JobConfig c;
  c.aligner.drift_tolerance_ms = -1;
  EXPECT_EQ(Check(c).field, "drift_tolerance_ms");
}

TEST(ConfigValidatorContract, JobIdMustNotEscapeWorkRoot) {
  JobConfig c;
  c.pipeline.job_id = "../other";
  EXPECT_EQ(Check(c).field, "job_id");
}

TEST(ConfigValidatorContract, BurnStyleFields) {
  JobConfig c;
  c.mux.burn_style.font = "Comic, Sans";
  EXPECT_EQ(Check(c).field, "subtitle_font");
  c = JobConfig();
  c.mux.burn_style.outline_colour = "beige";
  EXPECT_EQ(Check(c).field, "subtitle_outline_colour");
  c = JobConfig();
  c.mux.burn_style.alignment = 10;
  EXPECT_EQ(Check(c).field, "subtitle_alignment");
  c = JobConfig();
  c.mux.burn_style.font_size = 0;
  EXPECT_EQ(Check(c).field, "subtitle_font_size");
}

TEST(ConfigValidatorContract, FirstFailureInPipelineOrderWins) {
  JobConfig c;
  c.segmenter.vad_threshold = 0.0;  // Segmenter section
  c.aligner.max_rate = 0.5;         // Aligner section
  EXPECT_EQ(Check(c).field, "vad_threshold");
}

TEST(ConfigValidatorContract, ValidateOrThrowRaisesConfigError) {
  JobConfig c;
  c.pipeline.max_attempts = 0;
  try {
    ConfigValidator().ValidateOrThrow(c);
    FAIL() << "expected ConfigError";
  } catch (const core::ConfigError& e) {
    EXPECT_EQ(e.error(), core::DubError::kConfigInvalid);
    EXPECT_NE(std::string(e.what()).find("max_attempts"), std::string::npos);
  }
}
