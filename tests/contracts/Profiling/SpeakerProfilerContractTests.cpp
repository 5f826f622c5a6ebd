// Repository: Redub
// Component: Speaker Profiler Contract Tests
// Purpose: Gender classification, confidence gating, voice selection, and
//          the rate bounds handed to the aligner.
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include "SyntheticAudio.h"
#include "redub/core/JobConfig.hpp"
#include "redub/profiling/SpeakerProfiler.hpp"

using namespace redub;
using core::Gender;
using profiling::SpeakerProfiler;
using tests::fixtures::Tone;

namespace {

core::SourceSegment SpeechSegment(int32_t id, int64_t duration_ms) {
  core::SourceSegment s;
  s.id = id;
  s.start_ms = 0;
  s.end_ms = duration_ms;
  s.is_speech = true;
  s.sample_end = media::MsToSamples(duration_ms, 16000);
  return s;
}

}  // namespace

// =============================================================================
// Pitch classification
// =============================================================================

TEST(SpeakerProfilerContract, NearestBaseWinsWithInverseDistanceConfidence) {
  SpeakerProfiler profiler{core::JobConfig()};
  double conf = 0.0;
  EXPECT_EQ(profiler.ClassifyPitch(95.0, &conf), Gender::kMale);
  EXPECT_NEAR(conf, 115.0 / 140.0, 1e-9);
  EXPECT_EQ(profiler.ClassifyPitch(230.0, &conf), Gender::kFemale);
  EXPECT_NEAR(conf, 110.0 / 130.0, 1e-9);
}

TEST(SpeakerProfilerContract, PitchOutsideAllRangesHalvesConfidence) {
  SpeakerProfiler profiler{core::JobConfig()};
  double conf = 0.0;
  EXPECT_EQ(profiler.ClassifyPitch(400.0, &conf), Gender::kFemale);
  EXPECT_NEAR(conf, 0.5 * 280.0 / 470.0, 1e-9);
}

TEST(SpeakerProfilerContract, VoiceTypeBands) {
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kMale, 100.0), "bass");
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kMale, 130.0), "baritone");
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kMale, 160.0), "tenor");
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kFemale, 180.0), "contralto");
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kFemale, 220.0), "mezzo-soprano");
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kFemale, 260.0), "soprano");
  EXPECT_EQ(SpeakerProfiler::VoiceType(Gender::kUnknown, 260.0), "unknown");
}

// =============================================================================
// Segment profiles
// =============================================================================

TEST(SpeakerProfilerContract, LowToneProfilesAsMale) {
  SpeakerProfiler profiler{core::JobConfig()};
  auto profile = profiler.Profile(SpeechSegment(3, 2000), Tone(2000, 95.0));
  EXPECT_EQ(profile.segment_id, 3);
  EXPECT_EQ(profile.gender, Gender::kMale);
  EXPECT_NEAR(profile.pitch_hz, 95.0, 3.0);
  EXPECT_GE(profile.confidence, 0.6);
  EXPECT_EQ(profile.voice_type, "bass");
  EXPECT_EQ(profile.voice_id, "az-AZ-BabekNeural");
  EXPECT_GE(profile.pitch_shift_hz, -11);
  EXPECT_LE(profile.pitch_shift_hz, -9);
  EXPECT_DOUBLE_EQ(profile.min_rate, 0.8);
  EXPECT_DOUBLE_EQ(profile.max_rate, 1.5);
}

TEST(SpeakerProfilerContract, HighToneProfilesAsFemale) {
  SpeakerProfiler profiler{core::JobConfig()};
  auto profile = profiler.Profile(SpeechSegment(0, 2000), Tone(2000, 210.0));
  EXPECT_EQ(profile.gender, Gender::kFemale);
  EXPECT_GE(profile.confidence, 0.6);
  EXPECT_EQ(profile.voice_id, "az-AZ-BanuNeural");
  EXPECT_EQ(profile.voice_type, "mezzo-soprano");
}

TEST(SpeakerProfilerContract, VolumeTracksSourceLevelWithinBounds) {
  SpeakerProfiler profiler{core::JobConfig()};
  // Fixture tone sits about 3 dB above the -20 dBFS reference.
  auto loud = profiler.Profile(SpeechSegment(0, 1000), Tone(1000, 120.0));
  EXPECT_GT(loud.volume, 1.2);
  EXPECT_LT(loud.volume, 1.6);

  auto quiet = profiler.Profile(SpeechSegment(1, 1000), Tone(1000, 120.0, 16000, 0.01));
  EXPECT_DOUBLE_EQ(quiet.volume, 0.5);
}

TEST(SpeakerProfilerContract, BelowMinConfidenceIsUnknownWithNarrowedRates) {
  core::JobConfig config;
  config.profiler.min_confidence = 0.99;
  SpeakerProfiler profiler(config);
  auto profile = profiler.Profile(SpeechSegment(0, 2000), Tone(2000, 95.0));
  EXPECT_EQ(profile.gender, Gender::kUnknown);
  EXPECT_EQ(profile.voice_type, "unknown");
  EXPECT_EQ(profile.pitch_shift_hz, 0);
  EXPECT_EQ(profile.voice_id, "az-AZ-BabekNeural");
  EXPECT_DOUBLE_EQ(profile.min_rate, 0.9);
  EXPECT_DOUBLE_EQ(profile.max_rate, 1.25);
}

TEST(SpeakerProfilerContract, SilentSliceIsUnknownAtMinimumVolume) {
  SpeakerProfiler profiler{core::JobConfig()};
  auto profile = profiler.Profile(SpeechSegment(0, 1000), media::MakeSilence(1000, 16000));
  EXPECT_EQ(profile.gender, Gender::kUnknown);
  EXPECT_DOUBLE_EQ(profile.pitch_hz, 0.0);
  EXPECT_DOUBLE_EQ(profile.confidence, 0.0);
  EXPECT_DOUBLE_EQ(profile.volume, 0.5);
}

TEST(SpeakerProfilerContract, SpectralOnlyProfilerStillClassifies) {
  core::JobConfig config;
  config.profiler.features.pitch = false;
  SpeakerProfiler profiler(config);
  auto profile = profiler.Profile(SpeechSegment(0, 2000), Tone(2000, 95.0));
  EXPECT_EQ(profile.gender, Gender::kMale);
  EXPECT_DOUBLE_EQ(profile.pitch_hz, 0.0);
  EXPECT_GT(profile.spectral_centroid_hz, 0.0);
}

TEST(SpeakerProfilerContract, ConfiguredVoicesOverrideBuiltins) {
  core::JobConfig config;
  config.synthesis.male_voice = "studio-male";
  config.synthesis.default_voice = "studio-neutral";
  SpeakerProfiler profiler(config);
  EXPECT_EQ(profiler.SelectVoice(Gender::kMale), "studio-male");
  EXPECT_EQ(profiler.SelectVoice(Gender::kFemale), "az-AZ-BanuNeural");
  EXPECT_EQ(profiler.SelectVoice(Gender::kUnknown), "studio-neutral");
}

TEST(SpeakerProfilerContract, TargetLanguageSelectsBuiltinVoices) {
  core::JobConfig config;
  config.pipeline.target_language = "tr";
  SpeakerProfiler profiler(config);
  EXPECT_EQ(profiler.SelectVoice(Gender::kMale), "tr-TR-AhmetNeural");
}
