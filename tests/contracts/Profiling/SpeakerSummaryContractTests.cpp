// Repository: Redub
// Component: Speaker Summary Contract Tests
// Purpose: Gender distribution, duration statistics, and the report block.
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "redub/profiling/SpeakerSummary.hpp"

using namespace redub;
using core::Gender;
using profiling::SpeakerSummary;
using profiling::ValueStats;

namespace {

core::SourceSegment Seg(int32_t id, int64_t start_ms, int64_t end_ms, bool speech = true) {
  core::SourceSegment s;
  s.id = id;
  s.start_ms = start_ms;
  s.end_ms = end_ms;
  s.is_speech = speech;
  return s;
}

core::SpeakerProfile Profile(int32_t id, Gender g, double pitch_hz, double energy_db,
                             const std::string& voice) {
  core::SpeakerProfile p;
  p.segment_id = id;
  p.gender = g;
  p.pitch_hz = pitch_hz;
  p.energy_db = energy_db;
  p.voice_id = voice;
  return p;
}

}  // namespace

TEST(ValueStatsContract, PopulationStatistics) {
  const ValueStats s = ValueStats::Of({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
  EXPECT_EQ(s.count, 8u);
  EXPECT_DOUBLE_EQ(s.mean, 5.0);
  EXPECT_DOUBLE_EQ(s.stddev, 2.0);
  EXPECT_DOUBLE_EQ(s.min, 2.0);
  EXPECT_DOUBLE_EQ(s.max, 9.0);

  const ValueStats empty = ValueStats::Of({});
  EXPECT_EQ(empty.count, 0u);
  EXPECT_DOUBLE_EQ(empty.mean, 0.0);
}

TEST(SpeakerSummaryContract, CountsDurationsAndPercentagesPerGender) {
  const std::vector<core::SourceSegment> segments = {
      Seg(0, 0, 4000), Seg(1, 4000, 5000, false), Seg(2, 5000, 7000),
      Seg(3, 7000, 13000), Seg(4, 13000, 15000)};
  std::map<int32_t, core::SpeakerProfile> profiles;
  profiles[0] = Profile(0, Gender::kMale, 110.0, -20.0, "az-AZ-BabekNeural");
  profiles[2] = Profile(2, Gender::kFemale, 210.0, -24.0, "az-AZ-BanuNeural");
  profiles[3] = Profile(3, Gender::kMale, 130.0, -22.0, "az-AZ-BabekNeural");
  profiles[4] = Profile(4, Gender::kUnknown, 0.0, -30.0, "az-AZ-BabekNeural");

  const SpeakerSummary s = profiling::SummarizeSpeakers(segments, profiles);
  EXPECT_EQ(s.speech_segments, 4u);
  EXPECT_EQ(s.speech_ms, 14000);
  EXPECT_EQ(s.male.count, 2u);
  EXPECT_EQ(s.male.duration_ms, 10000);
  EXPECT_DOUBLE_EQ(s.male.percent, 50.0);
  EXPECT_EQ(s.female.count, 1u);
  EXPECT_DOUBLE_EQ(s.female.percent, 25.0);
  EXPECT_EQ(s.unknown.count, 1u);
  EXPECT_EQ(s.unknown.duration_ms, 2000);

  EXPECT_DOUBLE_EQ(s.segment_duration_ms.mean, 3500.0);
  EXPECT_DOUBLE_EQ(s.segment_duration_ms.min, 2000.0);
  EXPECT_DOUBLE_EQ(s.segment_duration_ms.max, 6000.0);
  // Unvoiced segment has no pitch.
  EXPECT_EQ(s.pitch_hz.count, 3u);
  EXPECT_DOUBLE_EQ(s.pitch_hz.min, 110.0);
  EXPECT_EQ(s.energy_db.count, 4u);
  EXPECT_DOUBLE_EQ(s.energy_db.max, -20.0);
  ASSERT_EQ(s.voices.size(), 2u);
  EXPECT_EQ(s.voices.at("az-AZ-BabekNeural"), 3u);
}

TEST(SpeakerSummaryContract, NoSpeechIsAllZero) {
  const SpeakerSummary s =
      profiling::SummarizeSpeakers({Seg(0, 0, 5000, false)}, {});
  EXPECT_EQ(s.speech_segments, 0u);
  EXPECT_DOUBLE_EQ(s.male.percent, 0.0);
  EXPECT_EQ(s.segment_duration_ms.count, 0u);
}

TEST(SpeakerSummaryContract, JsonBlockNamesEveryGender) {
  std::map<int32_t, core::SpeakerProfile> profiles;
  profiles[0] = Profile(0, Gender::kFemale, 220.0, -18.0, "v1");
  const std::string json = profiling::SummarizeSpeakers({Seg(0, 0, 1000)}, profiles).ToJson();
  EXPECT_NE(json.find("\"genders\":{\"male\":{\"count\":0"), std::string::npos) << json;
  EXPECT_NE(json.find("\"female\":{\"count\":1,\"duration_ms\":1000"), std::string::npos);
  EXPECT_NE(json.find("\"unknown\":{"), std::string::npos);
  EXPECT_NE(json.find("\"pitch_hz\":{\"count\":1"), std::string::npos);
  EXPECT_NE(json.find("\"voices\":{\"v1\":1}"), std::string::npos);
}
