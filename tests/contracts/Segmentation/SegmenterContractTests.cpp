// Repository: Redub
// Component: Segmenter Contract Tests
// Purpose: Full-coverage timeline, silence-run splitting, and overlapping
//          window reconciliation.
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include <vector>

#include "SyntheticAudio.h"
#include "redub/core/Errors.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/segmentation/Segmenter.hpp"

using namespace redub;
using core::SourceSegment;
using segmentation::Segmenter;
using tests::fixtures::Timeline;

namespace {

std::vector<SourceSegment> SpeechOnly(const std::vector<SourceSegment>& all) {
  std::vector<SourceSegment> out;
  for (const auto& s : all) {
    if (s.is_speech) out.push_back(s);
  }
  return out;
}

void ExpectContiguousCover(const std::vector<SourceSegment>& segments,
                           const media::PcmBuffer& audio) {
  ASSERT_FALSE(segments.empty());
  EXPECT_EQ(segments.front().start_ms, 0);
  EXPECT_EQ(segments.back().end_ms, audio.DurationMs());
  EXPECT_EQ(segments.back().sample_end, static_cast<int64_t>(audio.size()));
  for (size_t i = 0; i < segments.size(); ++i) {
    EXPECT_EQ(segments[i].id, static_cast<int32_t>(i));
    EXPECT_LT(segments[i].start_ms, segments[i].end_ms);
    if (i > 0) {
      EXPECT_EQ(segments[i].start_ms, segments[i - 1].end_ms);
      EXPECT_EQ(segments[i].sample_begin, segments[i - 1].sample_end);
      // Adjacent segments always differ in kind.
      EXPECT_NE(segments[i].is_speech, segments[i - 1].is_speech);
    }
  }
}

}  // namespace

// =============================================================================
// Coverage
// =============================================================================

TEST(SegmenterContract, AlternatingSpeechAndSilenceCoverInput) {
  auto audio = Timeline(10000, {{1000, 3000, 120.0}, {5000, 7000, 200.0}});
  auto segments = Segmenter(core::SegmenterConfig()).Segment(audio);
  ExpectContiguousCover(segments, audio);
  ASSERT_EQ(segments.size(), 5u);
  EXPECT_FALSE(segments[0].is_speech);
  EXPECT_TRUE(segments[1].is_speech);
  EXPECT_EQ(segments[1].start_ms, 1000);
  EXPECT_EQ(segments[1].end_ms, 3000);
  EXPECT_EQ(segments[3].start_ms, 5000);
  EXPECT_EQ(segments[3].end_ms, 7000);
  EXPECT_EQ(segments[1].sample_begin, 16000);
}

TEST(SegmenterContract, SpeechAtTimelineEdges) {
  auto audio = Timeline(4000, {{0, 1500, 120.0}, {2500, 4000, 120.0}});
  auto segments = Segmenter(core::SegmenterConfig()).Segment(audio);
  ExpectContiguousCover(segments, audio);
  ASSERT_EQ(segments.size(), 3u);
  EXPECT_TRUE(segments.front().is_speech);
  EXPECT_TRUE(segments.back().is_speech);
}

TEST(SegmenterContract, AllSilenceIsOneSilentSegment) {
  auto audio = media::MakeSilence(3000, 16000);
  auto segments = Segmenter(core::SegmenterConfig()).Segment(audio);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_FALSE(segments[0].is_speech);
  EXPECT_EQ(segments[0].end_ms, 3000);
}

TEST(SegmenterContract, EmptyInputYieldsNoSegments) {
  media::PcmBuffer empty;
  empty.sample_rate = 16000;
  EXPECT_TRUE(Segmenter(core::SegmenterConfig()).Segment(empty).empty());
}

TEST(SegmenterContract, SampleRateMismatchIsConfigError) {
  auto audio = tests::fixtures::Tone(1000, 120.0, 22050);
  try {
    Segmenter(core::SegmenterConfig()).Segment(audio);
    FAIL() << "expected ConfigError";
  } catch (const core::ConfigError& e) {
    EXPECT_EQ(e.error(), core::DubError::kSampleRateMismatch);
  }
}

// =============================================================================
// Silence runs
// =============================================================================

TEST(SegmenterContract, PauseShorterThanMinSilenceDoesNotSplit) {
  auto audio = Timeline(5000, {{1000, 2000, 120.0}, {2300, 3000, 120.0}});
  auto speech = SpeechOnly(Segmenter(core::SegmenterConfig()).Segment(audio));
  ASSERT_EQ(speech.size(), 1u);
  EXPECT_EQ(speech[0].start_ms, 1000);
  EXPECT_EQ(speech[0].end_ms, 3000);
}

TEST(SegmenterContract, PauseAtMinSilenceSplits) {
  auto audio = Timeline(5000, {{1000, 2000, 120.0}, {2500, 3000, 120.0}});
  auto speech = SpeechOnly(Segmenter(core::SegmenterConfig()).Segment(audio));
  ASSERT_EQ(speech.size(), 2u);
  EXPECT_EQ(speech[0].end_ms, 2000);
  EXPECT_EQ(speech[1].start_ms, 2500);
}

// =============================================================================
// Window reconciliation (30 s windows, 1 s overlap: second window at 29 s)
// =============================================================================

TEST(SegmenterContract, SpeechAcrossWindowBoundaryIsOneSegment) {
  auto audio = Timeline(40000, {{28000, 33000, 120.0}});
  auto speech = SpeechOnly(Segmenter(core::SegmenterConfig()).Segment(audio));
  ASSERT_EQ(speech.size(), 1u);
  EXPECT_EQ(speech[0].start_ms, 28000);
  EXPECT_EQ(speech[0].end_ms, 33000);
}

TEST(SegmenterContract, SpeechInsideOverlapIsNotDuplicated) {
  auto audio = Timeline(40000, {{29200, 29800, 120.0}});
  auto segments = Segmenter(core::SegmenterConfig()).Segment(audio);
  ExpectContiguousCover(segments, audio);
  auto speech = SpeechOnly(segments);
  ASSERT_EQ(speech.size(), 1u);
  EXPECT_EQ(speech[0].start_ms, 29200);
  EXPECT_EQ(speech[0].end_ms, 29800);
}

TEST(SegmenterContract, SpeechOnEitherSideOfOverlapStaysSeparate) {
  auto audio = Timeline(40000, {{27000, 28500, 120.0}, {30500, 32000, 120.0}});
  auto speech = SpeechOnly(Segmenter(core::SegmenterConfig()).Segment(audio));
  ASSERT_EQ(speech.size(), 2u);
  EXPECT_EQ(speech[0].start_ms, 27000);
  EXPECT_EQ(speech[0].end_ms, 28500);
  EXPECT_EQ(speech[1].start_ms, 30500);
  EXPECT_EQ(speech[1].end_ms, 32000);
}

TEST(SegmenterContract, ThreeWindowsStillCoverInput) {
  auto audio = Timeline(70000, {{10000, 12000, 120.0}, {57000, 60000, 200.0}});
  auto segments = Segmenter(core::SegmenterConfig()).Segment(audio);
  ExpectContiguousCover(segments, audio);
  auto speech = SpeechOnly(segments);
  ASSERT_EQ(speech.size(), 2u);
  EXPECT_EQ(speech[1].start_ms, 57000);
  EXPECT_EQ(speech[1].end_ms, 60000);
}
