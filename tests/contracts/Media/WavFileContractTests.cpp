// Repository: Redub
// Component: Media Contract Tests
// Purpose: WAV artifact I/O, PCM packing, and gain helpers.
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "SyntheticAudio.h"
#include "TempDir.h"
#include "redub/media/LoudnessGain.hpp"
#include "redub/media/PcmBuffer.hpp"
#include "redub/media/WavFile.hpp"

using namespace redub::media;
using redub::tests::fixtures::TempDir;

namespace {

template <typename T>
void Put(std::ofstream& out, T v) {
  out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

// Stereo 16-bit WAV with a LIST chunk ahead of "data".
void WriteStereoWithList(const std::string& path, const std::vector<int16_t>& interleaved) {
  std::ofstream out(path, std::ios::binary);
  const uint32_t data_size = static_cast<uint32_t>(interleaved.size() * 2);
  out.write("RIFF", 4);
  Put<uint32_t>(out, 4 + 24 + 12 + 8 + data_size);
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  Put<uint32_t>(out, 16);
  Put<uint16_t>(out, 1);
  Put<uint16_t>(out, 2);
  Put<uint32_t>(out, 8000);
  Put<uint32_t>(out, 8000 * 4);
  Put<uint16_t>(out, 4);
  Put<uint16_t>(out, 16);
  out.write("LIST", 4);
  Put<uint32_t>(out, 4);
  out.write("INFO", 4);
  out.write("data", 4);
  Put<uint32_t>(out, data_size);
  out.write(reinterpret_cast<const char*>(interleaved.data()),
            static_cast<std::streamsize>(data_size));
}

}  // namespace

// =============================================================================
// Time conversions
// =============================================================================

TEST(PcmBufferContract, MillisecondConversionsRoundAsDocumented) {
  EXPECT_EQ(MsToSamples(1000, 16000), 16000);
  EXPECT_EQ(SamplesToMs(15999, 16000), 999);
  EXPECT_EQ(SamplesToMsCeil(15999, 16000), 1000);
  EXPECT_EQ(SamplesToMsCeil(16000, 16000), 1000);
  EXPECT_EQ(MakeSilence(250, 16000).size(), 4000u);
}

TEST(PcmBufferContract, SliceClampsToBuffer) {
  PcmBuffer b = MakeSilence(100, 1000);
  EXPECT_EQ(Slice(b, 90, 500).size(), 10u);
  EXPECT_EQ(Slice(b, -5, 10).size(), 10u);
  EXPECT_TRUE(Slice(b, 50, 20).empty());
  EXPECT_EQ(Slice(b, 0, 10).sample_rate, 1000);
}

TEST(PcmBufferContract, RmsOfSilenceIsFloor) {
  std::vector<float> zeros(100, 0.0f);
  EXPECT_DOUBLE_EQ(RmsDbfs(zeros.data(), zeros.size()), kSilenceFloorDb);
  std::vector<float> full(100, 1.0f);
  EXPECT_NEAR(RmsDbfs(full.data(), full.size()), 0.0, 1e-9);
}

TEST(PcmBufferContract, S16leClampsAndIgnoresOddByte) {
  PcmBuffer b;
  b.sample_rate = 16000;
  b.samples = {0.0f, 2.0f, -2.0f, 0.5f};
  std::string bytes = EncodePcmS16le(b);
  ASSERT_EQ(bytes.size(), 8u);
  bytes.push_back('\x7f');
  PcmBuffer back = DecodePcmS16le(bytes, 16000);
  ASSERT_EQ(back.size(), 4u);
  EXPECT_FLOAT_EQ(back.samples[0], 0.0f);
  EXPECT_NEAR(back.samples[1], 32767.0f / 32768.0f, 1e-6);
  EXPECT_NEAR(back.samples[2], -32767.0f / 32768.0f, 1e-6);
  EXPECT_NEAR(back.samples[3], 0.5f, 1e-4);
}

// =============================================================================
// WAV files
// =============================================================================

TEST(WavFileContract, WriteThenReadPreservesRateAndLength) {
  TempDir dir;
  const std::string path = dir.Join("tone.wav");
  PcmBuffer tone = redub::tests::fixtures::Tone(500, 220.0, 22050);
  std::string error;
  ASSERT_TRUE(WriteWavMono16(path, tone, &error)) << error;

  PcmBuffer back;
  ASSERT_TRUE(ReadWavMono16(path, &back, &error)) << error;
  EXPECT_EQ(back.sample_rate, 22050);
  ASSERT_EQ(back.size(), tone.size());
  for (size_t i = 0; i < tone.size(); i += 97) {
    EXPECT_NEAR(back.samples[i], tone.samples[i], 1.0 / 16384.0) << "sample " << i;
  }
}

TEST(WavFileContract, EmptyBufferIsValidZeroLengthFile) {
  TempDir dir;
  const std::string path = dir.Join("empty.wav");
  PcmBuffer empty;
  empty.sample_rate = 16000;
  std::string error;
  ASSERT_TRUE(WriteWavMono16(path, empty, &error)) << error;
  PcmBuffer back;
  ASSERT_TRUE(ReadWavMono16(path, &back, &error)) << error;
  EXPECT_TRUE(back.empty());
  EXPECT_EQ(back.sample_rate, 16000);
}

TEST(WavFileContract, StereoIsAveragedAndUnknownChunksSkipped) {
  TempDir dir;
  const std::string path = dir.Join("stereo.wav");
  WriteStereoWithList(path, {16384, 0, -16384, -16384});
  PcmBuffer back;
  std::string error;
  ASSERT_TRUE(ReadWavMono16(path, &back, &error)) << error;
  EXPECT_EQ(back.sample_rate, 8000);
  ASSERT_EQ(back.size(), 2u);
  EXPECT_FLOAT_EQ(back.samples[0], 0.25f);
  EXPECT_FLOAT_EQ(back.samples[1], -0.5f);
}

TEST(WavFileContract, RejectsNonWavAndMissingFiles) {
  TempDir dir;
  const std::string path = dir.Join("junk.wav");
  {
    std::ofstream out(path);
    out << "definitely not a wave file";
  }
  PcmBuffer back;
  std::string error;
  EXPECT_FALSE(ReadWavMono16(path, &back, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(ReadWavMono16(dir.Join("absent.wav"), &back, &error));

  PcmBuffer no_rate;
  EXPECT_FALSE(WriteWavMono16(dir.Join("bad.wav"), no_rate, &error));
}

// =============================================================================
// Gain
// =============================================================================

TEST(LoudnessGainContract, NormalizationGainIsBounded) {
  EXPECT_DOUBLE_EQ(NormalizationGainDb(-30.0, -20.0, 20.0), 10.0);
  EXPECT_DOUBLE_EQ(NormalizationGainDb(-70.0, -20.0, 20.0), 20.0);
  EXPECT_DOUBLE_EQ(NormalizationGainDb(-5.0, -20.0, 6.0), -6.0);
}

TEST(LoudnessGainContract, GainClampsWithoutWraparound) {
  std::vector<float> s = {0.6f, -0.6f, 0.1f};
  ApplyGain(s.data(), s.size(), GainDbToLinear(20.0f));
  EXPECT_FLOAT_EQ(s[0], 1.0f);
  EXPECT_FLOAT_EQ(s[1], -1.0f);
  EXPECT_NEAR(s[2], 1.0f, 1e-5);
}

TEST(LoudnessGainContract, EdgeFadesZeroTheEndpoints) {
  std::vector<float> s(100, 1.0f);
  ApplyEdgeFades(s.data(), s.size(), 10);
  EXPECT_FLOAT_EQ(s.front(), 0.0f);
  EXPECT_FLOAT_EQ(s.back(), 0.0f);
  EXPECT_FLOAT_EQ(s[5], 0.5f);
  EXPECT_FLOAT_EQ(s[50], 1.0f);

  // Shorter than two fades: fade length shrinks to half the span.
  std::vector<float> tiny(4, 1.0f);
  ApplyEdgeFades(tiny.data(), tiny.size(), 10);
  EXPECT_FLOAT_EQ(tiny[0], 0.0f);
  EXPECT_FLOAT_EQ(tiny[1], 0.5f);
  EXPECT_FLOAT_EQ(tiny[2], 0.5f);
  EXPECT_FLOAT_EQ(tiny[3], 0.0f);
}
