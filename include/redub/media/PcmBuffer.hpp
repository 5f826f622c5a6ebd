// Repository: Redub
// Component: PCM Buffer
// Purpose: Mono float PCM waveform tagged with its sample rate, plus the
//          sample/millisecond conversions used across the pipeline.
// Copyright (c) 2026 Redub

#ifndef REDUB_MEDIA_PCM_BUFFER_HPP_
#define REDUB_MEDIA_PCM_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace redub::media {

// Sample index → milliseconds, rounded down.
int64_t SamplesToMs(int64_t samples, int sample_rate);

// Sample index → milliseconds, rounded up. Used wherever a duration must
// cover every sample (placement of stretched clips).
int64_t SamplesToMsCeil(int64_t samples, int sample_rate);

// Milliseconds → sample index, rounded down.
int64_t MsToSamples(int64_t ms, int sample_rate);

// Mono 32-bit float PCM in [-1, 1].
struct PcmBuffer {
  int sample_rate = 0;
  std::vector<float> samples;

  bool empty() const { return samples.empty(); }
  size_t size() const { return samples.size(); }
  int64_t DurationMs() const { return SamplesToMs(static_cast<int64_t>(samples.size()), sample_rate); }
};

PcmBuffer MakeSilence(int64_t duration_ms, int sample_rate);

// Copy of samples [begin_sample, end_sample), clamped to the buffer.
PcmBuffer Slice(const PcmBuffer& source, int64_t begin_sample, int64_t end_sample);

// RMS level in dBFS of samples [0, count). Returns kSilenceFloorDb for
// all-zero input.
constexpr double kSilenceFloorDb = -120.0;
double RmsDbfs(const float* samples, size_t count);

// Little-endian signed 16-bit packing used on the wire and in WAV files.
// Samples are clamped to [-1, 1] and scaled by 32767; decoding divides by
// 32768. A trailing odd byte is ignored.
std::string EncodePcmS16le(const PcmBuffer& buffer);
PcmBuffer DecodePcmS16le(const std::string& bytes, int sample_rate);

}  // namespace redub::media

#endif  // REDUB_MEDIA_PCM_BUFFER_HPP_
