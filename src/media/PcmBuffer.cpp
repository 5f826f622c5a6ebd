// Repository: Redub
// Component: PCM Buffer
// Purpose: Sample/millisecond conversions and buffer helpers.
// Copyright (c) 2026 Redub

#include "redub/media/PcmBuffer.hpp"

#include <algorithm>
#include <cmath>

namespace redub::media {

int64_t SamplesToMs(int64_t samples, int sample_rate) {
  if (sample_rate <= 0) return 0;
  return samples * 1000 / sample_rate;
}

int64_t SamplesToMsCeil(int64_t samples, int sample_rate) {
  if (sample_rate <= 0) return 0;
  return (samples * 1000 + sample_rate - 1) / sample_rate;
}

int64_t MsToSamples(int64_t ms, int sample_rate) {
  if (sample_rate <= 0) return 0;
  return ms * sample_rate / 1000;
}

PcmBuffer MakeSilence(int64_t duration_ms, int sample_rate) {
  PcmBuffer out;
  out.sample_rate = sample_rate;
  if (duration_ms > 0) {
    out.samples.assign(static_cast<size_t>(MsToSamples(duration_ms, sample_rate)), 0.0f);
  }
  return out;
}

PcmBuffer Slice(const PcmBuffer& source, int64_t begin_sample, int64_t end_sample) {
  PcmBuffer out;
  out.sample_rate = source.sample_rate;
  const int64_t size = static_cast<int64_t>(source.samples.size());
  begin_sample = std::clamp<int64_t>(begin_sample, 0, size);
  end_sample = std::clamp<int64_t>(end_sample, begin_sample, size);
  out.samples.assign(source.samples.begin() + begin_sample,
                     source.samples.begin() + end_sample);
  return out;
}

double RmsDbfs(const float* samples, size_t count) {
  if (count == 0) return kSilenceFloorDb;
  double sum_sq = 0.0;
  for (size_t i = 0; i < count; ++i) {
    sum_sq += static_cast<double>(samples[i]) * samples[i];
  }
  double rms = std::sqrt(sum_sq / static_cast<double>(count));
  if (rms <= 1e-6) return kSilenceFloorDb;
  return std::max(kSilenceFloorDb, 20.0 * std::log10(rms));
}

std::string EncodePcmS16le(const PcmBuffer& buffer) {
  std::string bytes;
  bytes.resize(buffer.samples.size() * 2);
  for (size_t i = 0; i < buffer.samples.size(); ++i) {
    const float clamped = std::clamp(buffer.samples[i], -1.0f, 1.0f);
    const int16_t v = static_cast<int16_t>(std::lround(clamped * 32767.0f));
    const uint16_t u = static_cast<uint16_t>(v);
    bytes[2 * i] = static_cast<char>(u & 0xff);
    bytes[2 * i + 1] = static_cast<char>((u >> 8) & 0xff);
  }
  return bytes;
}

PcmBuffer DecodePcmS16le(const std::string& bytes, int sample_rate) {
  PcmBuffer out;
  out.sample_rate = sample_rate;
  const size_t count = bytes.size() / 2;
  out.samples.resize(count);
  for (size_t i = 0; i < count; ++i) {
    const uint16_t u = static_cast<uint16_t>(static_cast<unsigned char>(bytes[2 * i])) |
                       static_cast<uint16_t>(static_cast<unsigned char>(bytes[2 * i + 1]) << 8);
    out.samples[i] = static_cast<float>(static_cast<int16_t>(u)) / 32768.0f;
  }
  return out;
}

}  // namespace redub::media
