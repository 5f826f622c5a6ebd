// Synthetic speech-like audio for segmentation, profiling and end-to-end
// tests: harmonic tones (F0 plus two overtones) separated by digital silence.

#ifndef REDUB_TESTS_FIXTURES_SYNTHETIC_AUDIO_H_
#define REDUB_TESTS_FIXTURES_SYNTHETIC_AUDIO_H_

#include <cmath>
#include <cstdint>
#include <vector>

#include "redub/media/PcmBuffer.hpp"

namespace redub::tests::fixtures {

constexpr double kTonePeak = 0.3;

struct ToneSpan {
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  double f0_hz = 120.0;
};

// Adds a voiced tone over [start, start + count) samples of |out|.
inline void AddTone(std::vector<float>* out, size_t start, size_t count, double f0_hz,
                    int sample_rate, double peak = kTonePeak) {
  constexpr double kTwoPi = 6.283185307179586;
  const double scale = peak / 1.75;  // 1 + 0.5 + 0.25
  for (size_t i = 0; i < count && start + i < out->size(); ++i) {
    const double t = static_cast<double>(i) / sample_rate;
    const double s = std::sin(kTwoPi * f0_hz * t) + 0.5 * std::sin(kTwoPi * 2.0 * f0_hz * t) +
                     0.25 * std::sin(kTwoPi * 3.0 * f0_hz * t);
    (*out)[start + i] += static_cast<float>(scale * s);
  }
}

inline media::PcmBuffer Tone(int64_t duration_ms, double f0_hz, int sample_rate = 16000,
                             double peak = kTonePeak) {
  media::PcmBuffer buf = media::MakeSilence(duration_ms, sample_rate);
  AddTone(&buf.samples, 0, buf.size(), f0_hz, sample_rate, peak);
  return buf;
}

// |total_ms| of silence with a tone over each span.
inline media::PcmBuffer Timeline(int64_t total_ms, const std::vector<ToneSpan>& spans,
                                 int sample_rate = 16000) {
  media::PcmBuffer buf = media::MakeSilence(total_ms, sample_rate);
  for (const auto& span : spans) {
    const int64_t begin = media::MsToSamples(span.start_ms, sample_rate);
    const int64_t end = media::MsToSamples(span.end_ms, sample_rate);
    AddTone(&buf.samples, static_cast<size_t>(begin), static_cast<size_t>(end - begin),
            span.f0_hz, sample_rate);
  }
  return buf;
}

}  // namespace redub::tests::fixtures

#endif  // REDUB_TESTS_FIXTURES_SYNTHETIC_AUDIO_H_
