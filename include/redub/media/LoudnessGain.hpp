// Repository: Redub
// Component: Loudness Gain Application
// Purpose: Constant gain, RMS normalization, and edge fades on float PCM.
// Copyright (c) 2026 Redub

#ifndef REDUB_MEDIA_LOUDNESS_GAIN_HPP_
#define REDUB_MEDIA_LOUDNESS_GAIN_HPP_

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace redub::media {

// Convert dB to linear gain factor: 10^(gain_db / 20)
inline float GainDbToLinear(float gain_db) {
  return std::pow(10.0f, gain_db / 20.0f);
}

// Apply constant linear gain to samples [0, count).
// - Sample count and timing remain unchanged.
// - Clamps to [-1, 1], no wraparound.
// - Callers skip the call for a 0 dB change so unity is bit-exact.
inline void ApplyGain(float* samples, size_t count, float linear_gain) {
  for (size_t i = 0; i < count; ++i) {
    float scaled = samples[i] * linear_gain;
    if (scaled > 1.0f) scaled = 1.0f;
    else if (scaled < -1.0f) scaled = -1.0f;
    samples[i] = scaled;
  }
}

// Gain in dB that moves |current_dbfs| to |target_dbfs|, limited to
// ±max_gain_db.
inline double NormalizationGainDb(double current_dbfs, double target_dbfs, double max_gain_db) {
  double gain = target_dbfs - current_dbfs;
  return std::clamp(gain, -max_gain_db, max_gain_db);
}

// Linear fade-in over the first |fade_samples| and fade-out over the last
// |fade_samples| of [0, count). Fades shrink to half the span when the span
// is shorter than two fades.
inline void ApplyEdgeFades(float* samples, size_t count, size_t fade_samples) {
  fade_samples = std::min(fade_samples, count / 2);
  if (fade_samples == 0) return;
  for (size_t i = 0; i < fade_samples; ++i) {
    float g = static_cast<float>(i) / static_cast<float>(fade_samples);
    samples[i] *= g;
    samples[count - 1 - i] *= g;
  }
}

}  // namespace redub::media

#endif  // REDUB_MEDIA_LOUDNESS_GAIN_HPP_
