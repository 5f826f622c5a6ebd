// Repository: Redub
// Component: Spectral Analysis Implementation
// Purpose: FFT, spectral centroid, and autocorrelation pitch tracking.
// Copyright (c) 2026 Redub

#include "redub/profiling/SpectralAnalysis.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace redub::profiling {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Peaks within this fraction of the best one are octave candidates.
constexpr double kOctavePeakRatio = 0.9;

}  // namespace

size_t NextPowerOfTwo(size_t n) {
  size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

void Fft(std::vector<std::complex<double>>* data) {
  std::vector<std::complex<double>>& a = *data;
  const size_t n = a.size();
  if (n < 2) return;

  // Bit-reversal permutation.
  for (size_t i = 1, j = 0; i < n; ++i) {
    size_t bit = n >> 1;
    for (; j & bit; bit >>= 1) j ^= bit;
    j ^= bit;
    if (i < j) std::swap(a[i], a[j]);
  }

  for (size_t len = 2; len <= n; len <<= 1) {
    const double angle = -2.0 * kPi / static_cast<double>(len);
    const std::complex<double> wlen(std::cos(angle), std::sin(angle));
    for (size_t i = 0; i < n; i += len) {
      std::complex<double> w(1.0, 0.0);
      for (size_t k = 0; k < len / 2; ++k) {
        const std::complex<double> u = a[i + k];
        const std::complex<double> v = a[i + k + len / 2] * w;
        a[i + k] = u + v;
        a[i + k + len / 2] = u - v;
        w *= wlen;
      }
    }
  }
}

std::vector<double> MagnitudeSpectrum(const float* samples, size_t count) {
  const size_t n = NextPowerOfTwo(std::max<size_t>(count, 2));
  std::vector<std::complex<double>> buf(n);
  for (size_t i = 0; i < count; ++i) {
    const double w = count > 1
        ? 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(count - 1))
        : 1.0;
    buf[i] = std::complex<double>(samples[i] * w, 0.0);
  }
  Fft(&buf);

  std::vector<double> mags(n / 2 + 1);
  for (size_t k = 0; k < mags.size(); ++k) mags[k] = std::abs(buf[k]);
  return mags;
}

double SpectralCentroidHz(const float* samples, size_t count, int sample_rate) {
  if (count == 0 || sample_rate <= 0) return 0.0;
  const std::vector<double> mags = MagnitudeSpectrum(samples, count);
  const size_t n = (mags.size() - 1) * 2;
  const double bin_hz = static_cast<double>(sample_rate) / static_cast<double>(n);

  double weighted = 0.0;
  double total = 0.0;
  for (size_t k = 0; k < mags.size(); ++k) {
    weighted += static_cast<double>(k) * bin_hz * mags[k];
    total += mags[k];
  }
  return total > 1e-12 ? weighted / total : 0.0;
}

PitchEstimate EstimatePitch(const float* samples, size_t count, int sample_rate,
                            double min_hz, double max_hz, double voicing_threshold) {
  PitchEstimate est;
  if (count < 4 || sample_rate <= 0 || min_hz <= 0.0 || max_hz <= min_hz) return est;

  const size_t lag_min = std::max<size_t>(
      1, static_cast<size_t>(std::floor(sample_rate / max_hz)));
  const size_t lag_max = std::min<size_t>(
      count - 2, static_cast<size_t>(std::ceil(sample_rate / min_hz)));
  if (lag_max <= lag_min + 1) return est;

  double mean = 0.0;
  for (size_t i = 0; i < count; ++i) mean += samples[i];
  mean /= static_cast<double>(count);

  std::vector<double> x(count);
  for (size_t i = 0; i < count; ++i) x[i] = samples[i] - mean;

  std::vector<double> r(lag_max + 1, 0.0);
  double best = -1.0;
  size_t best_lag = lag_min;
  for (size_t lag = lag_min; lag <= lag_max; ++lag) {
    double cross = 0.0;
    double e0 = 0.0;
    double e1 = 0.0;
    for (size_t i = 0; i + lag < count; ++i) {
      cross += x[i] * x[i + lag];
      e0 += x[i] * x[i];
      e1 += x[i + lag] * x[i + lag];
    }
    const double denom = std::sqrt(e0 * e1);
    r[lag] = denom > 1e-12 ? cross / denom : 0.0;
    if (r[lag] > best) {
      best = r[lag];
      best_lag = lag;
    }
  }

  est.periodicity = std::max(0.0, best);
  if (best < voicing_threshold) return est;

  // Shortest-lag peak close to the best one; longer lags are sub-octaves.
  size_t lag = best_lag;
  for (size_t l = lag_min + 1; l < lag_max; ++l) {
    if (r[l] >= kOctavePeakRatio * best && r[l] >= r[l - 1] && r[l] >= r[l + 1]) {
      lag = l;
      break;
    }
  }

  double refined = static_cast<double>(lag);
  if (lag > lag_min && lag < lag_max) {
    const double y0 = r[lag - 1];
    const double y1 = r[lag];
    const double y2 = r[lag + 1];
    const double denom = y0 - 2.0 * y1 + y2;
    if (std::fabs(denom) > 1e-12) {
      const double delta = 0.5 * (y0 - y2) / denom;
      if (std::fabs(delta) < 1.0) refined += delta;
    }
  }
  est.hz = static_cast<double>(sample_rate) / refined;
  return est;
}

}  // namespace redub::profiling
