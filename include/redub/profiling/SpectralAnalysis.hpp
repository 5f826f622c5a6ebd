// Repository: Redub
// Component: Spectral Analysis
// Purpose: Per-frame acoustic features for speaker profiling: fundamental
//          frequency by normalized autocorrelation and spectral centroid by
//          a Hann-windowed radix-2 FFT.
// Copyright (c) 2026 Redub

#ifndef REDUB_PROFILING_SPECTRAL_ANALYSIS_HPP_
#define REDUB_PROFILING_SPECTRAL_ANALYSIS_HPP_

#include <complex>
#include <cstddef>
#include <vector>

namespace redub::profiling {

// In-place iterative radix-2 FFT. data.size() must be a power of two.
void Fft(std::vector<std::complex<double>>* data);

// Smallest power of two >= n (1 for n == 0).
size_t NextPowerOfTwo(size_t n);

// Magnitudes of bins [0, N/2] of the Hann-windowed frame, zero-padded to the
// next power of two N.
std::vector<double> MagnitudeSpectrum(const float* samples, size_t count);

// Magnitude-weighted mean frequency of the frame. 0 for a silent frame.
double SpectralCentroidHz(const float* samples, size_t count, int sample_rate);

struct PitchEstimate {
  double hz = 0.0;           // 0 when the frame is unvoiced
  double periodicity = 0.0;  // Best normalized autocorrelation in range
};

// F0 search over lags [sample_rate / max_hz, sample_rate / min_hz]. The
// frame is voiced when the best normalized autocorrelation reaches
// |voicing_threshold|; the shortest lag whose peak is within 90% of the best
// is reported, refined by parabolic interpolation.
PitchEstimate EstimatePitch(const float* samples, size_t count, int sample_rate,
                            double min_hz, double max_hz, double voicing_threshold);

}  // namespace redub::profiling

#endif  // REDUB_PROFILING_SPECTRAL_ANALYSIS_HPP_
