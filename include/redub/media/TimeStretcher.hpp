// Repository: Redub
// Component: Time Stretcher
// Purpose: Pitch-preserving tempo change of synthesized speech, with
//          resampling to the output track rate.
// Copyright (c) 2026 Redub

#ifndef REDUB_MEDIA_TIME_STRETCHER_HPP_
#define REDUB_MEDIA_TIME_STRETCHER_HPP_

#include <string>

#include "redub/media/PcmBuffer.hpp"

namespace redub::media {

class ITimeStretcher {
 public:
  virtual ~ITimeStretcher() = default;

  // Plays |input| at |tempo| (2.0 = twice as fast, half the duration)
  // without changing pitch, and resamples to |output_sample_rate|.
  // Output duration ≈ input duration / tempo. Must be safe to call from
  // one thread at a time per instance.
  virtual PcmBuffer Stretch(const PcmBuffer& input, double tempo, int output_sample_rate) = 0;
};

// Filter description for |tempo| as a chain of atempo stages, each within
// [0.5, 2.0]. Example: 3.0 → "atempo=2.000000,atempo=1.500000".
std::string BuildAtempoChain(double tempo);

// libavfilter graph: abuffer → atempo… → aresample → aformat → abuffersink.
class FFmpegTimeStretcher : public ITimeStretcher {
 public:
  PcmBuffer Stretch(const PcmBuffer& input, double tempo, int output_sample_rate) override;
};

}  // namespace redub::media

#endif  // REDUB_MEDIA_TIME_STRETCHER_HPP_
