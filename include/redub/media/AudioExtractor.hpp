// Repository: Redub
// Component: Audio Extractor
// Purpose: Pull a single mono PCM stream at a configured rate out of a
//          source container.
// Copyright (c) 2026 Redub

#ifndef REDUB_MEDIA_AUDIO_EXTRACTOR_HPP_
#define REDUB_MEDIA_AUDIO_EXTRACTOR_HPP_

#include <string>

#include "redub/media/PcmBuffer.hpp"

namespace redub::media {

class IAudioExtractor {
 public:
  virtual ~IAudioExtractor() = default;

  // Decodes the best audio stream of |path| to mono float at |sample_rate|.
  // Throws core::SegmentationError if the file is unreadable, corrupt, or
  // has no audio stream. An audio stream with no samples yields an empty
  // buffer.
  virtual PcmBuffer Extract(const std::string& path, int sample_rate) = 0;
};

// libavformat + libavcodec + libswresample implementation.
class FFmpegAudioExtractor : public IAudioExtractor {
 public:
  PcmBuffer Extract(const std::string& path, int sample_rate) override;
};

}  // namespace redub::media

#endif  // REDUB_MEDIA_AUDIO_EXTRACTOR_HPP_
