// Repository: Redub
// Component: Muxer
// Purpose: Hands the dubbed track and captions to an external ffmpeg process
//          that writes them into a copy of the source video.
// Copyright (c) 2026 Redub

#ifndef REDUB_MUX_MUXER_HPP_
#define REDUB_MUX_MUXER_HPP_

#include <string>
#include <vector>

#include "redub/core/JobConfig.hpp"

namespace redub::mux {

struct MuxRequest {
  std::string video_path;     // Source container (video stream is taken from it)
  std::string audio_path;     // dubbed_track.wav
  std::string subtitle_path;  // captions.srt; empty for no captions
  std::string output_path;
  core::SubtitleMode subtitle_mode = core::SubtitleMode::kSoft;
  core::BurnStyle burn_style;  // kBurn only
};

// libass force_style list for |style|, e.g.
// "FontName=Arial,FontSize=24,PrimaryColour=&H00FFFFFF,...".
// Colours must already be valid (see core::ToAssColour).
std::string BuildForceStyle(const core::BurnStyle& style);

// ffmpeg filtergraph value quoting: option-level backslash escapes, then
// graph-level single quotes.
std::string QuoteFilterValue(const std::string& value);

class IMuxer {
 public:
  virtual ~IMuxer() = default;

  // Throws core::MuxError when the output could not be produced.
  virtual void Mux(const MuxRequest& request) = 0;
};

// Runs ffmpeg as a child process and waits for it:
//   soft: -i video -i audio -i srt ... -map 2:s:0 -c:s mov_text
//   burn: -i video -i audio ... -vf subtitles=filename=...:force_style=...
//   none or no subtitle file: video and dubbed audio only
class ExternalMuxer : public IMuxer {
 public:
  explicit ExternalMuxer(std::string ffmpeg_path);

  void Mux(const MuxRequest& request) override;

  // Full argv (argv[0] included) for |request|.
  std::vector<std::string> BuildCommand(const MuxRequest& request) const;

 private:
  std::string ffmpeg_path_;
};

}  // namespace redub::mux

#endif  // REDUB_MUX_MUXER_HPP_
