// Repository: Redub
// Component: Subtitle Generator
// Purpose: Caption cues from translated text placed on the aligned (dubbed)
//          timeline, rendered as SubRip and WebVTT.
// Copyright (c) 2026 Redub

#ifndef REDUB_SUBTITLES_SUBTITLE_GENERATOR_HPP_
#define REDUB_SUBTITLES_SUBTITLE_GENERATOR_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"

namespace redub::subtitles {

struct SubtitleCue {
  int index = 0;          // 1-based, timeline order
  int32_t segment_id = 0;
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  std::vector<std::string> lines;
};

class SubtitleGenerator {
 public:
  explicit SubtitleGenerator(const core::SubtitleConfig& config);

  // One or more cues per aligned clip that has non-empty translated text.
  // Cue times are the clip's final_start_ms / final_end_ms; every cue split
  // from one segment shares that window.
  std::vector<SubtitleCue> Generate(const std::vector<core::TranslatedSegment>& translations,
                                    const std::vector<core::AlignedClip>& clips) const;

  // Greedy word wrap at max_chars_per_line characters (UTF-8 code points).
  // A word longer than the limit is split across lines.
  std::vector<std::string> WrapLines(const std::string& text) const;

  static std::string FormatSrtTimestamp(int64_t ms);  // HH:MM:SS,mmm
  static std::string FormatVttTimestamp(int64_t ms);  // HH:MM:SS.mmm

  // SubRip: drops carriage returns, folds newlines, neutralizes "-->".
  static std::string EscapeSrt(const std::string& line);
  // WebVTT: encodes '&', '<' and '>'.
  static std::string EscapeVtt(const std::string& line);

  static std::string RenderSrt(const std::vector<SubtitleCue>& cues);
  static std::string RenderVtt(const std::vector<SubtitleCue>& cues);

 private:
  core::SubtitleConfig config_;
};

}  // namespace redub::subtitles

#endif  // REDUB_SUBTITLES_SUBTITLE_GENERATOR_HPP_
