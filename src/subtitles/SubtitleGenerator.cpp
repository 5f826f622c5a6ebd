// Repository: Redub
// Component: Subtitle Generator Implementation
// Copyright (c) 2026 Redub

#include "redub/subtitles/SubtitleGenerator.hpp"

#include <cstdio>
#include <map>
#include <sstream>

#include "redub/util/Logger.hpp"

namespace redub::subtitles {

using util::Logger;

namespace {

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t CodePoints(const std::string& s) {
  size_t n = 0;
  for (char c : s) {
    if (!IsContinuationByte(c)) ++n;
  }
  return n;
}

// Splits |word| into pieces of at most |limit| code points.
std::vector<std::string> SplitWord(const std::string& word, size_t limit) {
  std::vector<std::string> pieces;
  std::string current;
  size_t count = 0;
  for (size_t i = 0; i < word.size(); ++i) {
    if (!IsContinuationByte(word[i])) {
      if (count == limit) {
        pieces.push_back(current);
        current.clear();
        count = 0;
      }
      ++count;
    }
    current += word[i];
  }
  if (!current.empty()) pieces.push_back(current);
  return pieces;
}

std::string FormatTimestamp(int64_t ms, char separator) {
  if (ms < 0) ms = 0;
  const int64_t h = ms / 3600000;
  const int64_t m = (ms / 60000) % 60;
  const int64_t s = (ms / 1000) % 60;
  const int64_t frac = ms % 1000;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld%c%03lld",
                static_cast<long long>(h), static_cast<long long>(m),
                static_cast<long long>(s), separator, static_cast<long long>(frac));
  return buf;
}

}  // namespace

SubtitleGenerator::SubtitleGenerator(const core::SubtitleConfig& config) : config_(config) {}

std::vector<std::string> SubtitleGenerator::WrapLines(const std::string& text) const {
  const size_t limit = static_cast<size_t>(config_.max_chars_per_line);
  std::vector<std::string> lines;
  std::string line;
  size_t line_len = 0;

  std::istringstream words(text);
  std::string word;
  while (words >> word) {
    for (const std::string& piece : SplitWord(word, limit)) {
      const size_t len = CodePoints(piece);
      if (line_len > 0 && line_len + 1 + len > limit) {
        lines.push_back(line);
        line.clear();
        line_len = 0;
      }
      if (line_len > 0) {
        line += ' ';
        ++line_len;
      }
      line += piece;
      line_len += len;
    }
  }
  if (!line.empty()) lines.push_back(line);
  return lines;
}

std::vector<SubtitleCue> SubtitleGenerator::Generate(
    const std::vector<core::TranslatedSegment>& translations,
    const std::vector<core::AlignedClip>& clips) const {
  std::map<int32_t, const core::TranslatedSegment*> by_id;
  for (const auto& t : translations) by_id[t.segment_id] = &t;

  const size_t per_cue = static_cast<size_t>(config_.max_lines_per_cue);
  std::vector<SubtitleCue> cues;
  for (const auto& clip : clips) {
    auto it = by_id.find(clip.segment_id);
    if (it == by_id.end()) continue;
    const std::vector<std::string> lines = WrapLines(it->second->translated_text);
    for (size_t i = 0; i < lines.size(); i += per_cue) {
      SubtitleCue cue;
      cue.index = static_cast<int>(cues.size()) + 1;
      cue.segment_id = clip.segment_id;
      cue.start_ms = clip.final_start_ms;
      cue.end_ms = clip.final_end_ms;
      for (size_t j = i; j < lines.size() && j < i + per_cue; ++j) cue.lines.push_back(lines[j]);
      cues.push_back(std::move(cue));
    }
  }

  Logger::Debug("[SubtitleGenerator] CUES count=" + std::to_string(cues.size()) +
                " clips=" + std::to_string(clips.size()));
  return cues;
}

std::string SubtitleGenerator::FormatSrtTimestamp(int64_t ms) {
  return FormatTimestamp(ms, ',');
}

std::string SubtitleGenerator::FormatVttTimestamp(int64_t ms) {
  return FormatTimestamp(ms, '.');
}

std::string SubtitleGenerator::EscapeSrt(const std::string& line) {
  std::string folded;
  folded.reserve(line.size());
  for (char c : line) {
    if (c == '\r') continue;
    folded += (c == '\n') ? ' ' : c;
  }
  std::string out;
  out.reserve(folded.size());
  for (size_t i = 0; i < folded.size(); ++i) {
    if (folded.compare(i, 3, "-->") == 0) {
      out += "->";
      i += 2;
      continue;
    }
    out += folded[i];
  }
  return out;
}

std::string SubtitleGenerator::EscapeVtt(const std::string& line) {
  std::string out;
  out.reserve(line.size() + 8);
  for (char c : line) {
    if (c == '&') out += "&amp;";
    else if (c == '<') out += "&lt;";
    else if (c == '>') out += "&gt;";
    else if (c == '\r') continue;
    else if (c == '\n') out += ' ';
    else out += c;
  }
  return out;
}

std::string SubtitleGenerator::RenderSrt(const std::vector<SubtitleCue>& cues) {
  std::ostringstream o;
  for (const auto& cue : cues) {
    o << cue.index << '\n'
      << FormatSrtTimestamp(cue.start_ms) << " --> " << FormatSrtTimestamp(cue.end_ms) << '\n';
    for (const auto& line : cue.lines) o << EscapeSrt(line) << '\n';
    o << '\n';
  }
  return o.str();
}

std::string SubtitleGenerator::RenderVtt(const std::vector<SubtitleCue>& cues) {
  std::ostringstream o;
  o << "WEBVTT\n\n";
  for (const auto& cue : cues) {
    o << cue.index << '\n'
      << FormatVttTimestamp(cue.start_ms) << " --> " << FormatVttTimestamp(cue.end_ms) << '\n';
    for (const auto& line : cue.lines) o << EscapeVtt(line) << '\n';
    o << '\n';
  }
  return o.str();
}

}  // namespace redub::subtitles
