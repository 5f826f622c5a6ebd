// Repository: Redub
// Component: External Muxer Implementation
// Copyright (c) 2026 Redub

#include "redub/mux/Muxer.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include "redub/core/Errors.hpp"
#include "redub/util/Logger.hpp"

namespace redub::mux {

using core::SubtitleMode;
using util::Logger;

std::string BuildForceStyle(const core::BurnStyle& style) {
  std::string primary;
  std::string outline;
  if (!core::ToAssColour(style.primary_colour, &primary) ||
      !core::ToAssColour(style.outline_colour, &outline)) {
    throw core::MuxError("[Muxer] invalid subtitle colour");
  }
  std::ostringstream oss;
  oss << "FontName=" << style.font
      << ",FontSize=" << style.font_size
      << ",PrimaryColour=" << primary
      << ",OutlineColour=" << outline
      << ",BorderStyle=1"
      << ",Outline=" << style.outline
      << ",Shadow=" << style.shadow
      << ",Bold=" << (style.bold ? -1 : 0)
      << ",Italic=" << (style.italic ? -1 : 0)
      << ",Alignment=" << style.alignment
      << ",MarginV=" << style.margin_v
      << ",MarginL=" << style.margin_h
      << ",MarginR=" << style.margin_h;
  return oss.str();
}

std::string QuoteFilterValue(const std::string& value) {
  std::string escaped;
  for (char c : value) {
    if (c == '\\' || c == ':' || c == '\'') escaped += '\\';
    escaped += c;
  }
  std::string quoted = "'";
  for (char c : escaped) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

ExternalMuxer::ExternalMuxer(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path)) {}

std::vector<std::string> ExternalMuxer::BuildCommand(const MuxRequest& request) const {
  std::vector<std::string> argv = {ffmpeg_path_, "-hide_banner", "-loglevel", "error", "-y",
                                   "-i", request.video_path, "-i", request.audio_path};
  const bool has_subs =
      !request.subtitle_path.empty() && request.subtitle_mode != SubtitleMode::kNone;
  const bool soft = has_subs && request.subtitle_mode == SubtitleMode::kSoft;
  const bool burn = has_subs && request.subtitle_mode == SubtitleMode::kBurn;
  if (soft) {
    argv.push_back("-i");
    argv.push_back(request.subtitle_path);
  }
  argv.insert(argv.end(), {"-map", "0:v:0", "-map", "1:a:0"});
  if (soft) {
    argv.insert(argv.end(), {"-map", "2:s:0", "-c:s", "mov_text"});
  }
  if (burn) {
    argv.push_back("-vf");
    argv.push_back("subtitles=filename=" + QuoteFilterValue(request.subtitle_path) +
                   ":force_style=" + QuoteFilterValue(BuildForceStyle(request.burn_style)));
  }
  argv.insert(argv.end(), {"-c:v", "libx264", "-preset", "medium", "-crf", "23",
                           "-c:a", "aac", "-b:a", "192k", request.output_path});
  return argv;
}

void ExternalMuxer::Mux(const MuxRequest& request) {
  if (request.video_path.empty() || request.audio_path.empty() || request.output_path.empty()) {
    throw core::MuxError("[Muxer] incomplete request");
  }
  const std::vector<std::string> args = BuildCommand(request);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  {
    std::ostringstream oss;
    oss << "[Muxer] MUX_START video=" << request.video_path
        << " audio=" << request.audio_path
        << " subtitles=" << (request.subtitle_path.empty() ? "none" : request.subtitle_path)
        << " mode=" << core::SubtitleModeName(request.subtitle_mode)
        << " output=" << request.output_path;
    Logger::Info(oss.str());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    throw core::MuxError(std::string("[Muxer] fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    execvp(argv[0], argv.data());
    _exit(127);
  }

  int status = 0;
  pid_t waited = -1;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited < 0) {
    throw core::MuxError(std::string("[Muxer] waitpid failed: ") + std::strerror(errno));
  }

  if (WIFSIGNALED(status)) {
    std::ostringstream oss;
    oss << "[Muxer] MUX_FAILED signal=" << WTERMSIG(status) << " tool=" << ffmpeg_path_;
    Logger::Error(oss.str());
    throw core::MuxError(oss.str());
  }
  const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (code != 0) {
    std::ostringstream oss;
    oss << "[Muxer] MUX_FAILED exit_code=" << code << " tool=" << ffmpeg_path_;
    if (code == 127) oss << " (not found)";
    Logger::Error(oss.str());
    throw core::MuxError(oss.str());
  }
  Logger::Info("[Muxer] MUX_DONE output=" + request.output_path);
}

}  // namespace redub::mux
