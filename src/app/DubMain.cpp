// Repository: Redub
// Component: redub_dub Command Line
// Purpose: Dubs one media file into the target language through a remote
//          speech backend and prints the job report.
// Copyright (c) 2026 Redub
//
// Exit codes: 0 completed, 1 other failure, 2 config, 3 unreadable audio,
// 4 segment failure (strict), 5 sync, 6 mux, 7 cancelled.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "redub/backend/GrpcSpeechBackend.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/job/DubbingJob.hpp"
#include "redub/job/JobReport.hpp"
#include "redub/media/AudioExtractor.hpp"
#include "redub/media/TimeStretcher.hpp"
#include "redub/mux/Muxer.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string input_path;
  std::string config_path;
  std::string source_language;
  std::string target_language;
  std::string work_root;
  std::string job_id;
  std::string backend_address;
  std::string output_video_path;
  std::string ffmpeg_path;
  std::string subtitle_mode;
  std::string subtitle_style;
  int workers = -1;
  bool strict = false;
  bool resume = false;
  bool keep_original = false;
  bool help = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --input PATH [OPTIONS]\n"
            << "\n"
            << "Options:\n"
            << "  --input PATH         Source media file (required)\n"
            << "  --config PATH        Job configuration (flat JSON object)\n"
            << "  --source-lang CODE   Spoken language of the input (default: en)\n"
            << "  --target-lang CODE   Dubbing language (default: az)\n"
            << "  --work-root DIR      Parent of the job directory (default: redub_work)\n"
            << "  --job-id ID          Job directory name (default: UTC start time)\n"
            << "  --backend ADDR       Speech backend host:port (default: localhost:50061)\n"
            << "  --output-video PATH  Mux the dubbed track and captions into PATH\n"
            << "  --ffmpeg PATH        ffmpeg executable used for muxing\n"
            << "  --subtitles MODE     soft (caption stream), burn (into the picture) or none\n"
            << "  --subtitle-style S   Burned caption preset: default, modern or classic\n"
            << "  --workers N          Concurrent segment workers\n"
            << "  --strict             Abort on the first failed segment\n"
            << "  --resume             Reuse artifacts of an earlier run with the same job id\n"
            << "  --keep-original      Mix the original audio under the dub\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "Settings are applied in order: defaults, --config file, flags.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return args;
    } else if (arg == "--input" && i + 1 < argc) {
      args.input_path = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--source-lang" && i + 1 < argc) {
      args.source_language = argv[++i];
    } else if (arg == "--target-lang" && i + 1 < argc) {
      args.target_language = argv[++i];
    } else if (arg == "--work-root" && i + 1 < argc) {
      args.work_root = argv[++i];
    } else if (arg == "--job-id" && i + 1 < argc) {
      args.job_id = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      args.backend_address = argv[++i];
    } else if (arg == "--output-video" && i + 1 < argc) {
      args.output_video_path = argv[++i];
    } else if (arg == "--ffmpeg" && i + 1 < argc) {
      args.ffmpeg_path = argv[++i];
    } else if (arg == "--subtitles" && i + 1 < argc) {
      args.subtitle_mode = argv[++i];
      redub::core::SubtitleMode mode;
      if (!redub::core::ParseSubtitleMode(args.subtitle_mode, &mode)) {
        args.error = "--subtitles expects soft, burn or none";
        return args;
      }
    } else if (arg == "--subtitle-style" && i + 1 < argc) {
      args.subtitle_style = argv[++i];
      redub::core::BurnStyle style;
      if (!redub::core::BurnStylePreset(args.subtitle_style, &style)) {
        args.error = "--subtitle-style expects default, modern or classic";
        return args;
      }
    } else if (arg == "--workers" && i + 1 < argc) {
      try {
        args.workers = std::stoi(argv[++i]);
      } catch (const std::exception&) {
        args.error = "--workers expects an integer";
        return args;
      }
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "--resume") {
      args.resume = true;
    } else if (arg == "--keep-original") {
      args.keep_original = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }
  if (args.input_path.empty()) {
    args.error = "--input is required";
  } else if (args.resume && args.job_id.empty()) {
    args.error = "--resume requires --job-id";
  }
  return args;
}

// Flags override the config file.
void ApplyOverrides(const CliArgs& args, redub::core::JobConfig* config) {
  auto& p = config->pipeline;
  if (!args.source_language.empty()) p.source_language = args.source_language;
  if (!args.target_language.empty()) p.target_language = args.target_language;
  if (!args.work_root.empty()) p.work_root = args.work_root;
  if (!args.job_id.empty()) p.job_id = args.job_id;
  if (!args.backend_address.empty()) p.backend_address = args.backend_address;
  if (!args.output_video_path.empty()) p.output_video_path = args.output_video_path;
  if (!args.ffmpeg_path.empty()) p.ffmpeg_path = args.ffmpeg_path;
  if (args.workers >= 0) p.worker_threads = static_cast<size_t>(args.workers);
  if (args.strict) p.strict = true;
  if (args.resume) p.resume = true;
  if (args.keep_original) config->assembly.keep_original_audio = true;
  // Both were checked in ParseArgs.
  if (!args.subtitle_mode.empty()) {
    redub::core::ParseSubtitleMode(args.subtitle_mode, &config->mux.subtitle_mode);
  }
  if (!args.subtitle_style.empty()) {
    redub::core::BurnStylePreset(args.subtitle_style, &config->mux.burn_style);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return redub::job::kExitConfig;
  }

  redub::core::JobConfig config;
  if (!args.config_path.empty()) {
    std::string error;
    if (!redub::core::LoadJobConfigFile(args.config_path, &config, &error)) {
      std::cerr << "Error: " << error << "\n";
      return redub::job::kExitConfig;
    }
  }
  ApplyOverrides(args, &config);

  auto backend = std::make_shared<redub::backend::GrpcSpeechBackend>(
      config.pipeline.backend_address);
  auto extractor = std::make_shared<redub::media::FFmpegAudioExtractor>();
  auto stretcher = std::make_shared<redub::media::FFmpegTimeStretcher>();
  auto muxer = std::make_shared<redub::mux::ExternalMuxer>(config.pipeline.ffmpeg_path);

  redub::job::DubbingJob job(config, backend, extractor, stretcher, muxer);
  job.SetProgressCallback([](const redub::core::AlignedClip& clip, size_t aligned, size_t total) {
    std::cout << "[redub] aligned " << aligned << "/" << total
              << " segment_id=" << clip.segment_id << "\n";
  });

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // The handler only sets a flag; this thread forwards it to the job.
  std::atomic<bool> finished{false};
  std::thread watcher([&job, &finished] {
    while (!finished.load(std::memory_order_acquire)) {
      if (g_termination_requested.load(std::memory_order_acquire)) {
        job.RequestCancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  const redub::job::JobReport report = job.Run(args.input_path);
  finished.store(true, std::memory_order_release);
  watcher.join();

  std::cout << report.ToJson() << std::endl;
  return report.ExitCode();
}
