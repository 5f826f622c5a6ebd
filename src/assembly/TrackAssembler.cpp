// Repository: Redub
// Component: Track Assembler Implementation
// Copyright (c) 2026 Redub

#include "redub/assembly/TrackAssembler.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "redub/core/Errors.hpp"
#include "redub/media/LoudnessGain.hpp"
#include "redub/media/WavFile.hpp"
#include "redub/util/Logger.hpp"

namespace redub::assembly {

using core::AlignedClip;
using util::Logger;

namespace {

// Clips quieter than this are left as they are rather than boosted.
constexpr double kNormalizeFloorDbfs = -60.0;

void WriteText(const std::string& path, const std::string& content) {
  std::ofstream of(path, std::ios::out | std::ios::trunc);
  if (!of) throw core::IoError("TrackAssembler: cannot open " + path);
  of << content;
  of.flush();
  if (!of) throw core::IoError("TrackAssembler: write failed " + path);
}

}  // namespace

TrackAssembler::TrackAssembler(const core::AssemblyConfig& config,
                               const core::SubtitleConfig& subtitles)
    : config_(config), subtitles_(subtitles) {}

void TrackAssembler::CheckTimeline(const std::vector<AlignedClip>& clips) {
  for (size_t i = 0; i < clips.size(); ++i) {
    const AlignedClip& c = clips[i];
    if (c.final_end_ms < c.final_start_ms) {
      std::ostringstream oss;
      oss << "[TrackAssembler] NEGATIVE_CLIP segment_id=" << c.segment_id
          << " final=[" << c.final_start_ms << "," << c.final_end_ms << ")";
      throw core::SyncError(oss.str(), core::DubError::kOverlappingClips);
    }
    if (i > 0 && clips[i - 1].final_end_ms > c.final_start_ms) {
      std::ostringstream oss;
      oss << "[TrackAssembler] OVERLAP segment_id=" << clips[i - 1].segment_id
          << " final_end_ms=" << clips[i - 1].final_end_ms
          << " next_segment_id=" << c.segment_id
          << " next_final_start_ms=" << c.final_start_ms;
      throw core::SyncError(oss.str(), core::DubError::kOverlappingClips);
    }
  }
}

void TrackAssembler::Condition(float* samples, size_t speech_samples) const {
  if (speech_samples == 0) return;
  const double level = media::RmsDbfs(samples, speech_samples);
  if (level > kNormalizeFloorDbfs) {
    const double gain_db = media::NormalizationGainDb(level, config_.target_loudness_dbfs,
                                                      config_.max_gain_db);
    // 0 dB leaves the samples bit-exact.
    if (std::fabs(gain_db) > 1e-9) {
      media::ApplyGain(samples, speech_samples,
                       media::GainDbToLinear(static_cast<float>(gain_db)));
    }
  }
  const size_t fade = static_cast<size_t>(
      media::MsToSamples(config_.clip_fade_ms, config_.output_sample_rate));
  media::ApplyEdgeFades(samples, speech_samples, fade);
}

media::PcmBuffer TrackAssembler::Assemble(const std::vector<AlignedClip>& clips,
                                          int64_t input_duration_ms,
                                          const media::PcmBuffer* original) const {
  CheckTimeline(clips);

  const int rate = config_.output_sample_rate;
  int64_t total_ms = std::max<int64_t>(0, input_duration_ms);
  if (!clips.empty()) total_ms = std::max(total_ms, clips.back().final_end_ms);

  media::PcmBuffer track = media::MakeSilence(total_ms, rate);

  const bool bed = config_.keep_original_audio && original != nullptr && !original->empty();
  if (bed) {
    if (original->sample_rate != rate) {
      throw std::invalid_argument("TrackAssembler: original audio must be at the output rate");
    }
    const float gain = static_cast<float>(config_.original_audio_gain);
    const size_t n = std::min(track.size(), original->size());
    for (size_t i = 0; i < n; ++i) track.samples[i] = original->samples[i] * gain;
  }

  for (const AlignedClip& clip : clips) {
    if (clip.waveform.empty()) continue;
    if (clip.waveform.sample_rate != rate) {
      throw std::invalid_argument("TrackAssembler: clip " + std::to_string(clip.segment_id) +
                                  " is not at the output rate");
    }
    std::vector<float> samples = clip.waveform.samples;
    const size_t pad = static_cast<size_t>(media::MsToSamples(clip.pad_ms, rate));
    const size_t speech = samples.size() > pad ? samples.size() - pad : 0;
    Condition(samples.data(), speech);

    const size_t offset = static_cast<size_t>(media::MsToSamples(clip.final_start_ms, rate));
    const size_t end = std::min(track.size(), offset + samples.size());
    for (size_t i = offset; i < end; ++i) {
      track.samples[i] += samples[i - offset];
    }
  }

  if (bed) {
    for (float& s : track.samples) s = std::clamp(s, -1.0f, 1.0f);
  }

  std::ostringstream oss;
  oss << "[TrackAssembler] ASSEMBLED clips=" << clips.size()
      << " duration_ms=" << track.DurationMs()
      << " input_ms=" << input_duration_ms
      << " bed=" << (bed ? "on" : "off");
  Logger::Info(oss.str());
  return track;
}

AssemblyArtifacts TrackAssembler::WriteArtifacts(
    const std::string& dir, const media::PcmBuffer& track,
    const std::vector<subtitles::SubtitleCue>& cues) const {
  AssemblyArtifacts out;
  out.track_path = dir + "/" + kTrackFile;
  std::string error;
  if (!media::WriteWavMono16(out.track_path, track, &error)) {
    throw core::IoError("TrackAssembler: " + error);
  }
  if (subtitles_.write_srt) {
    out.srt_path = dir + "/" + kSrtFile;
    WriteText(out.srt_path, subtitles::SubtitleGenerator::RenderSrt(cues));
  }
  if (subtitles_.write_vtt) {
    out.vtt_path = dir + "/" + kVttFile;
    WriteText(out.vtt_path, subtitles::SubtitleGenerator::RenderVtt(cues));
  }
  Logger::Info("[TrackAssembler] ARTIFACTS track=" + out.track_path +
               " cues=" + std::to_string(cues.size()));
  return out;
}

}  // namespace redub::assembly
