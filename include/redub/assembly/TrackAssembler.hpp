// Repository: Redub
// Component: Track Assembler
// Purpose: Concatenates aligned clips and the silence between them into the
//          continuous dubbed track, and writes the track and caption
//          artifacts handed to the external mux step.
// Copyright (c) 2026 Redub

#ifndef REDUB_ASSEMBLY_TRACK_ASSEMBLER_HPP_
#define REDUB_ASSEMBLY_TRACK_ASSEMBLER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/media/PcmBuffer.hpp"
#include "redub/subtitles/SubtitleGenerator.hpp"

namespace redub::assembly {

struct AssemblyArtifacts {
  std::string track_path;  // dubbed_track.wav
  std::string srt_path;    // Empty when not written
  std::string vtt_path;
};

class TrackAssembler {
 public:
  static constexpr const char* kTrackFile = "dubbed_track.wav";
  static constexpr const char* kSrtFile = "captions.srt";
  static constexpr const char* kVttFile = "captions.vtt";

  TrackAssembler(const core::AssemblyConfig& config, const core::SubtitleConfig& subtitles);

  // Track of max(input_duration_ms, last final_end_ms) at the output rate.
  // Each clip's speech part (the waveform less its trailing pad) is loudness
  // normalized and faded at both edges. With keep_original_audio and a
  // non-null |original| (at the output rate), the source audio is mixed
  // underneath at original_audio_gain.
  // Throws core::SyncError (kOverlappingClips) for overlapping or
  // out-of-order clips.
  media::PcmBuffer Assemble(const std::vector<core::AlignedClip>& clips,
                            int64_t input_duration_ms,
                            const media::PcmBuffer* original = nullptr) const;

  // Writes the track and the enabled caption formats into |dir|.
  // Throws core::IoError.
  AssemblyArtifacts WriteArtifacts(const std::string& dir, const media::PcmBuffer& track,
                                   const std::vector<subtitles::SubtitleCue>& cues) const;

  // Throws core::SyncError unless final_end[i] <= final_start[i+1] for all i.
  static void CheckTimeline(const std::vector<core::AlignedClip>& clips);

 private:
  // Gain and fades on the speech part of one clip, in place.
  void Condition(float* samples, size_t speech_samples) const;

  core::AssemblyConfig config_;
  core::SubtitleConfig subtitles_;
};

}  // namespace redub::assembly

#endif  // REDUB_ASSEMBLY_TRACK_ASSEMBLER_HPP_
