// Repository: Redub
// Component: Job Store
// Purpose: Job-scoped working directory holding per-segment intermediate
//          artifacts and the append-only alignment ledger, so an interrupted
//          or failed job can be inspected and resumed.
// Copyright (c) 2026 Redub

#ifndef REDUB_JOB_JOB_STORE_HPP_
#define REDUB_JOB_JOB_STORE_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/media/PcmBuffer.hpp"

namespace redub::job {

// One alignment.jsonl line. The clip carries no waveform; it lives in
// seg_NNNN/aligned.wav. A clip that overran its rate range also carries the
// drift warning raised when it was placed.
struct AlignmentRecord {
  core::AlignedClip clip;
  int64_t cumulative_drift_ms = 0;
  std::optional<core::DriftWarning> warning;

  std::string ToJsonLine() const;
  // Returns false if the line is corrupt or incomplete.
  static bool FromJsonLine(const std::string& line, AlignmentRecord* out);
};

// Layout under <work_root>/<job_id>/:
//
//   segments.jsonl               one SourceSegment per line
//   seg_NNNN/source.wav          audio slice
//   seg_NNNN/transcript.json     TranscriptSegment (words in words.jsonl)
//   seg_NNNN/translation.json    TranslatedSegment
//   seg_NNNN/synth.wav + synth.json
//   seg_NNNN/aligned.wav
//   seg_NNNN/profile.json        SpeakerProfile
//   alignment.jsonl              append-only aligned-clip ledger
//   job_report.json              job summary
//   job.log                      job log file
//
// Single-file artifacts are written to a temporary name and renamed, so a
// present .json file always describes a complete artifact. Save* calls for
// different segments may run concurrently. I/O failures throw core::IoError.
class JobStore {
 public:
  static constexpr const char* kSegmentsFile = "segments.jsonl";
  static constexpr const char* kLedgerFile = "alignment.jsonl";
  static constexpr const char* kReportFile = "job_report.json";
  static constexpr const char* kLogFile = "job.log";

  // Creates work_root and the job directory (mkdir -p style).
  JobStore(const std::string& work_root, const std::string& job_id);

  JobStore(const JobStore&) = delete;
  JobStore& operator=(const JobStore&) = delete;

  const std::string& JobDir() const { return job_dir_; }
  std::string PathFor(const std::string& name) const;
  std::string SegmentDir(int32_t segment_id) const;

  void SaveSegments(const std::vector<core::SourceSegment>& segments);
  bool LoadSegments(std::vector<core::SourceSegment>* out) const;

  void SaveSourceAudio(int32_t segment_id, const media::PcmBuffer& audio);

  void SaveProfile(const core::SpeakerProfile& profile);
  bool LoadProfile(int32_t segment_id, core::SpeakerProfile* out) const;

  void SaveTranscript(const core::TranscriptSegment& transcript);
  bool LoadTranscript(int32_t segment_id, core::TranscriptSegment* out) const;

  void SaveTranslation(const core::TranslatedSegment& translation);
  bool LoadTranslation(int32_t segment_id, core::TranslatedSegment* out) const;

  void SaveSynthesis(const core::SynthesizedClip& clip);
  bool LoadSynthesis(int32_t segment_id, core::SynthesizedClip* out) const;

  // Writes aligned.wav, then appends the ledger line.
  void AppendAligned(const core::AlignedClip& clip, int64_t cumulative_drift_ms,
                     const core::DriftWarning* warning = nullptr);

  // Ledger records in file order. A corrupt or truncated line is skipped.
  std::vector<AlignmentRecord> ReplayAlignment() const;
  bool LoadAlignedAudio(int32_t segment_id, media::PcmBuffer* out) const;

  // Empties the ledger (fresh, non-resumed run).
  void ResetAlignment();

  void WriteReport(const std::string& json);

 private:
  void EnsureDir(const std::string& path) const;
  void WriteFileAtomic(const std::string& path, const std::string& content) const;
  void WriteWavAtomic(const std::string& path, const media::PcmBuffer& audio) const;
  static bool ReadFile(const std::string& path, std::string* out);

  std::string work_root_;
  std::string job_dir_;
  std::mutex ledger_mutex_;
};

}  // namespace redub::job

#endif  // REDUB_JOB_JOB_STORE_HPP_
