// Repository: Redub
// Component: Job Report
// Purpose: Structured summary of one dubbing job: outcome, counts, every
//          failed or drift-warned segment, and artifact paths.
// Copyright (c) 2026 Redub

#ifndef REDUB_JOB_JOB_REPORT_HPP_
#define REDUB_JOB_JOB_REPORT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/profiling/SpeakerSummary.hpp"

namespace redub::job {

enum class JobStatus {
  kCompleted,
  kCompletedWithWarnings,
  kFailed,
  kCancelled,
};

const char* JobStatusName(JobStatus status);

// Process exit codes.
constexpr int kExitOk = 0;
constexpr int kExitOther = 1;
constexpr int kExitConfig = 2;
constexpr int kExitSegmentation = 3;
constexpr int kExitSegmentFailure = 4;
constexpr int kExitSync = 5;
constexpr int kExitMux = 6;
constexpr int kExitCancelled = 7;

struct JobReport {
  std::string job_id;
  std::string input_path;
  std::string source_language;
  std::string target_language;

  JobStatus status = JobStatus::kCompleted;
  core::DubError error = core::DubError::kNone;  // Fatal condition, if any
  std::string detail;

  int64_t input_duration_ms = 0;
  int64_t output_duration_ms = 0;
  size_t segment_count = 0;
  size_t speech_segment_count = 0;
  size_t silent_segment_count = 0;  // Nothing to say (empty transcript)
  size_t aligned_count = 0;
  int64_t cumulative_drift_ms = 0;
  bool cpu_fallback = false;
  bool resumed = false;

  std::vector<core::SegmentFailure> failures;
  std::vector<core::DriftWarning> warnings;
  profiling::SpeakerSummary speakers;

  std::string track_path;
  std::string srt_path;
  std::string vtt_path;
  std::string output_video_path;

  bool succeeded() const {
    return status == JobStatus::kCompleted || status == JobStatus::kCompletedWithWarnings;
  }

  int ExitCode() const;

  // One JSON object, written to job_report.json.
  std::string ToJson() const;
};

// Exit code for a job that stopped with |error|.
int ExitCodeForError(core::DubError error);

}  // namespace redub::job

#endif  // REDUB_JOB_JOB_REPORT_HPP_
