// Repository: Redub
// Component: Job Report Implementation
// Copyright (c) 2026 Redub

#include "redub/job/JobReport.hpp"

#include <sstream>

#include "redub/core/FlatJson.hpp"

namespace redub::job {

using core::DubError;
using core::JsonObjectWriter;

const char* JobStatusName(JobStatus status) {
  switch (status) {
    case JobStatus::kCompleted: return "completed";
    case JobStatus::kCompletedWithWarnings: return "completed_with_warnings";
    case JobStatus::kFailed: return "failed";
    case JobStatus::kCancelled: return "cancelled";
  }
  return "unknown";
}

int ExitCodeForError(DubError error) {
  switch (error) {
    case DubError::kNone:
      return kExitOk;
    case DubError::kConfigInvalid:
    case DubError::kSampleRateMismatch:
      return kExitConfig;
    case DubError::kAudioUnreadable:
      return kExitSegmentation;
    case DubError::kTranscriptionFailed:
    case DubError::kTranslationFailed:
    case DubError::kSynthesisFailed:
      return kExitSegmentFailure;
    case DubError::kDriftExceeded:
    case DubError::kOverlappingClips:
      return kExitSync;
    case DubError::kMuxFailed:
      return kExitMux;
    case DubError::kCancelled:
      return kExitCancelled;
    case DubError::kIoError:
      return kExitOther;
  }
  return kExitOther;
}

int JobReport::ExitCode() const {
  switch (status) {
    case JobStatus::kCompleted:
    case JobStatus::kCompletedWithWarnings:
      return kExitOk;
    case JobStatus::kCancelled:
      return kExitCancelled;
    case JobStatus::kFailed: {
      const int code = ExitCodeForError(error);
      return code == kExitOk ? kExitOther : code;
    }
  }
  return kExitOther;
}

namespace {

std::string FailuresJson(const std::vector<core::SegmentFailure>& failures) {
  std::ostringstream o;
  o << "[";
  for (size_t i = 0; i < failures.size(); ++i) {
    const auto& f = failures[i];
    JsonObjectWriter w;
    w.Add("segment_id", f.segment_id)
        .Add("stage", core::SegmentStageName(f.stage))
        .Add("error", core::DubErrorToString(f.error))
        .Add("attempts", static_cast<int32_t>(f.attempts))
        .Add("detail", f.detail);
    if (i > 0) o << ",";
    o << w.str();
  }
  o << "]";
  return o.str();
}

std::string WarningsJson(const std::vector<core::DriftWarning>& warnings) {
  std::ostringstream o;
  o << "[";
  for (size_t i = 0; i < warnings.size(); ++i) {
    const auto& d = warnings[i];
    JsonObjectWriter w;
    w.Add("segment_id", d.segment_id)
        .Add("kind", core::DriftKindName(d.kind))
        .Add("required_rate", d.required_rate)
        .Add("applied_rate", d.applied_rate)
        .Add("overflow_ms", d.overflow_ms)
        .Add("absorbed_ms", d.absorbed_ms)
        .Add("shift_ms", d.shift_ms)
        .Add("cumulative_drift_ms", d.cumulative_drift_ms);
    if (i > 0) o << ",";
    o << w.str();
  }
  o << "]";
  return o.str();
}

}  // namespace

std::string JobReport::ToJson() const {
  JsonObjectWriter w;
  w.Add("job_id", job_id)
      .Add("input", input_path)
      .Add("source_language", source_language)
      .Add("target_language", target_language)
      .Add("status", JobStatusName(status))
      .Add("error", core::DubErrorToString(error))
      .Add("detail", detail)
      .Add("exit_code", static_cast<int32_t>(ExitCode()))
      .Add("input_duration_ms", input_duration_ms)
      .Add("output_duration_ms", output_duration_ms)
      .Add("segment_count", static_cast<uint64_t>(segment_count))
      .Add("speech_segment_count", static_cast<uint64_t>(speech_segment_count))
      .Add("silent_segment_count", static_cast<uint64_t>(silent_segment_count))
      .Add("aligned_count", static_cast<uint64_t>(aligned_count))
      .Add("cumulative_drift_ms", cumulative_drift_ms)
      .Add("cpu_fallback", cpu_fallback)
      .Add("resumed", resumed)
      .AddRaw("failures", FailuresJson(failures))
      .AddRaw("drift_warnings", WarningsJson(warnings))
      .AddRaw("speakers", speakers.ToJson())
      .Add("track_path", track_path)
      .Add("srt_path", srt_path)
      .Add("vtt_path", vtt_path)
      .Add("output_video_path", output_video_path);
  return w.str();
}

}  // namespace redub::job
