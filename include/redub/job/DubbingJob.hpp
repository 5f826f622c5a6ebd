// Repository: Redub
// Component: Dubbing Job
// Purpose: Runs one dubbing job end to end: extract, segment, profile,
//          transcribe/translate/synthesize, align, caption, assemble, mux.
// Copyright (c) 2026 Redub

#ifndef REDUB_JOB_DUBBING_JOB_HPP_
#define REDUB_JOB_DUBBING_JOB_HPP_

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "redub/backend/SpeechBackend.hpp"
#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"
#include "redub/job/JobReport.hpp"
#include "redub/media/AudioExtractor.hpp"
#include "redub/media/PcmBuffer.hpp"
#include "redub/media/TimeStretcher.hpp"
#include "redub/mux/Muxer.hpp"
#include "redub/subtitles/SubtitleGenerator.hpp"

namespace redub::alignment {
class TimeAligner;
}

namespace redub::job {

class JobStore;

// DubbingJob
//
// Stage order (fatal errors stop the job at the stage that raised them):
//   1. Validate configuration                  ConfigError
//   2. Extract audio at the analysis rate      SegmentationError
//   3. Segment; persist segments.jsonl
//   4. Profile speech segments (worker pool)
//   5. Transcribe → translate → synthesize (worker pool)
//      strict: first failed segment aborts    Transcription/Translation/SynthesisError
//      lenient: failed segment becomes silence and a report entry
//   6. Align in timeline order; each clip is checkpointed before the next
//                                              SyncError
//   7. Captions and track assembly; write artifacts
//   8. Mux with the source video (when an output video is configured)
//                                              MuxError
//   9. Write job_report.json
//
// Run() never throws; the outcome is in the returned report.
// RequestCancel() may be called from any thread (e.g. a signal handler
// thread); it is honored between segments.
class DubbingJob {
 public:
  // Called after each clip is aligned and checkpointed.
  using ProgressCallback = std::function<void(const core::AlignedClip& clip, size_t aligned,
                                              size_t total)>;

  // |muxer| may be null when no output video is configured.
  DubbingJob(const core::JobConfig& config, std::shared_ptr<backend::ISpeechBackend> backend,
             std::shared_ptr<media::IAudioExtractor> extractor,
             std::shared_ptr<media::ITimeStretcher> stretcher,
             std::shared_ptr<mux::IMuxer> muxer = nullptr);
  ~DubbingJob();

  DubbingJob(const DubbingJob&) = delete;
  DubbingJob& operator=(const DubbingJob&) = delete;

  // Dub the media file at |input_path|.
  JobReport Run(const std::string& input_path);

  // Dub already-extracted audio (at the segmenter rate). |video_path| is
  // used for the mux step; empty skips it.
  JobReport Run(const media::PcmBuffer& audio, const std::string& video_path);

  void RequestCancel();
  bool cancel_requested() const { return cancel_.load(std::memory_order_acquire); }

  void SetProgressCallback(ProgressCallback cb) { progress_ = std::move(cb); }

  // Job id in use (derived from the start time when not configured).
  const std::string& job_id() const { return job_id_; }

  // Results of the last Run().
  const std::vector<core::SourceSegment>& Segments() const { return segments_; }
  const std::map<int32_t, core::SpeakerProfile>& Profiles() const { return profiles_; }
  const std::vector<core::AlignedClip>& AlignedClips() const { return aligned_; }
  const std::vector<subtitles::SubtitleCue>& Cues() const { return cues_; }
  const media::PcmBuffer& Track() const { return track_; }

 private:
  struct SynthesisResults {
    std::vector<core::SynthesizedClip> clips;      // Timeline order
    std::vector<core::TranslatedSegment> translations;
  };

  JobReport RunInternal(const media::PcmBuffer* audio, const std::string& input_path,
                        const std::string& video_path);
  void Execute(const media::PcmBuffer* preloaded, const std::string& input_path,
               const std::string& video_path, JobReport* report);

  void SegmentAudio(const media::PcmBuffer& audio, JobReport* report);
  void ProfileSegments(const media::PcmBuffer& audio);
  SynthesisResults ProcessSegments(const media::PcmBuffer& audio, JobReport* report);
  void AlignClips(const SynthesisResults& results, int64_t timeline_end_ms, JobReport* report);
  // Reloads the ledger prefix that matches |order| into aligned_ and
  // positions |aligner| after it. Drift warnings recorded for the restored
  // clips are appended to |warnings|. Returns the number of clips restored.
  size_t RestoreAlignment(const std::vector<int32_t>& order, alignment::TimeAligner* aligner,
                          std::vector<core::DriftWarning>* warnings);
  void AssembleOutputs(const media::PcmBuffer& audio, const SynthesisResults& results,
                       JobReport* report);
  void MuxOutputs(const std::string& video_path, JobReport* report);

  void ThrowIfCancelled(const char* stage) const;
  static std::string DefaultJobId();

  core::JobConfig config_;
  std::shared_ptr<backend::ISpeechBackend> backend_;
  std::shared_ptr<media::IAudioExtractor> extractor_;
  std::shared_ptr<media::ITimeStretcher> stretcher_;
  std::shared_ptr<mux::IMuxer> muxer_;
  ProgressCallback progress_;

  std::atomic<bool> cancel_{false};
  std::string job_id_;
  std::unique_ptr<JobStore> store_;

  std::vector<core::SourceSegment> segments_;
  std::map<int32_t, core::SpeakerProfile> profiles_;
  std::vector<core::AlignedClip> aligned_;
  std::vector<subtitles::SubtitleCue> cues_;
  media::PcmBuffer track_;
};

}  // namespace redub::job

#endif  // REDUB_JOB_DUBBING_JOB_HPP_
