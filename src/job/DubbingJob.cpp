// Repository: Redub
// Component: Dubbing Job Implementation
// Copyright (c) 2026 Redub

#include "redub/job/DubbingJob.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "redub/alignment/TimeAligner.hpp"
#include "redub/assembly/TrackAssembler.hpp"
#include "redub/core/ConfigValidator.hpp"
#include "redub/core/Errors.hpp"
#include "redub/job/JobStore.hpp"
#include "redub/pipeline/SegmentProcessor.hpp"
#include "redub/pipeline/WorkerPool.hpp"
#include "redub/profiling/SpeakerProfiler.hpp"
#include "redub/profiling/SpeakerSummary.hpp"
#include "redub/segmentation/Segmenter.hpp"
#include "redub/util/Logger.hpp"

namespace redub::job {

using core::DubError;
using util::Logger;

namespace {

int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

}  // namespace

DubbingJob::DubbingJob(const core::JobConfig& config,
                       std::shared_ptr<backend::ISpeechBackend> backend,
                       std::shared_ptr<media::IAudioExtractor> extractor,
                       std::shared_ptr<media::ITimeStretcher> stretcher,
                       std::shared_ptr<mux::IMuxer> muxer)
    : config_(config),
      backend_(std::move(backend)),
      extractor_(std::move(extractor)),
      stretcher_(std::move(stretcher)),
      muxer_(std::move(muxer)) {}

DubbingJob::~DubbingJob() = default;

void DubbingJob::RequestCancel() {
  if (!cancel_.exchange(true, std::memory_order_acq_rel)) {
    Logger::Warn("[DubbingJob] CANCEL_REQUESTED job_id=" + job_id_);
  }
}

void DubbingJob::ThrowIfCancelled(const char* stage) const {
  if (cancel_requested()) {
    throw core::DubException(DubError::kCancelled,
                             std::string("[DubbingJob] cancelled during ") + stage);
  }
}

std::string DubbingJob::DefaultJobId() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

JobReport DubbingJob::Run(const std::string& input_path) {
  return RunInternal(nullptr, input_path, input_path);
}

JobReport DubbingJob::Run(const media::PcmBuffer& audio, const std::string& video_path) {
  return RunInternal(&audio, video_path, video_path);
}

// =============================================================================
// RunInternal: maps every exit path onto the report
// =============================================================================

JobReport DubbingJob::RunInternal(const media::PcmBuffer* audio, const std::string& input_path,
                                  const std::string& video_path) {
  segments_.clear();
  profiles_.clear();
  aligned_.clear();
  cues_.clear();
  track_ = media::PcmBuffer{};
  store_.reset();
  job_id_ = config_.pipeline.job_id.empty() ? DefaultJobId() : config_.pipeline.job_id;

  JobReport report;
  report.job_id = job_id_;
  report.input_path = input_path;
  report.source_language = config_.pipeline.source_language;
  report.target_language = config_.pipeline.target_language;
  report.resumed = config_.pipeline.resume;

  const auto started = std::chrono::steady_clock::now();
  try {
    Execute(audio, input_path, video_path, &report);
    report.status = (report.failures.empty() && report.warnings.empty())
                        ? JobStatus::kCompleted
                        : JobStatus::kCompletedWithWarnings;
  } catch (const core::DubException& e) {
    report.error = e.error();
    report.detail = e.what();
    report.status =
        e.error() == DubError::kCancelled ? JobStatus::kCancelled : JobStatus::kFailed;
  } catch (const std::exception& e) {
    report.error = DubError::kNone;
    report.detail = e.what();
    report.status = JobStatus::kFailed;
  }

  std::ostringstream oss;
  oss << "[DubbingJob] JOB_DONE job_id=" << job_id_
      << " status=" << JobStatusName(report.status)
      << " error=" << core::DubErrorToString(report.error)
      << " aligned=" << report.aligned_count
      << " failures=" << report.failures.size()
      << " drift_warnings=" << report.warnings.size()
      << " cumulative_drift_ms=" << report.cumulative_drift_ms
      << " elapsed_ms=" << ElapsedMs(started)
      << " exit_code=" << report.ExitCode();
  if (report.succeeded() || report.status == JobStatus::kCancelled) {
    Logger::Info(oss.str());
  } else {
    Logger::Error(oss.str() + " detail=" + report.detail);
  }

  if (store_) {
    try {
      store_->WriteReport(report.ToJson());
    } catch (const core::IoError& e) {
      Logger::Error(std::string("[DubbingJob] REPORT_WRITE_FAILED ") + e.what());
    }
  }
  Logger::CloseLogFile();
  return report;
}

// =============================================================================
// Execute: stages 1..8
// =============================================================================

void DubbingJob::Execute(const media::PcmBuffer* preloaded, const std::string& input_path,
                         const std::string& video_path, JobReport* report) {
  // 1. Pre-flight
  core::ConfigValidator().ValidateOrThrow(config_);
  if (!backend_) throw core::ConfigError("speech backend not set");
  if (preloaded == nullptr && !extractor_) throw core::ConfigError("audio extractor not set");

  store_ = std::make_unique<JobStore>(config_.pipeline.work_root, job_id_);
  if (!Logger::OpenLogFile(store_->PathFor(JobStore::kLogFile))) {
    Logger::Warn("[DubbingJob] job log unavailable: " + store_->PathFor(JobStore::kLogFile));
  }
  {
    std::ostringstream oss;
    oss << "[DubbingJob] JOB_START job_id=" << job_id_
        << " input=" << input_path
        << " source_language=" << config_.pipeline.source_language
        << " target_language=" << config_.pipeline.target_language
        << " workers=" << config_.pipeline.worker_threads
        << " strict=" << (config_.pipeline.strict ? "true" : "false")
        << " resume=" << (config_.pipeline.resume ? "true" : "false")
        << " dir=" << store_->JobDir();
    Logger::Info(oss.str());
  }

  // 2. Extract
  media::PcmBuffer extracted;
  const media::PcmBuffer* audio = preloaded;
  if (audio == nullptr) {
    const auto t0 = std::chrono::steady_clock::now();
    extracted = extractor_->Extract(input_path, config_.segmenter.sample_rate);
    audio = &extracted;
    Logger::Info("[DubbingJob] EXTRACTED duration_ms=" + std::to_string(audio->DurationMs()) +
                 " elapsed_ms=" + std::to_string(ElapsedMs(t0)));
  }
  report->input_duration_ms = audio->DurationMs();

  // 3..4
  SegmentAudio(*audio, report);
  ThrowIfCancelled("segmentation");
  ProfileSegments(*audio);
  report->speakers = profiling::SummarizeSpeakers(segments_, profiles_);
  {
    std::ostringstream oss;
    oss << "[DubbingJob] SPEAKERS male=" << report->speakers.male.count
        << " female=" << report->speakers.female.count
        << " unknown=" << report->speakers.unknown.count
        << " voices=" << report->speakers.voices.size();
    Logger::Info(oss.str());
  }
  ThrowIfCancelled("profiling");

  // 5..6
  const SynthesisResults results = ProcessSegments(*audio, report);
  AlignClips(results, audio->DurationMs(), report);

  // 7..8
  AssembleOutputs(*audio, results, report);
  MuxOutputs(video_path, report);
}

void DubbingJob::SegmentAudio(const media::PcmBuffer& audio, JobReport* report) {
  bool loaded = false;
  if (config_.pipeline.resume && store_->LoadSegments(&segments_)) {
    // Stored segments are reused only if they still cover this input.
    loaded = !segments_.empty() && segments_.back().end_ms == audio.DurationMs();
    if (!loaded) {
      Logger::Warn("[DubbingJob] RESUME_SEGMENTS_STALE job_id=" + job_id_);
      segments_.clear();
    }
  }
  if (!loaded) {
    segmentation::Segmenter segmenter(config_.segmenter);
    segments_ = segmenter.Segment(audio);
    store_->SaveSegments(segments_);
  } else {
    Logger::Info("[DubbingJob] RESUME_SEGMENTS count=" + std::to_string(segments_.size()));
  }

  report->segment_count = segments_.size();
  report->speech_segment_count = 0;
  for (const auto& seg : segments_) {
    if (seg.is_speech) ++report->speech_segment_count;
  }
}

void DubbingJob::ProfileSegments(const media::PcmBuffer& audio) {
  const profiling::SpeakerProfiler profiler(config_);

  std::vector<const core::SourceSegment*> speech;
  for (const auto& seg : segments_) {
    if (seg.is_speech) speech.push_back(&seg);
  }
  std::vector<core::SpeakerProfile> results(speech.size());

  {
    pipeline::WorkerPool pool(config_.pipeline.worker_threads);
    for (size_t k = 0; k < speech.size(); ++k) {
      pool.Submit([this, &audio, &speech, &results, &profiler, k] {
        const core::SourceSegment& seg = *speech[k];
        const media::PcmBuffer slice = media::Slice(audio, seg.sample_begin, seg.sample_end);
        store_->SaveSourceAudio(seg.id, slice);
        results[k] = profiler.Profile(seg, slice);
        store_->SaveProfile(results[k]);
      });
    }
    pool.WaitIdle();
  }

  for (const auto& p : results) profiles_[p.segment_id] = p;
}

DubbingJob::SynthesisResults DubbingJob::ProcessSegments(const media::PcmBuffer& audio,
                                                         JobReport* report) {
  std::vector<const core::SourceSegment*> speech;
  for (const auto& seg : segments_) {
    if (seg.is_speech) speech.push_back(&seg);
  }

  pipeline::SegmentProcessor processor(config_, *backend_, store_.get());
  std::vector<pipeline::SegmentOutcome> outcomes(speech.size());
  std::vector<char> done(speech.size(), 0);
  std::atomic<bool> stop{false};
  const bool strict = config_.pipeline.strict;

  const auto t0 = std::chrono::steady_clock::now();
  {
    pipeline::WorkerPool pool(config_.pipeline.worker_threads);
    for (size_t k = 0; k < speech.size(); ++k) {
      pool.Submit([&, k] {
        if (cancel_requested() || stop.load(std::memory_order_acquire)) return;
        const core::SourceSegment& seg = *speech[k];
        pipeline::SegmentWork work;
        work.segment = seg;
        work.audio = media::Slice(audio, seg.sample_begin, seg.sample_end);
        work.profile = profiles_.at(seg.id);
        outcomes[k] = processor.Process(work);
        done[k] = 1;
        if (strict && !outcomes[k].ok) stop.store(true, std::memory_order_release);
      });
    }
    pool.WaitIdle();
  }
  report->cpu_fallback = processor.cpu_fallback_active();

  SynthesisResults results;
  size_t processed = 0;
  for (size_t k = 0; k < outcomes.size(); ++k) {
    if (!done[k]) continue;
    ++processed;
    pipeline::SegmentOutcome& outcome = outcomes[k];
    if (!outcome.ok) {
      const core::SegmentFailure& f = *outcome.failure;
      if (strict) {
        std::ostringstream oss;
        oss << "[DubbingJob] SEGMENT_FAILED segment_id=" << f.segment_id
            << " stage=" << core::SegmentStageName(f.stage)
            << " attempts=" << f.attempts << " detail=" << f.detail;
        switch (f.stage) {
          case core::SegmentStage::kTranscription:
            throw core::TranscriptionError(f.segment_id, oss.str());
          case core::SegmentStage::kTranslation:
            throw core::TranslationError(f.segment_id, oss.str());
          case core::SegmentStage::kSynthesis:
            throw core::SynthesisError(f.segment_id, oss.str());
        }
      }
      Logger::Warn("[DubbingJob] SEGMENT_SILENCED segment_id=" + std::to_string(f.segment_id) +
                   " stage=" + core::SegmentStageName(f.stage));
      report->failures.push_back(f);
      continue;
    }
    if (outcome.silent || !outcome.clip) {
      ++report->silent_segment_count;
      continue;
    }
    results.translations.push_back(outcome.translation);
    results.clips.push_back(std::move(*outcome.clip));
  }

  std::ostringstream oss;
  oss << "[DubbingJob] SYNTHESIZED speech=" << speech.size()
      << " processed=" << processed
      << " clips=" << results.clips.size()
      << " silent=" << report->silent_segment_count
      << " failed=" << report->failures.size()
      << " device=" << backend::ComputeDeviceName(processor.device())
      << " elapsed_ms=" << ElapsedMs(t0);
  Logger::Info(oss.str());

  ThrowIfCancelled("synthesis");
  return results;
}

// =============================================================================
// Alignment: single thread, timeline order
// =============================================================================

size_t DubbingJob::RestoreAlignment(const std::vector<int32_t>& order,
                                    alignment::TimeAligner* aligner,
                                    std::vector<core::DriftWarning>* warnings) {
  const std::vector<AlignmentRecord> records = store_->ReplayAlignment();
  size_t restored = 0;
  while (restored < records.size() && restored < order.size()) {
    const AlignmentRecord& rec = records[restored];
    if (rec.clip.segment_id != order[restored]) break;
    core::AlignedClip clip = rec.clip;
    if (!store_->LoadAlignedAudio(clip.segment_id, &clip.waveform)) break;
    if (clip.waveform.sample_rate != config_.assembly.output_sample_rate) break;
    aligned_.push_back(std::move(clip));
    if (rec.warning) warnings->push_back(*rec.warning);
    ++restored;
  }

  if (restored < records.size()) {
    // Ledger tail no longer matches this run; keep only the valid prefix.
    store_->ResetAlignment();
    for (size_t i = 0; i < restored; ++i) {
      store_->AppendAligned(aligned_[i], records[i].cumulative_drift_ms,
                            records[i].warning ? &*records[i].warning : nullptr);
    }
  }
  if (restored > 0) {
    aligner->Restore(records[restored - 1].clip.final_end_ms,
                     records[restored - 1].cumulative_drift_ms);
  }

  std::ostringstream oss;
  oss << "[DubbingJob] RESUME_ALIGNMENT restored=" << restored
      << " ledger=" << records.size()
      << " pending=" << (order.size() - restored)
      << " warnings=" << warnings->size();
  Logger::Info(oss.str());
  return restored;
}

void DubbingJob::AlignClips(const SynthesisResults& results, int64_t timeline_end_ms,
                            JobReport* report) {
  const std::vector<alignment::AlignmentSlot> all_slots =
      alignment::BuildSlots(segments_, profiles_, timeline_end_ms, config_.aligner);

  std::map<int32_t, const core::SynthesizedClip*> clip_by_id;
  for (const auto& c : results.clips) clip_by_id[c.segment_id] = &c;

  std::vector<std::pair<alignment::AlignmentSlot, const core::SynthesizedClip*>> work;
  std::vector<int32_t> order;
  for (const auto& slot : all_slots) {
    auto it = clip_by_id.find(slot.segment_id);
    if (it == clip_by_id.end()) continue;
    work.emplace_back(slot, it->second);
    order.push_back(slot.segment_id);
  }

  alignment::TimeAligner aligner(config_.aligner, config_.MinPauseMs(),
                                 config_.assembly.output_sample_rate, stretcher_.get());
  aligner.Begin();

  std::vector<core::DriftWarning> restored_warnings;
  size_t start = 0;
  if (config_.pipeline.resume) {
    start = RestoreAlignment(order, &aligner, &restored_warnings);
  } else {
    store_->ResetAlignment();
  }
  report->aligned_count = aligned_.size();

  // The aligner raises at most one warning per clip, before the sink runs.
  aligner.SetClipSink([this, &aligner](const core::AlignedClip& clip, int64_t drift_ms) {
    const auto& w = aligner.warnings();
    const bool warned = !w.empty() && w.back().segment_id == clip.segment_id;
    store_->AppendAligned(clip, drift_ms, warned ? &w.back() : nullptr);
  });

  const auto collect_warnings = [&]() {
    report->warnings = restored_warnings;
    report->warnings.insert(report->warnings.end(), aligner.warnings().begin(),
                            aligner.warnings().end());
    report->cumulative_drift_ms = aligner.cumulative_drift_ms();
  };

  try {
    for (size_t i = start; i < work.size(); ++i) {
      ThrowIfCancelled("alignment");
      aligned_.push_back(aligner.AlignNext(work[i].first, *work[i].second));
      report->aligned_count = aligned_.size();
      report->cumulative_drift_ms = aligner.cumulative_drift_ms();
      if (progress_) progress_(aligned_.back(), aligned_.size(), work.size());
    }
  } catch (const core::DubException&) {
    collect_warnings();
    throw;
  }

  aligner.Finish();
  collect_warnings();
}

// =============================================================================
// Outputs
// =============================================================================

void DubbingJob::AssembleOutputs(const media::PcmBuffer& audio, const SynthesisResults& results,
                                 JobReport* report) {
  const int out_rate = config_.assembly.output_sample_rate;

  subtitles::SubtitleGenerator captions(config_.subtitles);
  cues_ = captions.Generate(results.translations, aligned_);

  media::PcmBuffer resampled;
  const media::PcmBuffer* bed = nullptr;
  if (config_.assembly.keep_original_audio && !audio.empty()) {
    if (audio.sample_rate == out_rate) {
      bed = &audio;
    } else if (stretcher_) {
      resampled = stretcher_->Stretch(audio, 1.0, out_rate);
      bed = &resampled;
    } else {
      Logger::Warn("[DubbingJob] ORIGINAL_BED_SKIPPED no resampler for " +
                   std::to_string(audio.sample_rate) + " Hz");
    }
  }

  assembly::TrackAssembler assembler(config_.assembly, config_.subtitles);
  track_ = assembler.Assemble(aligned_, audio.DurationMs(), bed);
  const assembly::AssemblyArtifacts artifacts =
      assembler.WriteArtifacts(store_->JobDir(), track_, cues_);

  report->output_duration_ms = track_.DurationMs();
  report->track_path = artifacts.track_path;
  report->srt_path = artifacts.srt_path;
  report->vtt_path = artifacts.vtt_path;
}

void DubbingJob::MuxOutputs(const std::string& video_path, JobReport* report) {
  const std::string& output = config_.pipeline.output_video_path;
  if (output.empty() || video_path.empty()) return;
  if (!muxer_) throw core::MuxError("[DubbingJob] no muxer for output " + output);

  mux::MuxRequest request;
  request.video_path = video_path;
  request.audio_path = report->track_path;
  request.subtitle_path = report->srt_path;
  request.output_path = output;
  request.subtitle_mode = config_.mux.subtitle_mode;
  request.burn_style = config_.mux.burn_style;
  // The subtitles filter also reads WebVTT.
  if (request.subtitle_mode == core::SubtitleMode::kBurn && request.subtitle_path.empty()) {
    request.subtitle_path = report->vtt_path;
  }
  muxer_->Mux(request);
  report->output_video_path = output;
}

}  // namespace redub::job
