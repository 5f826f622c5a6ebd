// Repository: Redub
// Component: Segment Processor Implementation
// Copyright (c) 2026 Redub

#include "redub/pipeline/SegmentProcessor.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

#include "redub/job/JobStore.hpp"
#include "redub/util/Logger.hpp"

namespace redub::pipeline {

using backend::BackendStatus;
using backend::BackendStatusToString;
using backend::CallOptions;
using backend::ComputeDevice;
using core::DubError;
using core::SegmentStage;
using util::Logger;

namespace {

bool IsBlank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

SegmentProcessor::SegmentProcessor(const core::JobConfig& config,
                                   backend::ISpeechBackend& backend,
                                   job::JobStore* store, SleepFn sleep)
    : config_(config),
      backend_(backend),
      store_(store),
      sleep_(std::move(sleep)),
      retry_(backend::RetryPolicy::FromConfig(config.pipeline)) {
  if (!sleep_) {
    sleep_ = [](int64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
  }
  default_voice_ = config_.synthesis.default_voice.empty()
      ? core::BuiltinVoice(config_.pipeline.target_language, false)
      : config_.synthesis.default_voice;
}

ComputeDevice SegmentProcessor::device() const {
  return cpu_fallback_active() ? ComputeDevice::kCpu : ComputeDevice::kAccelerator;
}

template <typename Result, typename Call>
Result SegmentProcessor::CallWithRetry(const char* method, int32_t segment_id, Call&& call,
                                       int* attempts) {
  Result result;
  int attempt = 0;
  while (true) {
    CallOptions options;
    options.job_id = config_.pipeline.job_id;
    options.timeout_ms = config_.pipeline.call_timeout_ms;
    options.device = device();

    ++attempt;
    result = call(options);
    if (result.status == BackendStatus::kOk) break;

    if (result.status == BackendStatus::kAcceleratorUnavailable) {
      if (options.device == ComputeDevice::kAccelerator) {
        if (!cpu_fallback_.exchange(true, std::memory_order_acq_rel)) {
          std::ostringstream oss;
          oss << "[SegmentProcessor] CPU_FALLBACK segment_id=" << segment_id
              << " method=" << method << " detail=" << result.detail;
          Logger::Warn(oss.str());
        }
        --attempt;
        continue;
      }
      // Already on CPU; nothing left to fall back to.
      break;
    }

    if (!backend::RetryPolicy::IsRetryable(result.status) || attempt >= retry_.max_attempts) {
      break;
    }

    const int64_t backoff_ms = retry_.BackoffBeforeAttempt(attempt + 1);
    std::ostringstream oss;
    oss << "[SegmentProcessor] RETRY segment_id=" << segment_id
        << " method=" << method
        << " attempt=" << attempt << "/" << retry_.max_attempts
        << " status=" << BackendStatusToString(result.status)
        << " backoff_ms=" << backoff_ms;
    Logger::Warn(oss.str());
    sleep_(backoff_ms);
  }
  *attempts = attempt;
  return result;
}

void SegmentProcessor::Fail(SegmentOutcome* outcome, SegmentStage stage, DubError error,
                            int attempts, const std::string& detail) const {
  core::SegmentFailure f;
  f.segment_id = outcome->segment_id;
  f.stage = stage;
  f.error = error;
  f.attempts = attempts;
  f.detail = detail;
  outcome->ok = false;
  outcome->failure = f;

  std::ostringstream oss;
  oss << "[SegmentProcessor] SEGMENT_FAILED segment_id=" << f.segment_id
      << " stage=" << core::SegmentStageName(stage)
      << " error=" << core::DubErrorToString(error)
      << " attempts=" << attempts
      << " detail=" << detail;
  Logger::Error(oss.str());
}

bool SegmentProcessor::Transcribe(const SegmentWork& work, SegmentOutcome* outcome) {
  const int32_t id = work.segment.id;
  if (store_ && config_.pipeline.resume && store_->LoadTranscript(id, &outcome->transcript)) {
    Logger::Debug("[SegmentProcessor] RESUME transcript segment_id=" + std::to_string(id));
    return true;
  }

  backend::TranscriptionRequest request;
  request.segment_id = id;
  request.audio = work.audio;
  request.language = config_.pipeline.source_language;

  int attempts = 0;
  backend::TranscriptionResult result = CallWithRetry<backend::TranscriptionResult>(
      "Transcribe", id,
      [&](const CallOptions& options) { return backend_.Transcribe(request, options); },
      &attempts);
  if (result.status != BackendStatus::kOk) {
    Fail(outcome, SegmentStage::kTranscription, DubError::kTranscriptionFailed, attempts,
         std::string(BackendStatusToString(result.status)) + ": " + result.detail);
    return false;
  }

  core::TranscriptSegment& t = outcome->transcript;
  t.segment_id = id;
  t.text = result.text;
  t.confidence = std::clamp(result.confidence, 0.0, 1.0);
  t.words.clear();
  for (const auto& w : result.words) {
    core::WordTiming abs = w;
    abs.start_ms += work.segment.start_ms;
    abs.end_ms += work.segment.start_ms;
    t.words.push_back(std::move(abs));
  }
  if (store_) store_->SaveTranscript(t);
  return true;
}

bool SegmentProcessor::Translate(const SegmentWork& work, SegmentOutcome* outcome) {
  const int32_t id = work.segment.id;
  const std::string& target = config_.pipeline.target_language;
  if (store_ && config_.pipeline.resume && store_->LoadTranslation(id, &outcome->translation)) {
    Logger::Debug("[SegmentProcessor] RESUME translation segment_id=" + std::to_string(id));
    return true;
  }

  core::TranslatedSegment& tr = outcome->translation;
  tr.segment_id = id;
  tr.target_language = target;

  if (config_.pipeline.source_language == target) {
    tr.translated_text = outcome->transcript.text;
  } else {
    backend::TranslationRequest request;
    request.segment_id = id;
    request.text = outcome->transcript.text;
    request.source_language = config_.pipeline.source_language;
    request.target_language = target;

    int attempts = 0;
    backend::TranslationResult result = CallWithRetry<backend::TranslationResult>(
        "Translate", id,
        [&](const CallOptions& options) { return backend_.Translate(request, options); },
        &attempts);
    if (result.status != BackendStatus::kOk) {
      Fail(outcome, SegmentStage::kTranslation, DubError::kTranslationFailed, attempts,
           std::string(BackendStatusToString(result.status)) + ": " + result.detail);
      return false;
    }
    tr.translated_text = result.translated_text;
  }
  if (store_) store_->SaveTranslation(tr);
  return true;
}

bool SegmentProcessor::Synthesize(const SegmentWork& work, SegmentOutcome* outcome) {
  const int32_t id = work.segment.id;
  core::SynthesizedClip stored;
  if (store_ && config_.pipeline.resume && store_->LoadSynthesis(id, &stored)) {
    Logger::Debug("[SegmentProcessor] RESUME synthesis segment_id=" + std::to_string(id));
    outcome->clip = std::move(stored);
    return true;
  }

  backend::SynthesisRequest request;
  request.segment_id = id;
  request.text = outcome->translation.translated_text;
  request.voice_id = work.profile.voice_id.empty() ? default_voice_ : work.profile.voice_id;
  request.rate = config_.synthesis.default_rate;
  request.volume = work.profile.volume;
  request.pitch_shift_hz = work.profile.pitch_shift_hz;
  request.sample_rate = config_.synthesis.sample_rate;

  auto synthesize = [&](const CallOptions& options) {
    backend::SynthesisResult r = backend_.Synthesize(request, options);
    if (r.status == BackendStatus::kOk && r.waveform.empty()) {
      r.status = BackendStatus::kTransientError;
      r.detail = "empty waveform";
    }
    return r;
  };

  int attempts = 0;
  backend::SynthesisResult result =
      CallWithRetry<backend::SynthesisResult>("Synthesize", id, synthesize, &attempts);

  bool used_fallback = false;
  if (result.status != BackendStatus::kOk && request.voice_id != default_voice_ &&
      !default_voice_.empty()) {
    std::ostringstream oss;
    oss << "[SegmentProcessor] VOICE_FALLBACK segment_id=" << id
        << " voice=" << request.voice_id
        << " fallback=" << default_voice_
        << " status=" << BackendStatusToString(result.status);
    Logger::Warn(oss.str());

    request.voice_id = default_voice_;
    int fallback_attempts = 0;
    result = CallWithRetry<backend::SynthesisResult>("Synthesize", id, synthesize,
                                                     &fallback_attempts);
    attempts += fallback_attempts;
    used_fallback = true;
  }

  if (result.status != BackendStatus::kOk) {
    Fail(outcome, SegmentStage::kSynthesis, DubError::kSynthesisFailed, attempts,
         std::string(BackendStatusToString(result.status)) + ": " + result.detail);
    return false;
  }

  core::SynthesizedClip clip;
  clip.segment_id = id;
  clip.waveform = std::move(result.waveform);
  clip.voice_id = request.voice_id;
  clip.used_fallback_voice = used_fallback;
  if (store_) store_->SaveSynthesis(clip);
  outcome->clip = std::move(clip);
  return true;
}

SegmentOutcome SegmentProcessor::Process(const SegmentWork& work) {
  SegmentOutcome outcome;
  outcome.segment_id = work.segment.id;

  if (!Transcribe(work, &outcome)) return outcome;
  if (IsBlank(outcome.transcript.text)) {
    outcome.ok = true;
    outcome.silent = true;
    Logger::Info("[SegmentProcessor] SEGMENT_SILENT segment_id=" + std::to_string(work.segment.id) +
                 " reason=empty_transcript");
    return outcome;
  }

  if (!Translate(work, &outcome)) return outcome;
  if (IsBlank(outcome.translation.translated_text)) {
    outcome.ok = true;
    outcome.silent = true;
    Logger::Info("[SegmentProcessor] SEGMENT_SILENT segment_id=" + std::to_string(work.segment.id) +
                 " reason=empty_translation");
    return outcome;
  }

  if (!Synthesize(work, &outcome)) return outcome;
  outcome.ok = true;

  std::ostringstream oss;
  oss << "[SegmentProcessor] SEGMENT_DONE segment_id=" << work.segment.id
      << " source_ms=" << work.segment.duration_ms()
      << " synth_ms=" << outcome.clip->duration_ms()
      << " voice=" << outcome.clip->voice_id
      << " device=" << backend::ComputeDeviceName(device());
  Logger::Info(oss.str());
  return outcome;
}

}  // namespace redub::pipeline
