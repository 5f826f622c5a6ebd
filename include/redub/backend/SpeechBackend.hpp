// Repository: Redub
// Component: Speech Backend Interface
// Purpose: Abstract transcribe/translate/synthesize capability used by the
//          segment processor. Calls return a status instead of throwing.
// Copyright (c) 2026 Redub

#ifndef REDUB_BACKEND_SPEECH_BACKEND_HPP_
#define REDUB_BACKEND_SPEECH_BACKEND_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "redub/core/DubTypes.hpp"
#include "redub/media/PcmBuffer.hpp"

namespace redub::backend {

enum class BackendStatus {
  kOk,
  kTimeout,                 // Per-call deadline exceeded; retryable
  kTransientError,          // Retryable inference/service error
  kAcceleratorUnavailable,  // Retry on CPU without consuming an attempt
  kPermanentError,          // Not retried
};

const char* BackendStatusToString(BackendStatus status);

enum class ComputeDevice {
  kAccelerator,
  kCpu,
};

const char* ComputeDeviceName(ComputeDevice device);

struct CallOptions {
  std::string job_id;
  int64_t timeout_ms = 60000;
  ComputeDevice device = ComputeDevice::kAccelerator;
};

struct TranscriptionRequest {
  int32_t segment_id = 0;
  media::PcmBuffer audio;
  std::string language;
};

struct TranscriptionResult {
  BackendStatus status = BackendStatus::kOk;
  std::string detail;
  std::string text;
  std::vector<core::WordTiming> words;  // Relative to the chunk start
  double confidence = 0.0;
};

struct TranslationRequest {
  int32_t segment_id = 0;
  std::string text;
  std::string source_language;
  std::string target_language;
};

struct TranslationResult {
  BackendStatus status = BackendStatus::kOk;
  std::string detail;
  std::string translated_text;
};

struct SynthesisRequest {
  int32_t segment_id = 0;
  std::string text;
  std::string voice_id;
  double rate = 1.0;
  double volume = 1.0;
  int pitch_shift_hz = 0;
  int sample_rate = 16000;
};

struct SynthesisResult {
  BackendStatus status = BackendStatus::kOk;
  std::string detail;
  media::PcmBuffer waveform;
};

// Implementations must be safe to call concurrently from pool workers.
class ISpeechBackend {
 public:
  virtual ~ISpeechBackend() = default;

  virtual TranscriptionResult Transcribe(const TranscriptionRequest& request,
                                         const CallOptions& options) = 0;
  virtual TranslationResult Translate(const TranslationRequest& request,
                                      const CallOptions& options) = 0;
  virtual SynthesisResult Synthesize(const SynthesisRequest& request,
                                     const CallOptions& options) = 0;
};

}  // namespace redub::backend

#endif  // REDUB_BACKEND_SPEECH_BACKEND_HPP_
