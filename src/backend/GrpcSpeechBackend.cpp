// Repository: Redub
// Component: gRPC speech backend client implementation
// Copyright (c) 2026 Redub

#include "redub/backend/GrpcSpeechBackend.hpp"

#include <chrono>
#include <sstream>

#include "redub/util/Logger.hpp"

namespace redub::backend {

namespace proto = redub::backend::v1;
using util::Logger;

namespace {

proto::ComputeDevice ToProto(ComputeDevice device) {
  return device == ComputeDevice::kCpu ? proto::COMPUTE_DEVICE_CPU
                                       : proto::COMPUTE_DEVICE_ACCELERATOR;
}

void PrepareContext(grpc::ClientContext* context, const CallOptions& options) {
  context->set_deadline(std::chrono::system_clock::now() +
                        std::chrono::milliseconds(options.timeout_ms));
}

// Fills status/detail from a finished call. Returns true on OK.
template <typename Result>
bool CheckStatus(const grpc::Status& status, const char* method, int32_t segment_id,
                 Result* result) {
  if (status.ok()) {
    result->status = BackendStatus::kOk;
    return true;
  }
  result->status = GrpcSpeechBackend::StatusFromGrpc(status.error_code());
  std::ostringstream oss;
  oss << method << " grpc_code=" << static_cast<int>(status.error_code())
      << " message=" << status.error_message();
  result->detail = oss.str();

  std::ostringstream log;
  log << "[GrpcSpeechBackend] CALL_FAILED method=" << method
      << " segment_id=" << segment_id
      << " status=" << BackendStatusToString(result->status)
      << " detail=" << status.error_message();
  Logger::Debug(log.str());
  return false;
}

}  // namespace

GrpcSpeechBackend::GrpcSpeechBackend(const std::string& target_address)
    : target_address_(target_address),
      channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::SpeechBackendService::NewStub(channel_)) {
  Logger::Info("[GrpcSpeechBackend] CHANNEL target=" + target_address_);
}

BackendStatus GrpcSpeechBackend::StatusFromGrpc(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::OK:
      return BackendStatus::kOk;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return BackendStatus::kTimeout;
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
    case grpc::StatusCode::ABORTED:
      return BackendStatus::kTransientError;
    case grpc::StatusCode::FAILED_PRECONDITION:
      return BackendStatus::kAcceleratorUnavailable;
    default:
      return BackendStatus::kPermanentError;
  }
}

TranscriptionResult GrpcSpeechBackend::Transcribe(const TranscriptionRequest& request,
                                                  const CallOptions& options) {
  proto::TranscribeRequest req;
  req.set_job_id(options.job_id);
  req.set_segment_id(request.segment_id);
  req.set_language(request.language);
  req.set_device(ToProto(options.device));
  auto* audio = req.mutable_audio();
  audio->set_pcm_s16le(media::EncodePcmS16le(request.audio));
  audio->set_sample_rate(request.audio.sample_rate);

  grpc::ClientContext context;
  PrepareContext(&context, options);
  proto::TranscribeResponse resp;
  TranscriptionResult result;
  if (!CheckStatus(stub_->Transcribe(&context, req, &resp), "Transcribe",
                   request.segment_id, &result)) {
    return result;
  }

  result.text = resp.text();
  result.confidence = resp.confidence();
  result.words.reserve(static_cast<size_t>(resp.words_size()));
  for (const auto& w : resp.words()) {
    core::WordTiming wt;
    wt.word = w.word();
    wt.start_ms = w.start_ms();
    wt.end_ms = w.end_ms();
    result.words.push_back(std::move(wt));
  }
  return result;
}

TranslationResult GrpcSpeechBackend::Translate(const TranslationRequest& request,
                                               const CallOptions& options) {
  proto::TranslateRequest req;
  req.set_job_id(options.job_id);
  req.set_segment_id(request.segment_id);
  req.set_text(request.text);
  req.set_source_language(request.source_language);
  req.set_target_language(request.target_language);
  req.set_device(ToProto(options.device));

  grpc::ClientContext context;
  PrepareContext(&context, options);
  proto::TranslateResponse resp;
  TranslationResult result;
  if (!CheckStatus(stub_->Translate(&context, req, &resp), "Translate",
                   request.segment_id, &result)) {
    return result;
  }
  result.translated_text = resp.translated_text();
  return result;
}

SynthesisResult GrpcSpeechBackend::Synthesize(const SynthesisRequest& request,
                                              const CallOptions& options) {
  proto::SynthesizeRequest req;
  req.set_job_id(options.job_id);
  req.set_segment_id(request.segment_id);
  req.set_text(request.text);
  req.set_voice_id(request.voice_id);
  req.set_rate(request.rate);
  req.set_volume(request.volume);
  req.set_pitch_shift_hz(request.pitch_shift_hz);
  req.set_sample_rate(request.sample_rate);
  req.set_device(ToProto(options.device));

  grpc::ClientContext context;
  PrepareContext(&context, options);
  proto::SynthesizeResponse resp;
  SynthesisResult result;
  if (!CheckStatus(stub_->Synthesize(&context, req, &resp), "Synthesize",
                   request.segment_id, &result)) {
    return result;
  }

  const int rate = resp.audio().sample_rate() > 0 ? resp.audio().sample_rate()
                                                  : request.sample_rate;
  result.waveform = media::DecodePcmS16le(resp.audio().pcm_s16le(), rate);
  return result;
}

}  // namespace redub::backend
