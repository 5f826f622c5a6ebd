// Repository: Redub
// Component: gRPC speech backend client
// Purpose: ISpeechBackend over redub.backend.v1.SpeechBackendService.
// Copyright (c) 2026 Redub

#ifndef REDUB_BACKEND_GRPC_SPEECH_BACKEND_HPP_
#define REDUB_BACKEND_GRPC_SPEECH_BACKEND_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "speech_backend_v1.grpc.pb.h"

#include "redub/backend/SpeechBackend.hpp"

namespace redub::backend {

// Unary calls on a shared channel; the generated stub is thread-safe, so one
// instance serves every pool worker. Each call carries a deadline of
// CallOptions::timeout_ms and the requested compute device.
class GrpcSpeechBackend : public ISpeechBackend {
 public:
  explicit GrpcSpeechBackend(const std::string& target_address);

  GrpcSpeechBackend(const GrpcSpeechBackend&) = delete;
  GrpcSpeechBackend& operator=(const GrpcSpeechBackend&) = delete;

  TranscriptionResult Transcribe(const TranscriptionRequest& request,
                                 const CallOptions& options) override;
  TranslationResult Translate(const TranslationRequest& request,
                              const CallOptions& options) override;
  SynthesisResult Synthesize(const SynthesisRequest& request,
                             const CallOptions& options) override;

  // gRPC status code → backend status (see the service definition).
  static BackendStatus StatusFromGrpc(grpc::StatusCode code);

 private:
  std::string target_address_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<redub::backend::v1::SpeechBackendService::Stub> stub_;
};

}  // namespace redub::backend

#endif  // REDUB_BACKEND_GRPC_SPEECH_BACKEND_HPP_
