// Repository: Redub
// Component: gRPC Status Mapping Contract Tests
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include "redub/backend/GrpcSpeechBackend.hpp"
#include "redub/backend/RetryPolicy.hpp"

using redub::backend::BackendStatus;
using redub::backend::GrpcSpeechBackend;

TEST(GrpcStatusContract, DeadlineIsTimeout) {
  EXPECT_EQ(GrpcSpeechBackend::StatusFromGrpc(grpc::StatusCode::OK), BackendStatus::kOk);
  EXPECT_EQ(GrpcSpeechBackend::StatusFromGrpc(grpc::StatusCode::DEADLINE_EXCEEDED),
            BackendStatus::kTimeout);
}

TEST(GrpcStatusContract, OverloadAndOutagesAreTransient) {
  for (auto code : {grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::RESOURCE_EXHAUSTED,
                    grpc::StatusCode::ABORTED}) {
    const BackendStatus s = GrpcSpeechBackend::StatusFromGrpc(code);
    EXPECT_EQ(s, BackendStatus::kTransientError) << static_cast<int>(code);
    EXPECT_TRUE(redub::backend::RetryPolicy::IsRetryable(s));
  }
}

TEST(GrpcStatusContract, FailedPreconditionMeansNoAccelerator) {
  EXPECT_EQ(GrpcSpeechBackend::StatusFromGrpc(grpc::StatusCode::FAILED_PRECONDITION),
            BackendStatus::kAcceleratorUnavailable);
}

TEST(GrpcStatusContract, EverythingElseIsPermanent) {
  for (auto code : {grpc::StatusCode::INVALID_ARGUMENT, grpc::StatusCode::NOT_FOUND,
                    grpc::StatusCode::INTERNAL, grpc::StatusCode::UNIMPLEMENTED,
                    grpc::StatusCode::PERMISSION_DENIED}) {
    EXPECT_EQ(GrpcSpeechBackend::StatusFromGrpc(code), BackendStatus::kPermanentError)
        << static_cast<int>(code);
  }
}

TEST(GrpcStatusContract, UnreachableServerTimesOutOrIsTransient) {
  GrpcSpeechBackend backend("127.0.0.1:1");
  redub::backend::TranslationRequest request;
  request.segment_id = 1;
  request.text = "hello";
  request.source_language = "en";
  request.target_language = "az";
  redub::backend::CallOptions options;
  options.timeout_ms = 200;
  const auto result = backend.Translate(request, options);
  EXPECT_TRUE(result.status == BackendStatus::kTransientError ||
              result.status == BackendStatus::kTimeout)
      << redub::backend::BackendStatusToString(result.status);
}
