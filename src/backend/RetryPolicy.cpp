// Repository: Redub
// Component: Retry Policy Implementation
// Copyright (c) 2026 Redub

#include "redub/backend/RetryPolicy.hpp"

#include <algorithm>

namespace redub::backend {

const char* BackendStatusToString(BackendStatus status) {
  switch (status) {
    case BackendStatus::kOk: return "OK";
    case BackendStatus::kTimeout: return "TIMEOUT";
    case BackendStatus::kTransientError: return "TRANSIENT_ERROR";
    case BackendStatus::kAcceleratorUnavailable: return "ACCELERATOR_UNAVAILABLE";
    case BackendStatus::kPermanentError: return "PERMANENT_ERROR";
  }
  return "UNKNOWN";
}

const char* ComputeDeviceName(ComputeDevice device) {
  switch (device) {
    case ComputeDevice::kAccelerator: return "accelerator";
    case ComputeDevice::kCpu: return "cpu";
  }
  return "unknown";
}

RetryPolicy RetryPolicy::FromConfig(const core::PipelineConfig& config) {
  RetryPolicy p;
  p.max_attempts = config.max_attempts;
  p.initial_backoff_ms = config.initial_backoff_ms;
  p.max_backoff_ms = config.max_backoff_ms;
  return p;
}

int64_t RetryPolicy::BackoffBeforeAttempt(int next_attempt) const {
  int64_t backoff = initial_backoff_ms;
  for (int i = 2; i < next_attempt && backoff < max_backoff_ms; ++i) {
    backoff *= 2;
  }
  return std::min(backoff, max_backoff_ms);
}

bool RetryPolicy::IsRetryable(BackendStatus status) {
  return status == BackendStatus::kTimeout || status == BackendStatus::kTransientError;
}

}  // namespace redub::backend
