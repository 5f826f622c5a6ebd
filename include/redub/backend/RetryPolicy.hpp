// Repository: Redub
// Component: Retry Policy
// Purpose: Attempt limit and exponential backoff for backend calls.
// Copyright (c) 2026 Redub

#ifndef REDUB_BACKEND_RETRY_POLICY_HPP_
#define REDUB_BACKEND_RETRY_POLICY_HPP_

#include <cstdint>

#include "redub/backend/SpeechBackend.hpp"
#include "redub/core/JobConfig.hpp"

namespace redub::backend {

struct RetryPolicy {
  int max_attempts = 3;
  int64_t initial_backoff_ms = 1000;
  int64_t max_backoff_ms = 8000;

  static RetryPolicy FromConfig(const core::PipelineConfig& config);

  // Delay before attempt |next_attempt| (2-based: the first retry).
  // initial * 2^(next_attempt - 2), capped at max_backoff_ms.
  int64_t BackoffBeforeAttempt(int next_attempt) const;

  // Timeouts and transient errors consume an attempt and are retried.
  static bool IsRetryable(BackendStatus status);
};

}  // namespace redub::backend

#endif  // REDUB_BACKEND_RETRY_POLICY_HPP_
