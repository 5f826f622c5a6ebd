// Repository: Redub
// Component: Job Error Taxonomy
// Purpose: Exceptions raised for fatal job conditions and strict-mode
//          per-segment failures. Each carries a DubError code for the report.
// Copyright (c) 2026 Redub

#ifndef REDUB_CORE_ERRORS_HPP_
#define REDUB_CORE_ERRORS_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

#include "redub/core/DubTypes.hpp"

namespace redub::core {

class DubException : public std::runtime_error {
 public:
  DubException(DubError error, const std::string& what)
      : std::runtime_error(what), error_(error) {}

  DubError error() const { return error_; }

 private:
  DubError error_;
};

// Fatal; raised only during pre-flight validation (or the sample-rate check
// that precedes segmentation).
class ConfigError : public DubException {
 public:
  explicit ConfigError(const std::string& what,
                       DubError error = DubError::kConfigInvalid)
      : DubException(error, what) {}
};

// Fatal; unreadable or corrupt source audio.
class SegmentationError : public DubException {
 public:
  explicit SegmentationError(const std::string& what)
      : DubException(DubError::kAudioUnreadable, what) {}
};

// Per-segment failures; raised only when the job runs in strict mode.
class SegmentError : public DubException {
 public:
  SegmentError(DubError error, int32_t segment_id, const std::string& what)
      : DubException(error, what), segment_id_(segment_id) {}

  int32_t segment_id() const { return segment_id_; }

 private:
  int32_t segment_id_;
};

class TranscriptionError : public SegmentError {
 public:
  TranscriptionError(int32_t segment_id, const std::string& what)
      : SegmentError(DubError::kTranscriptionFailed, segment_id, what) {}
};

class TranslationError : public SegmentError {
 public:
  TranslationError(int32_t segment_id, const std::string& what)
      : SegmentError(DubError::kTranslationFailed, segment_id, what) {}
};

class SynthesisError : public SegmentError {
 public:
  SynthesisError(int32_t segment_id, const std::string& what)
      : SegmentError(DubError::kSynthesisFailed, segment_id, what) {}
};

// Fatal; drift tolerance breached or the timeline invariant violated.
class SyncError : public DubException {
 public:
  explicit SyncError(const std::string& what,
                     DubError error = DubError::kDriftExceeded)
      : DubException(error, what) {}
};

// Fatal; external mux tool failed.
class MuxError : public DubException {
 public:
  explicit MuxError(const std::string& what)
      : DubException(DubError::kMuxFailed, what) {}
};

class IoError : public DubException {
 public:
  explicit IoError(const std::string& what)
      : DubException(DubError::kIoError, what) {}
};

}  // namespace redub::core

#endif  // REDUB_CORE_ERRORS_HPP_
