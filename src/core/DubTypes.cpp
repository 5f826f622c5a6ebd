// Repository: Redub
// Component: Dubbing Data Model Implementation
// Copyright (c) 2026 Redub

#include "redub/core/DubTypes.hpp"

namespace redub::core {

// New error codes may be added; existing strings appear in job reports and
// must not change.
const char* DubErrorToString(DubError error) {
  switch (error) {
    case DubError::kNone:
      return "NONE";
    case DubError::kConfigInvalid:
      return "CONFIG_INVALID";
    case DubError::kSampleRateMismatch:
      return "SAMPLE_RATE_MISMATCH";
    case DubError::kAudioUnreadable:
      return "AUDIO_UNREADABLE";
    case DubError::kTranscriptionFailed:
      return "TRANSCRIPTION_FAILED";
    case DubError::kTranslationFailed:
      return "TRANSLATION_FAILED";
    case DubError::kSynthesisFailed:
      return "SYNTHESIS_FAILED";
    case DubError::kDriftExceeded:
      return "DRIFT_EXCEEDED";
    case DubError::kOverlappingClips:
      return "OVERLAPPING_CLIPS";
    case DubError::kMuxFailed:
      return "MUX_FAILED";
    case DubError::kIoError:
      return "IO_ERROR";
    case DubError::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN_ERROR";
}

const char* GenderName(Gender g) {
  switch (g) {
    case Gender::kMale:    return "male";
    case Gender::kFemale:  return "female";
    case Gender::kUnknown: return "unknown";
  }
  return "unknown";
}

Gender GenderFromName(const std::string& name) {
  if (name == "male") return Gender::kMale;
  if (name == "female") return Gender::kFemale;
  return Gender::kUnknown;
}

const char* DriftKindName(DriftKind k) {
  switch (k) {
    case DriftKind::kAbsorbedIntoSilence: return "absorbed";
    case DriftKind::kCascadingShift:      return "shifted";
  }
  return "unknown";
}

const char* SegmentStageName(SegmentStage s) {
  switch (s) {
    case SegmentStage::kTranscription: return "transcription";
    case SegmentStage::kTranslation:   return "translation";
    case SegmentStage::kSynthesis:     return "synthesis";
  }
  return "unknown";
}

}  // namespace redub::core
