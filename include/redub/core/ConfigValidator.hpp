// Repository: Redub
// Component: Job Config Validator
// Purpose: Pre-flight validation of JobConfig; fails fast on the first
//          invalid field.
// Copyright (c) 2026 Redub

#ifndef REDUB_CORE_CONFIG_VALIDATOR_HPP_
#define REDUB_CORE_CONFIG_VALIDATOR_HPP_

#include <string>

#include "redub/core/DubTypes.hpp"
#include "redub/core/JobConfig.hpp"

namespace redub::core {

class ConfigValidator {
 public:
  struct ValidationResult {
    bool valid;
    DubError error;
    std::string field;   // Config key at fault
    std::string detail;

    static ValidationResult Success() {
      return {true, DubError::kNone, "", ""};
    }

    static ValidationResult Failure(const std::string& field, const std::string& detail) {
      return {false, DubError::kConfigInvalid, field, detail};
    }
  };

  // Checks sections in pipeline order and returns the first failure.
  ValidationResult Validate(const JobConfig& config) const;

  // Validate() and throw ConfigError on failure.
  void ValidateOrThrow(const JobConfig& config) const;

 private:
  ValidationResult ValidateSegmenter(const SegmenterConfig& c) const;
  ValidationResult ValidateProfiler(const ProfilerConfig& c) const;
  ValidationResult ValidateAligner(const AlignerConfig& c) const;
  ValidationResult ValidateSynthesis(const SynthesisConfig& c) const;
  ValidationResult ValidateSubtitles(const SubtitleConfig& c) const;
  ValidationResult ValidateAssembly(const AssemblyConfig& c) const;
  ValidationResult ValidateMux(const MuxConfig& c) const;
  ValidationResult ValidatePipeline(const PipelineConfig& c) const;
};

}  // namespace redub::core

#endif  // REDUB_CORE_CONFIG_VALIDATOR_HPP_
