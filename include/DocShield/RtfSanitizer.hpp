#pragma once

#include "Sanitizer.hpp"

namespace docshield {

// Excises object, picture and DDE/include field groups from a well-formed
// document.
class RtfGroupStage : public SanitizerStage {
  public:
    explicit RtfGroupStage(const ScanSettings &settings) : settings(settings) {}

    std::string name() const override { return "rtf_groups"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    const ScanSettings &settings;
};

// Tolerates unbalanced braces and a missing header; dangerous control words
// that are not inside a removable group are deleted individually.
class RtfLenientStage : public SanitizerStage {
  public:
    explicit RtfLenientStage(const ScanSettings &settings) : settings(settings) {}

    std::string name() const override { return "rtf_lenient"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    const ScanSettings &settings;
};

} // namespace docshield
