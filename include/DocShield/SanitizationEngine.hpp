#pragma once

#include "KeywordScrubber.hpp"
#include "Sanitizer.hpp"
#include "ScanSettings.hpp"
#include "ScanTypes.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace docshield {

class SanitizationEngine {
  public:
    explicit SanitizationEngine(const ScanSettings &settings);

    // Stage failures never escape. On total failure the original bytes come
    // back with succeeded=false and a reason. ScanTimedOut propagates.
    SanitizationOutcome sanitize(const FormatKind &format, const std::string &bytes) const;

    // Puts a stage ahead of the built-in chain for a family.
    void prependStage(FormatFamily family, std::unique_ptr<SanitizerStage> stage);
    std::vector<std::string> chainFor(FormatFamily family) const;

  private:
    std::string injectMarker(FormatFamily family, const std::string &bytes) const;

    const ScanSettings &settings;
    std::shared_ptr<const KeywordScrubber> scrubber;
    std::map<FormatFamily, std::vector<std::unique_ptr<SanitizerStage>>> registry;
};

} // namespace docshield
