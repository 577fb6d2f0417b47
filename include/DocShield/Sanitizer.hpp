#pragma once

#include "KeywordScrubber.hpp"
#include "ScanSettings.hpp"

#include <memory>
#include <set>
#include <string>

namespace docshield {

struct StageResult {
    bool succeeded{false};
    std::string output;
    std::set<std::string> removed;
    std::string errorMessage;

    static StageResult failure(std::string message);
    static StageResult success(std::string output, std::set<std::string> removed);
};

// One step of a sanitizer fallback chain. Stages may throw; the engine turns
// exceptions into failed attempts.
class SanitizerStage {
  public:
    virtual ~SanitizerStage() = default;

    virtual std::string name() const = 0;
    virtual StageResult attempt(const std::string &bytes) const = 0;
};

class KeywordScrubStage : public SanitizerStage {
  public:
    explicit KeywordScrubStage(std::shared_ptr<const KeywordScrubber> scrubber) : scrubber(std::move(scrubber)) {}

    std::string name() const override { return "keyword_scrub"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    std::shared_ptr<const KeywordScrubber> scrubber;
};

} // namespace docshield
