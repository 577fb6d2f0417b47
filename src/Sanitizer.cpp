#include "DocShield/Sanitizer.hpp"

namespace docshield {

StageResult StageResult::failure(std::string message) {
    StageResult result;
    result.errorMessage = std::move(message);
    return result;
}

StageResult StageResult::success(std::string output, std::set<std::string> removed) {
    StageResult result;
    result.succeeded = true;
    result.output = std::move(output);
    result.removed = std::move(removed);
    return result;
}

StageResult KeywordScrubStage::attempt(const std::string &bytes) const {
    auto scrubbed = scrubber->scrub(bytes);
    if (scrubbed.matches == 0) {
        return StageResult::failure("No deny-listed keywords present");
    }
    return StageResult::success(std::move(scrubbed.output), {"keyword_scrub"});
}

} // namespace docshield
