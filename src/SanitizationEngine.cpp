#include "DocShield/SanitizationEngine.hpp"

#include "DocShield/Crypto.hpp"
#include "DocShield/OoxmlSanitizer.hpp"
#include "DocShield/PdfSanitizer.hpp"
#include "DocShield/RtfSanitizer.hpp"
#include "DocShield/ScanDeadline.hpp"

namespace docshield {

namespace {

const std::string kPassthrough = "passthrough";

SanitizationOutcome passthrough(SanitizationOutcome outcome, const std::string &bytes, std::string reason) {
    outcome.engineUsed = kPassthrough;
    outcome.fallbackChainAttempted.push_back(kPassthrough);
    outcome.output = bytes;
    outcome.bytesChanged = false;
    outcome.succeeded = false;
    outcome.reason = std::move(reason);
    return outcome;
}

} // namespace

SanitizationEngine::SanitizationEngine(const ScanSettings &settings)
    : settings(settings), scrubber(std::make_shared<const KeywordScrubber>()) {
    auto &pdf = registry[FormatFamily::Pdf];
    pdf.push_back(std::make_unique<PdfBlankingStage>(settings));
    pdf.push_back(std::make_unique<PdfRebuildStage>(settings));
    pdf.push_back(std::make_unique<KeywordScrubStage>(scrubber));

    auto &ooxml = registry[FormatFamily::Ooxml];
    ooxml.push_back(std::make_unique<OoxmlRewriteStage>(settings));
    ooxml.push_back(std::make_unique<OoxmlSalvageStage>(settings));
    ooxml.push_back(std::make_unique<KeywordScrubStage>(scrubber));

    auto &rtf = registry[FormatFamily::Rtf];
    rtf.push_back(std::make_unique<RtfGroupStage>(settings));
    rtf.push_back(std::make_unique<RtfLenientStage>(settings));
    rtf.push_back(std::make_unique<KeywordScrubStage>(scrubber));
}

void SanitizationEngine::prependStage(FormatFamily family, std::unique_ptr<SanitizerStage> stage) {
    auto &chain = registry[family];
    chain.insert(chain.begin(), std::move(stage));
}

std::vector<std::string> SanitizationEngine::chainFor(FormatFamily family) const {
    std::vector<std::string> names;
    const auto chain = registry.find(family);
    if (chain != registry.end()) {
        for (const auto &stage : chain->second) {
            names.push_back(stage->name());
        }
    }
    names.push_back(kPassthrough);
    return names;
}

std::string SanitizationEngine::injectMarker(FormatFamily family, const std::string &bytes) const {
    switch (family) {
    case FormatFamily::Pdf:
        return bytes + "\n% DocShield sanitized\n";
    case FormatFamily::Rtf: {
        const auto last = bytes.find_last_of('}');
        std::string output = bytes;
        if (last == std::string::npos) {
            output += "{\\*\\docshield sanitized}";
        } else {
            output.insert(last, "{\\*\\docshield sanitized}");
        }
        return output;
    }
    case FormatFamily::Ooxml:
        return addPackageMarker(bytes, settings);
    case FormatFamily::Unknown:
        break;
    }
    return bytes;
}

SanitizationOutcome SanitizationEngine::sanitize(const FormatKind &format, const std::string &bytes) const {
    SanitizationOutcome outcome;
    if (bytes.empty()) {
        return passthrough(std::move(outcome), bytes, "empty input");
    }
    const auto chain = registry.find(format.effectiveFamily());
    if (chain == registry.end()) {
        return passthrough(std::move(outcome), bytes, "no sanitizer for format");
    }

    std::string failures;
    for (const auto &stage : chain->second) {
        ScanDeadline::check("sanitization");
        outcome.fallbackChainAttempted.push_back(stage->name());
        StageResult result;
        try {
            result = stage->attempt(bytes);
        } catch (const std::exception &error) {
            result = StageResult::failure(error.what());
        }
        if (result.succeeded && result.output.empty()) {
            result = StageResult::failure("zero-length output");
        }
        if (!result.succeeded) {
            failures += (failures.empty() ? "" : "; ") + stage->name() + ": " + result.errorMessage;
            continue;
        }

        outcome.engineUsed = stage->name();
        outcome.succeeded = true;
        if (result.removed.empty()) {
            outcome.output = bytes;
            outcome.reason = "no dangerous constructs found";
            return outcome;
        }
        outcome.removedConstructs = std::move(result.removed);
        outcome.output = std::move(result.output);
        if (crypto::sha256(outcome.output) == crypto::sha256(bytes)) {
            try {
                outcome.output = injectMarker(format.effectiveFamily(), outcome.output);
                outcome.markerInjected = true;
            } catch (const std::exception &error) {
                failures += (failures.empty() ? "" : "; ") + std::string("marker: ") + error.what();
                outcome.succeeded = false;
                continue;
            }
        }
        outcome.bytesChanged = outcome.output != bytes;
        outcome.reason = failures.empty() ? "sanitized" : "sanitized after fallback (" + failures + ")";
        return outcome;
    }

    outcome.succeeded = false;
    outcome.engineUsed.clear();
    outcome.removedConstructs.clear();
    return passthrough(std::move(outcome), bytes, "all engines failed: " + failures);
}

} // namespace docshield
