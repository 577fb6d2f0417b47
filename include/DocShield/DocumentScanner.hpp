#pragma once

#include "RiskPipeline.hpp"
#include "SanitizationEngine.hpp"
#include "ScanSettings.hpp"
#include "ScanTypes.hpp"
#include "ThreatClassifier.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

class DocumentScanner {
  public:
    explicit DocumentScanner(ScanSettings settings = {}, std::shared_ptr<const ThreatClassifier> classifier = nullptr);
    DocumentScanner(const DocumentScanner &) = delete;
    DocumentScanner &operator=(const DocumentScanner &) = delete;

    // Internal failures become a Benign report carrying a single
    // scan_internal_error finding. ScanTimedOut is not caught here. An
    // artifact over max_artifact_bytes is judged on its prefix and never
    // reported Benign. Sanitization runs only for Malicious.
    ScanReport scan(const std::string &bytes, const std::string &filename,
                    const std::optional<std::string> &declaredContentType = std::nullopt) const;

    SanitizationOutcome sanitize(const FormatKind &format, const std::string &bytes) const;

    const ScanSettings &settings() const { return config; }

  private:
    ScanReport runScan(const Artifact &artifact) const;

    ScanSettings config;
    std::shared_ptr<const ThreatClassifier> classifier;
    RiskPipeline pipeline;
    SanitizationEngine engine;
    ConsistencyVerifier verifier;
};

std::vector<std::string> recommendationsFor(const RiskAssessment &assessment, const std::vector<Finding> &findings);

// Plain-language explanation, empty when none applies.
std::string explainFinding(const Finding &finding);

// Builds the model used for --model style options; null when path is unset.
std::shared_ptr<const ThreatClassifier> loadClassifier(const std::optional<std::string> &modelPath);

} // namespace docshield
