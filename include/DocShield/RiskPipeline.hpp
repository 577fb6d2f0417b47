#pragma once

#include "DocumentAnalyzer.hpp"
#include "ScanSettings.hpp"
#include "ScanTypes.hpp"
#include "ThreatClassifier.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

struct Evaluation {
    FormatKind format;
    std::vector<Finding> findings;
    std::vector<std::string> diagnostics;
    FeatureMap features;
    ClassifierSignal signal;
    RiskAssessment assessment;
};

// Format classification, structural analysis, classifier scoring and verdict
// aggregation for one buffer. Holds no per-scan state.
class RiskPipeline {
  public:
    RiskPipeline(const ScanSettings &settings, std::shared_ptr<const ThreatClassifier> classifier);
    RiskPipeline(const RiskPipeline &) = delete;
    RiskPipeline &operator=(const RiskPipeline &) = delete;

    Evaluation evaluate(const std::string &bytes, const std::string &filename,
                        const std::optional<std::string> &declaredContentType) const;
    Evaluation evaluate(const std::string &bytes, const FormatKind &format) const;

    const DocumentAnalyzer &analyzerFor(FormatFamily family) const;

  private:
    const ScanSettings &settings;
    std::shared_ptr<const ThreatClassifier> classifier;
    FeatureExtractor extractor;
    std::map<FormatFamily, std::unique_ptr<DocumentAnalyzer>> analyzers;
};

class ConsistencyVerifier {
  public:
    explicit ConsistencyVerifier(const RiskPipeline &pipeline) : pipeline(pipeline) {}

    // Rescans the sanitized bytes; deltaRisk is post minus pre composite score.
    VerificationResult verify(const RiskAssessment &before, const std::string &sanitized, const std::string &filename,
                              const std::optional<std::string> &declaredContentType) const;

  private:
    const RiskPipeline &pipeline;
};

} // namespace docshield
