#pragma once

#include "ScanSettings.hpp"
#include "ScanTypes.hpp"

#include <string>
#include <vector>

namespace docshield {

struct AnalysisResult {
    std::vector<Finding> findings;
    std::vector<std::string> diagnostics;
    double rulePoints{0.0};

    // rulePoints / 100, capped at 1.0.
    double ruleScore() const;
    bool hasFinding(const std::string &id) const;
    bool hasCritical() const;
};

class DocumentAnalyzer {
  public:
    explicit DocumentAnalyzer(const ScanSettings &settings) : settings(settings) {}
    virtual ~DocumentAnalyzer() = default;

    virtual std::string name() const = 0;
    // Never throws for malformed input; parse failures become findings.
    virtual AnalysisResult detectFindings(const std::string &bytes) const = 0;

  protected:
    static void addFinding(AnalysisResult &result, std::string id, Severity severity, double points,
                           std::string message, std::string locator = {});
    // Medium/15 suspicious-string finding when any fixed marker is present.
    void scanSuspiciousStrings(AnalysisResult &result, const std::string &bytes) const;

    const ScanSettings &settings;
};

class NullAnalyzer : public DocumentAnalyzer {
  public:
    using DocumentAnalyzer::DocumentAnalyzer;

    std::string name() const override { return "null"; }
    AnalysisResult detectFindings(const std::string &bytes) const override;
};

} // namespace docshield
