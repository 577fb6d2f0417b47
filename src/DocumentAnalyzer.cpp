#include "DocShield/DocumentAnalyzer.hpp"

#include "DocShield/ContentHeuristics.hpp"

#include <algorithm>

namespace docshield {

double AnalysisResult::ruleScore() const {
    return std::min(1.0, std::max(0.0, rulePoints / 100.0));
}

bool AnalysisResult::hasFinding(const std::string &id) const {
    return std::any_of(findings.begin(), findings.end(), [&](const Finding &finding) { return finding.id == id; });
}

bool AnalysisResult::hasCritical() const {
    return std::any_of(findings.begin(), findings.end(),
                       [](const Finding &finding) { return finding.severity == Severity::Critical; });
}

void DocumentAnalyzer::addFinding(AnalysisResult &result, std::string id, Severity severity, double points,
                                  std::string message, std::string locator) {
    result.rulePoints += points;
    result.findings.push_back({std::move(id), severity, std::move(message), std::move(locator)});
}

void DocumentAnalyzer::scanSuspiciousStrings(AnalysisResult &result, const std::string &bytes) const {
    const auto hits = heuristics::findSuspiciousStrings(bytes, settings.textScanWindow);
    if (hits.empty()) {
        return;
    }
    std::string joined;
    for (const auto &hit : hits) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += hit;
    }
    addFinding(result, "suspicious_strings", Severity::Medium, 15.0, "Suspicious strings present: " + joined);
}

AnalysisResult NullAnalyzer::detectFindings(const std::string &bytes) const {
    AnalysisResult result;
    addFinding(result, "unsupported_format", Severity::Info, 0.0,
               "Unsupported or unrecognised document format (" + std::to_string(bytes.size()) + " bytes); no structural analysis performed.");
    return result;
}

} // namespace docshield
