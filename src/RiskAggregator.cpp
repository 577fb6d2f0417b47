#include "DocShield/RiskAggregator.hpp"

#include <algorithm>
#include <cmath>

namespace docshield {

namespace {

double clampUnit(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, value));
}

} // namespace

RiskAssessment RiskAggregator::assess(const std::vector<Finding> &findings, double ruleScore, const ClassifierSignal &signal) {
    RiskAssessment assessment;
    assessment.ruleScore = clampUnit(ruleScore);
    if (signal.available) {
        assessment.classifierProbability = clampUnit(signal.probability);
    }

    const bool critical = std::any_of(findings.begin(), findings.end(),
                                      [](const Finding &finding) { return finding.severity == Severity::Critical; });
    if (critical) {
        assessment.compositeScore = 1.0;
        assessment.verdict = Verdict::Malicious;
        return assessment;
    }

    const double probability = assessment.classifierProbability.value_or(0.0);
    assessment.compositeScore = std::max(assessment.ruleScore, probability);

    if (assessment.ruleScore >= kRuleMalicious) {
        assessment.verdict = Verdict::Malicious;
    } else if (assessment.ruleScore >= kRuleSuspicious) {
        assessment.verdict = Verdict::Suspicious;
    } else if (assessment.classifierProbability && probability >= kClassifierMalicious) {
        assessment.verdict = Verdict::Malicious;
    } else if (assessment.classifierProbability && probability >= kClassifierSuspicious) {
        assessment.verdict = Verdict::Suspicious;
    } else {
        assessment.verdict = Verdict::Benign;
    }
    return assessment;
}

} // namespace docshield
