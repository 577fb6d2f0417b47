#pragma once

#include "ScanTypes.hpp"

#include <vector>

namespace docshield {

class RiskAggregator {
  public:
    static constexpr double kRuleMalicious = 0.60;
    static constexpr double kRuleSuspicious = 0.30;
    static constexpr double kClassifierMalicious = 0.75;
    static constexpr double kClassifierSuspicious = 0.50;

    // Critical findings override everything; otherwise rule thresholds are
    // checked before classifier thresholds.
    static RiskAssessment assess(const std::vector<Finding> &findings, double ruleScore, const ClassifierSignal &signal);
};

} // namespace docshield
