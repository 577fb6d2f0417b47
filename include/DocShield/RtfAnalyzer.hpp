#pragma once

#include "DocumentAnalyzer.hpp"

#include <string>

namespace docshield {

class RtfAnalyzer : public DocumentAnalyzer {
  public:
    using DocumentAnalyzer::DocumentAnalyzer;

    std::string name() const override { return "rtf"; }
    AnalysisResult detectFindings(const std::string &bytes) const override;
};

} // namespace docshield
