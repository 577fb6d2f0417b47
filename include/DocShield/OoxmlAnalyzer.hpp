#pragma once

#include "DocumentAnalyzer.hpp"
#include "ZipArchive.hpp"

#include <string>

namespace docshield {

class OoxmlAnalyzer : public DocumentAnalyzer {
  public:
    using DocumentAnalyzer::DocumentAnalyzer;

    std::string name() const override { return "ooxml"; }
    AnalysisResult detectFindings(const std::string &bytes) const override;
};

} // namespace docshield
