#pragma once

#include "DocumentAnalyzer.hpp"
#include "PdfDocument.hpp"

#include <string>

namespace docshield {

class PdfAnalyzer : public DocumentAnalyzer {
  public:
    using DocumentAnalyzer::DocumentAnalyzer;

    std::string name() const override { return "pdf"; }
    AnalysisResult detectFindings(const std::string &bytes) const override;

    static bool isExploitAction(const std::string &subtype);

  private:
    void inspectCatalog(AnalysisResult &result, const pdf::Document &document) const;
    void inspectObjects(AnalysisResult &result, const pdf::Document &document) const;
    void rawPatternFallback(AnalysisResult &result, const std::string &bytes) const;
    void inspectEntropy(AnalysisResult &result, const std::string &bytes) const;
};

} // namespace docshield
