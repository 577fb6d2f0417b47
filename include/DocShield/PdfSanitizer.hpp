#pragma once

#include "Sanitizer.hpp"

namespace docshield {

// Overwrites dangerous keys, action dictionaries and script streams with
// spaces so every byte offset (and the xref table) stays valid.
class PdfBlankingStage : public SanitizerStage {
  public:
    explicit PdfBlankingStage(const ScanSettings &settings) : settings(settings) {}

    std::string name() const override { return "pdf_blank"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    const ScanSettings &settings;
};

// Loads the document with qpdf, strips active content from every object and
// writes a fresh file without object streams. Annotations and forms are
// dropped wholesale.
class PdfRebuildStage : public SanitizerStage {
  public:
    explicit PdfRebuildStage(const ScanSettings &settings) : settings(settings) {}

    std::string name() const override { return "pdf_rebuild"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    const ScanSettings &settings;
};

bool isDangerousActionType(const std::string &subtype);

} // namespace docshield
