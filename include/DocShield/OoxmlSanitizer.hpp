#pragma once

#include "Sanitizer.hpp"
#include "ZipArchive.hpp"

namespace docshield {

// Rewrites the package from its central directory: dangerous members are
// dropped, relationships and content types cleaned, active XML nodes removed.
class OoxmlRewriteStage : public SanitizerStage {
  public:
    explicit OoxmlRewriteStage(const ScanSettings &settings) : settings(settings) {}

    std::string name() const override { return "ooxml_rewrite"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    const ScanSettings &settings;
};

// Same cleaning over members recovered from local headers; unreadable
// members are dropped instead of failing the stage.
class OoxmlSalvageStage : public SanitizerStage {
  public:
    explicit OoxmlSalvageStage(const ScanSettings &settings) : settings(settings) {}

    std::string name() const override { return "ooxml_salvage"; }
    StageResult attempt(const std::string &bytes) const override;

  private:
    const ScanSettings &settings;
};

// Adds a stored docshield.txt member to an otherwise unchanged package.
std::string addPackageMarker(const std::string &bytes, const ScanSettings &settings);

} // namespace docshield
