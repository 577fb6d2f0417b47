#pragma once

#include "ScanTypes.hpp"

#include <optional>
#include <string>

namespace docshield {

class FormatClassifier {
  public:
    // Extension first, then declared content type, then magic bytes. Never
    // throws; unresolved input is FormatFamily::Unknown.
    static FormatKind classify(const std::string &filename, const std::string &bytes,
                               const std::optional<std::string> &declaredContentType = std::nullopt);

    static std::string extensionOf(const std::string &filename);
    static std::string guessMime(const std::string &filename);

  private:
    static std::optional<FormatKind> fromExtension(const std::string &extension);
    static std::optional<FormatKind> fromContentType(const std::string &contentType);
    static FormatKind fromMagic(const std::string &bytes);
    static OoxmlKind sniffOoxmlKind(const std::string &bytes);
};

} // namespace docshield
