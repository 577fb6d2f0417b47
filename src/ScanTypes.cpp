#include "DocShield/ScanTypes.hpp"

#include "DocShield/Crypto.hpp"

namespace docshield {

Artifact Artifact::ingest(std::string bytes, std::string filename, std::optional<std::string> declaredContentType) {
    Artifact artifact;
    artifact.sha256 = crypto::sha256(bytes);
    artifact.bytes = std::move(bytes);
    artifact.filename = std::move(filename);
    artifact.declaredContentType = std::move(declaredContentType);
    return artifact;
}

std::string toString(Severity severity) {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    case Severity::Critical:
        return "critical";
    }
    return "info";
}

std::string toString(Verdict verdict) {
    switch (verdict) {
    case Verdict::Benign:
        return "benign";
    case Verdict::Suspicious:
        return "suspicious";
    case Verdict::Malicious:
        return "malicious";
    }
    return "benign";
}

std::string toString(FormatFamily family) {
    switch (family) {
    case FormatFamily::Pdf:
        return "pdf";
    case FormatFamily::Ooxml:
        return "ooxml";
    case FormatFamily::Rtf:
        return "rtf";
    case FormatFamily::Unknown:
        return "unknown";
    }
    return "unknown";
}

std::string toString(OoxmlKind kind) {
    switch (kind) {
    case OoxmlKind::None:
        return "none";
    case OoxmlKind::WordProcessing:
        return "wordprocessing";
    case OoxmlKind::Presentation:
        return "presentation";
    case OoxmlKind::Spreadsheet:
        return "spreadsheet";
    }
    return "none";
}

std::string describe(const FormatKind &format) {
    std::string text = format.family == FormatFamily::Ooxml ? "ooxml/" + toString(format.ooxml) : toString(format.family);
    if (format.contentFamily) {
        text += " (content is " + toString(*format.contentFamily) + ")";
    }
    return text;
}

} // namespace docshield
