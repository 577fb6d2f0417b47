#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docshield {

enum class Severity { Info, Low, Medium, High, Critical };

enum class Verdict { Benign, Suspicious, Malicious };

enum class FormatFamily { Pdf, Ooxml, Rtf, Unknown };

enum class OoxmlKind { None, WordProcessing, Presentation, Spreadsheet };

struct FormatKind {
    FormatFamily family{FormatFamily::Unknown};
    OoxmlKind ooxml{OoxmlKind::None};
    std::string evidence;
    // Set when the magic bytes name a supported family other than `family`.
    std::optional<FormatFamily> contentFamily;

    // Family used for analysis and sanitization.
    FormatFamily effectiveFamily() const { return contentFamily.value_or(family); }
};

struct Finding {
    std::string id;
    Severity severity{Severity::Info};
    std::string message;
    std::string locator;
};

// Raw bytes are carried in std::string; every byte value is preserved.
struct Artifact {
    std::string bytes;
    std::string filename;
    std::optional<std::string> declaredContentType;
    std::string sha256;

    static Artifact ingest(std::string bytes, std::string filename,
                           std::optional<std::string> declaredContentType = std::nullopt);
};

struct ClassifierSignal {
    bool available{false};
    double probability{0.0};
};

struct RiskAssessment {
    double ruleScore{0.0};
    std::optional<double> classifierProbability;
    double compositeScore{0.0};
    Verdict verdict{Verdict::Benign};
};

struct SanitizationOutcome {
    std::string engineUsed;
    std::vector<std::string> fallbackChainAttempted;
    bool bytesChanged{false};
    bool markerInjected{false};
    std::set<std::string> removedConstructs;
    bool succeeded{false};
    std::string reason;
    std::string output;
};

struct VerificationResult {
    RiskAssessment assessment;
    std::vector<Finding> findings;
    double deltaRisk{0.0};
};

struct ArtifactMetadata {
    std::string filename;
    std::string extension;
    std::string mime;
    std::optional<std::string> declaredContentType;
    std::uint64_t size{0};
    std::string sha256;
};

struct ScanReport {
    ArtifactMetadata artifact;
    FormatKind format;
    RiskAssessment assessment;
    std::vector<Finding> findings;
    std::vector<std::string> recommendations;
    std::optional<SanitizationOutcome> sanitization;
    std::optional<VerificationResult> verification;
    std::vector<std::string> diagnostics;

    bool sanitized() const { return sanitization.has_value() && sanitization->succeeded; }
};

using FeatureMap = std::map<std::string, double>;

class MalformedContainer : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class ResourceLimitExceeded : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Thrown when the scan deadline of the current thread has passed. Not a
// std::exception, so handlers for container errors let it through.
class ScanTimedOut {
  public:
    explicit ScanTimedOut(std::string where) : location(std::move(where)) {}

    const std::string &where() const { return location; }

  private:
    std::string location;
};

std::string toString(Severity severity);
std::string toString(Verdict verdict);
std::string toString(FormatFamily family);
std::string toString(OoxmlKind kind);
std::string describe(const FormatKind &format);

} // namespace docshield
