#include "DocShield/DocumentScanner.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/FormatClassifier.hpp"

#include <algorithm>

namespace docshield {

namespace {

ArtifactMetadata describeArtifact(const Artifact &artifact) {
    ArtifactMetadata metadata;
    metadata.filename = artifact.filename;
    metadata.extension = FormatClassifier::extensionOf(artifact.filename);
    metadata.mime = FormatClassifier::guessMime(artifact.filename);
    metadata.declaredContentType = artifact.declaredContentType;
    metadata.size = artifact.bytes.size();
    metadata.sha256 = artifact.sha256;
    return metadata;
}

ScanReport internalErrorReport(const std::string &bytes, const std::string &filename,
                               const std::optional<std::string> &declaredContentType, const std::string &reason) {
    ScanReport report;
    report.artifact.filename = filename;
    report.artifact.extension = FormatClassifier::extensionOf(filename);
    report.artifact.mime = FormatClassifier::guessMime(filename);
    report.artifact.declaredContentType = declaredContentType;
    report.artifact.size = bytes.size();
    report.findings.push_back({"scan_internal_error", Severity::Info, "Scan failed internally: " + reason, {}});
    report.assessment.verdict = Verdict::Benign;
    report.diagnostics.push_back(reason);
    return report;
}

} // namespace

DocumentScanner::DocumentScanner(ScanSettings settings, std::shared_ptr<const ThreatClassifier> classifier)
    : config(std::move(settings)), classifier(std::move(classifier)), pipeline(config, this->classifier),
      engine(config), verifier(pipeline) {}

ScanReport DocumentScanner::scan(const std::string &bytes, const std::string &filename,
                                 const std::optional<std::string> &declaredContentType) const {
    try {
        return runScan(Artifact::ingest(bytes, filename, declaredContentType));
    } catch (const std::exception &error) {
        return internalErrorReport(bytes, filename, declaredContentType, error.what());
    }
}

ScanReport DocumentScanner::runScan(const Artifact &artifact) const {
    ScanReport report;
    report.artifact = describeArtifact(artifact);
    report.format = FormatClassifier::classify(artifact.filename, artifact.bytes, artifact.declaredContentType);

    if (artifact.bytes.size() > config.maxArtifactBytes) {
        // Only a prefix is analysed; an oversized artifact is never reported clean.
        const auto prefix = artifact.bytes.substr(0, static_cast<std::size_t>(config.maxArtifactBytes));
        auto evaluation = pipeline.evaluate(prefix, report.format);
        report.findings = std::move(evaluation.findings);
        report.findings.push_back({"resource_limit", Severity::Info,
                                   "Artifact of " + std::to_string(artifact.bytes.size()) +
                                       " bytes exceeds the size limit; only the first " + std::to_string(prefix.size()) +
                                       " bytes were analysed.",
                                   {}});
        report.diagnostics = std::move(evaluation.diagnostics);
        report.diagnostics.push_back("Artifact larger than max_artifact_bytes; sanitization skipped");
        report.assessment = evaluation.assessment;
        if (report.assessment.verdict == Verdict::Benign) {
            report.assessment.verdict = Verdict::Suspicious;
        }
        report.recommendations = recommendationsFor(report.assessment, report.findings);
        return report;
    }

    auto evaluation = pipeline.evaluate(artifact.bytes, report.format);
    report.findings = std::move(evaluation.findings);
    report.diagnostics = std::move(evaluation.diagnostics);
    report.assessment = evaluation.assessment;

    if (report.assessment.verdict == Verdict::Malicious) {
        auto outcome = engine.sanitize(report.format, artifact.bytes);
        if (outcome.succeeded && outcome.bytesChanged) {
            report.verification =
                verifier.verify(report.assessment, outcome.output, artifact.filename, artifact.declaredContentType);
        }
        report.sanitization = std::move(outcome);
    }

    report.recommendations = recommendationsFor(report.assessment, report.findings);
    return report;
}

SanitizationOutcome DocumentScanner::sanitize(const FormatKind &format, const std::string &bytes) const {
    return engine.sanitize(format, bytes);
}

std::vector<std::string> recommendationsFor(const RiskAssessment &assessment, const std::vector<Finding> &findings) {
    std::vector<std::string> recommendations;
    if (assessment.verdict == Verdict::Malicious) {
        recommendations.emplace_back("Do not open this file on a production workstation.");
        recommendations.emplace_back("Use the sanitized version if available.");
    }
    auto any = [&](auto predicate) { return std::any_of(findings.begin(), findings.end(), predicate); };
    if (any([](const Finding &finding) { return finding.id == "office_macro"; })) {
        recommendations.emplace_back("Disable Macros in Microsoft Office Trust Center.");
    }
    if (any([](const Finding &finding) { return finding.id.rfind("pdf_js", 0) == 0; })) {
        recommendations.emplace_back("Disable JavaScript in your PDF Viewer.");
    }
    return recommendations;
}

std::string explainFinding(const Finding &finding) {
    const auto text = heuristics::asciiLower(finding.id + " " + finding.message);
    if (text.find("vba") != std::string::npos || text.find("macro") != std::string::npos) {
        return "This Office document contains a VBA macro that may run code when content is enabled.";
    }
    if (text.find("javascript") != std::string::npos || text.find("openaction") != std::string::npos ||
        text.find("pdf_js") != std::string::npos || text.find("launch") != std::string::npos) {
        return "This PDF declares JavaScript or auto-run actions, often abused to execute code on open.";
    }
    if (text.find("embedded") != std::string::npos && (text.find("object") != std::string::npos || text.find("file") != std::string::npos)) {
        return "Embedded object/file detected; payloads can be hidden inside embedded objects.";
    }
    if (text.find("rtf") != std::string::npos && (text.find("object") != std::string::npos || text.find("field") != std::string::npos)) {
        return "RTF object/field constructs detected; these are frequently abused to launch external content.";
    }
    return {};
}

std::shared_ptr<const ThreatClassifier> loadClassifier(const std::optional<std::string> &modelPath) {
    if (!modelPath || modelPath->empty()) {
        return nullptr;
    }
    return std::make_shared<const LogisticModelClassifier>(*modelPath);
}

} // namespace docshield
