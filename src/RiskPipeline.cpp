#include "DocShield/RiskPipeline.hpp"

#include "DocShield/FormatClassifier.hpp"
#include "DocShield/OoxmlAnalyzer.hpp"
#include "DocShield/PdfAnalyzer.hpp"
#include "DocShield/RiskAggregator.hpp"
#include "DocShield/RtfAnalyzer.hpp"
#include "DocShield/ScanDeadline.hpp"

namespace docshield {

RiskPipeline::RiskPipeline(const ScanSettings &settings, std::shared_ptr<const ThreatClassifier> classifier)
    : settings(settings), classifier(std::move(classifier)), extractor(settings) {
    analyzers[FormatFamily::Pdf] = std::make_unique<PdfAnalyzer>(settings);
    analyzers[FormatFamily::Ooxml] = std::make_unique<OoxmlAnalyzer>(settings);
    analyzers[FormatFamily::Rtf] = std::make_unique<RtfAnalyzer>(settings);
    analyzers[FormatFamily::Unknown] = std::make_unique<NullAnalyzer>(settings);
}

const DocumentAnalyzer &RiskPipeline::analyzerFor(FormatFamily family) const {
    const auto it = analyzers.find(family);
    return it == analyzers.end() ? *analyzers.at(FormatFamily::Unknown) : *it->second;
}

Evaluation RiskPipeline::evaluate(const std::string &bytes, const std::string &filename,
                                  const std::optional<std::string> &declaredContentType) const {
    return evaluate(bytes, FormatClassifier::classify(filename, bytes, declaredContentType));
}

Evaluation RiskPipeline::evaluate(const std::string &bytes, const FormatKind &format) const {
    Evaluation evaluation;
    evaluation.format = format;

    auto analysis = analyzerFor(format.effectiveFamily()).detectFindings(bytes);
    ScanDeadline::check("analysis");
    if (format.contentFamily) {
        analysis.rulePoints += 20.0;
        analysis.findings.push_back({"format_mismatch", Severity::Medium,
                                     "File is labelled " + toString(format.family) + " but its content is " +
                                         toString(*format.contentFamily) + "; analysed as the latter.",
                                     format.evidence});
    }
    evaluation.findings = std::move(analysis.findings);
    evaluation.diagnostics = std::move(analysis.diagnostics);

    evaluation.features = extractor.extract(bytes, format);
    if (classifier) {
        evaluation.signal = classifier->signal(evaluation.features);
        if (!evaluation.signal.available) {
            evaluation.diagnostics.push_back("Classifier unavailable; verdict uses rule score only");
        }
    }
    ScanDeadline::check("classification");

    evaluation.assessment = RiskAggregator::assess(evaluation.findings, analysis.ruleScore(), evaluation.signal);
    return evaluation;
}

VerificationResult ConsistencyVerifier::verify(const RiskAssessment &before, const std::string &sanitized,
                                               const std::string &filename,
                                               const std::optional<std::string> &declaredContentType) const {
    auto evaluation = pipeline.evaluate(sanitized, filename, declaredContentType);
    VerificationResult result;
    result.assessment = evaluation.assessment;
    result.findings = std::move(evaluation.findings);
    result.deltaRisk = result.assessment.compositeScore - before.compositeScore;
    return result;
}

} // namespace docshield
