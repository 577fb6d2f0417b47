#include "DocShield/DocumentScanner.hpp"
#include "TestDocuments.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>

using namespace docshield;

namespace {

class FixedClassifier : public ThreatClassifier {
  public:
    explicit FixedClassifier(double value) : value(value) {}
    std::optional<double> score(const FeatureMap &) const override { return value; }

  private:
    double value;
};

bool hasFinding(const ScanReport &report, const std::string &id) {
    return std::any_of(report.findings.begin(), report.findings.end(),
                       [&](const Finding &finding) { return finding.id == id; });
}

bool recommends(const ScanReport &report, const std::string &text) {
    return std::find(report.recommendations.begin(), report.recommendations.end(), text) != report.recommendations.end();
}

} // namespace

TEST(DocumentScannerTest, BenignPdfIsLeftAlone) {
    const DocumentScanner scanner;
    const auto bytes = fixtures::benignPdf();
    const auto report = scanner.scan(bytes, "figures.pdf");

    EXPECT_EQ(report.format.family, FormatFamily::Pdf);
    EXPECT_EQ(report.assessment.verdict, Verdict::Benign);
    EXPECT_TRUE(report.findings.empty());
    EXPECT_FALSE(report.sanitization.has_value());
    EXPECT_FALSE(report.verification.has_value());
    EXPECT_FALSE(report.sanitized());
    EXPECT_TRUE(report.recommendations.empty());

    EXPECT_EQ(report.artifact.filename, "figures.pdf");
    EXPECT_EQ(report.artifact.extension, "pdf");
    EXPECT_EQ(report.artifact.mime, "application/pdf");
    EXPECT_EQ(report.artifact.size, bytes.size());
    EXPECT_EQ(report.artifact.sha256.size(), 64u);
}

TEST(DocumentScannerTest, JavascriptPdfIsDisarmedAndVerified) {
    const DocumentScanner scanner;
    const auto bytes = fixtures::javascriptOpenActionPdf();
    const auto report = scanner.scan(bytes, "invoice.pdf");

    EXPECT_EQ(report.assessment.verdict, Verdict::Malicious);
    EXPECT_TRUE(hasFinding(report, "pdf_js_auto"));
    ASSERT_TRUE(report.sanitization.has_value());
    EXPECT_TRUE(report.sanitized());
    EXPECT_EQ(report.sanitization->engineUsed, "pdf_blank");
    EXPECT_NE(report.sanitization->output, bytes);

    ASSERT_TRUE(report.verification.has_value());
    EXPECT_EQ(report.verification->assessment.verdict, Verdict::Benign);
    EXPECT_LT(report.verification->deltaRisk, 0.0);
    EXPECT_TRUE(recommends(report, "Disable JavaScript in your PDF Viewer."));
    EXPECT_TRUE(recommends(report, "Do not open this file on a production workstation."));
}

TEST(DocumentScannerTest, LaunchActionIsCritical) {
    const DocumentScanner scanner;
    const auto report = scanner.scan(fixtures::launchOpenActionPdf(), "open.pdf");
    EXPECT_EQ(report.assessment.verdict, Verdict::Malicious);
    EXPECT_DOUBLE_EQ(report.assessment.compositeScore, 1.0);
    EXPECT_TRUE(report.sanitized());
}

TEST(DocumentScannerTest, MacroDocumentLosesVbaProject) {
    const DocumentScanner scanner;
    fixtures::DocxOptions options;
    options.macro = true;
    const auto report = scanner.scan(fixtures::buildDocx(options), "budget.docm");

    EXPECT_EQ(report.format.family, FormatFamily::Ooxml);
    EXPECT_EQ(report.assessment.verdict, Verdict::Malicious);
    EXPECT_TRUE(recommends(report, "Disable Macros in Microsoft Office Trust Center."));
    ASSERT_TRUE(report.sanitized());
    EXPECT_EQ(report.sanitization->removedConstructs.count("vba_macro"), 1u);
    ASSERT_TRUE(report.verification.has_value());
    EXPECT_FALSE(std::any_of(report.verification->findings.begin(), report.verification->findings.end(),
                             [](const Finding &finding) { return finding.id == "office_macro"; }));
    EXPECT_LT(report.verification->deltaRisk, 0.0);
}

TEST(DocumentScannerTest, RtfObjectIsExcised) {
    const DocumentScanner scanner;
    const auto report = scanner.scan(fixtures::embeddedObjectRtf(), "letter.rtf");
    EXPECT_EQ(report.assessment.verdict, Verdict::Malicious);
    ASSERT_TRUE(report.sanitized());
    EXPECT_EQ(report.sanitization->engineUsed, "rtf_groups");
    ASSERT_TRUE(report.verification.has_value());
    EXPECT_EQ(report.verification->assessment.verdict, Verdict::Benign);
    EXPECT_LT(report.verification->deltaRisk, 0.0);
}

TEST(DocumentScannerTest, RemoteTemplateIsSuspiciousOnly) {
    const DocumentScanner scanner;
    fixtures::DocxOptions options;
    options.remoteTemplate = true;
    const auto report = scanner.scan(fixtures::buildDocx(options), "memo.docx");
    EXPECT_EQ(report.assessment.verdict, Verdict::Suspicious);
    EXPECT_FALSE(report.sanitization.has_value());
}

TEST(DocumentScannerTest, UnknownFormatIsReported) {
    const DocumentScanner scanner;
    const auto report = scanner.scan("MZ\x90 executable bytes", "setup.exe");
    EXPECT_EQ(report.format.family, FormatFamily::Unknown);
    EXPECT_TRUE(hasFinding(report, "unsupported_format"));
    EXPECT_EQ(report.assessment.verdict, Verdict::Benign);
    EXPECT_FALSE(report.sanitization.has_value());
}

TEST(DocumentScannerTest, OversizedMaliciousArtifactKeepsItsFindings) {
    const auto document = fixtures::launchOpenActionPdf();
    ScanSettings settings;
    settings.maxArtifactBytes = document.size() + 16;
    const DocumentScanner scanner(settings);

    const auto report = scanner.scan(document + std::string(4096, ' '), "padded.pdf");
    EXPECT_EQ(report.assessment.verdict, Verdict::Malicious);
    EXPECT_TRUE(hasFinding(report, "pdf_exploit_action"));
    EXPECT_TRUE(hasFinding(report, "resource_limit"));
    EXPECT_FALSE(report.sanitization.has_value());
}

TEST(DocumentScannerTest, OversizedBenignArtifactIsNeverBenign) {
    const auto document = fixtures::benignPdf();
    ScanSettings settings;
    settings.maxArtifactBytes = document.size();
    const DocumentScanner scanner(settings);

    const auto report = scanner.scan(document + std::string(4096, '\n'), "padded.pdf");
    EXPECT_EQ(report.assessment.verdict, Verdict::Suspicious);
    EXPECT_TRUE(hasFinding(report, "resource_limit"));
    EXPECT_EQ(report.artifact.size, document.size() + 4096);
}

TEST(DocumentScannerTest, RenamedPdfIsAnalysedAsPdf) {
    const DocumentScanner scanner;
    const auto report = scanner.scan(fixtures::launchOpenActionPdf(), "notes.docx");
    EXPECT_EQ(report.format.family, FormatFamily::Ooxml);
    ASSERT_TRUE(report.format.contentFamily.has_value());
    EXPECT_EQ(*report.format.contentFamily, FormatFamily::Pdf);
    EXPECT_TRUE(hasFinding(report, "format_mismatch"));
    EXPECT_TRUE(hasFinding(report, "pdf_exploit_action"));
    ASSERT_TRUE(report.sanitized());
    EXPECT_EQ(report.sanitization->engineUsed, "pdf_blank");
}

TEST(DocumentScannerTest, ClassifierCanRaiseVerdict) {
    const DocumentScanner scanner({}, std::make_shared<FixedClassifier>(0.9));
    const auto bytes = fixtures::benignPdf();
    const auto report = scanner.scan(bytes, "clean.pdf");

    EXPECT_EQ(report.assessment.verdict, Verdict::Malicious);
    ASSERT_TRUE(report.assessment.classifierProbability.has_value());
    EXPECT_DOUBLE_EQ(report.assessment.compositeScore, 0.9);
    ASSERT_TRUE(report.sanitization.has_value());
    EXPECT_TRUE(report.sanitization->succeeded);
    EXPECT_FALSE(report.sanitization->bytesChanged);
    EXPECT_EQ(report.sanitization->output, bytes);
    EXPECT_FALSE(report.verification.has_value());
}

TEST(DocumentScannerTest, ScansAreDeterministic) {
    const DocumentScanner scanner;
    const auto bytes = fixtures::namedJavascriptPdf();
    const auto first = scanner.scan(bytes, "a.pdf");
    const auto second = scanner.scan(bytes, "a.pdf");
    ASSERT_EQ(first.findings.size(), second.findings.size());
    for (std::size_t i = 0; i < first.findings.size(); ++i) {
        EXPECT_EQ(first.findings[i].id, second.findings[i].id);
    }
    EXPECT_DOUBLE_EQ(first.assessment.compositeScore, second.assessment.compositeScore);
    ASSERT_TRUE(first.sanitization.has_value() && second.sanitization.has_value());
    EXPECT_EQ(first.sanitization->output, second.sanitization->output);
}

TEST(DocumentScannerTest, EmptyInput) {
    const DocumentScanner scanner;
    const auto report = scanner.scan("", "empty.pdf");
    EXPECT_EQ(report.assessment.verdict, Verdict::Benign);
    EXPECT_FALSE(report.sanitization.has_value());
}

TEST(DocumentScannerTest, ExplainsFindings) {
    EXPECT_NE(explainFinding({"office_macro", Severity::High, "VBA macros", ""}).find("VBA macro"), std::string::npos);
    EXPECT_NE(explainFinding({"pdf_js_auto", Severity::High, "", ""}).find("JavaScript"), std::string::npos);
    EXPECT_TRUE(explainFinding({"high_entropy", Severity::Medium, "packed", ""}).empty());
}

TEST(DocumentScannerTest, ClassifierLoading) {
    EXPECT_EQ(loadClassifier(std::nullopt), nullptr);
    EXPECT_NE(loadClassifier(std::string("/nonexistent/model.csv")), nullptr);
}
