#include "DocShield/PdfAnalyzer.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/ScanDeadline.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

namespace docshield {

namespace {

std::string locate(const pdf::IndirectObject &object) {
    return "obj " + std::to_string(object.number) + " " + std::to_string(object.generation);
}

bool hasActiveContent(const pdf::Object &object, int depth) {
    if (depth > pdf::kMaxNesting) {
        return false;
    }
    if (object.isDictionary()) {
        const auto *subtype = object.get("S");
        if (subtype != nullptr && subtype->isName("Launch")) {
            return true;
        }
        if (object.has("JS") || object.has("JavaScript")) {
            return true;
        }
        for (const auto &entry : object.entries) {
            if (hasActiveContent(entry.value, depth + 1)) {
                return true;
            }
        }
    } else if (object.type == pdf::ObjectType::Array) {
        for (const auto &item : object.items) {
            if (hasActiveContent(item, depth + 1)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

bool PdfAnalyzer::isExploitAction(const std::string &subtype) {
    return subtype == "Launch" || subtype == "SubmitForm" || subtype == "ImportData";
}

AnalysisResult PdfAnalyzer::detectFindings(const std::string &bytes) const {
    AnalysisResult result;
    scanSuspiciousStrings(result, bytes);

    try {
        const auto document = pdf::Document::parse(bytes, settings.maxPdfObjects);
        for (const auto &note : document.diagnostics()) {
            result.diagnostics.push_back(note);
        }
        if (document.encrypted()) {
            result.diagnostics.push_back("Document is encrypted; strings and streams were not decrypted");
        }
        inspectCatalog(result, document);
        inspectObjects(result, document);
        if (document.truncated()) {
            addFinding(result, "pdf_object_limit", Severity::Info, 0.0,
                       "Object limit of " + std::to_string(settings.maxPdfObjects) + " reached; analysis is partial.");
        }
    } catch (const std::runtime_error &error) {
        result.diagnostics.push_back(std::string("Structural PDF parse failed: ") + error.what());
        rawPatternFallback(result, bytes);
    }

    inspectEntropy(result, bytes);
    return result;
}

void PdfAnalyzer::inspectCatalog(AnalysisResult &result, const pdf::Document &document) const {
    const auto *catalog = document.catalog();
    const auto *catalogObject = document.catalogObject();
    const auto locator = catalogObject == nullptr ? std::string("catalog") : locate(*catalogObject);

    const auto *openAction = document.resolve(catalog->get("OpenAction"));
    if (openAction != nullptr && openAction->isDictionary()) {
        const auto *subtype = openAction->get("S");
        if (subtype != nullptr && subtype->type == pdf::ObjectType::Name) {
            if (isExploitAction(subtype->text)) {
                addFinding(result, "pdf_exploit_action", Severity::Critical, 80.0,
                           "PDF auto-launch action detected (/" + subtype->text + ").", locator + " /OpenAction");
            } else if (subtype->text == "JavaScript") {
                addFinding(result, "pdf_js_auto", Severity::High, 50.0, "PDF OpenAction executes JavaScript.",
                           locator + " /OpenAction");
            }
        }
    }

    if (catalog->has("AA")) {
        addFinding(result, "pdf_aa_action", Severity::High, 40.0, "PDF contains global additional actions (/AA).",
                   locator + " /AA");
    }

    const auto *names = document.resolve(catalog->get("Names"));
    if (names != nullptr && names->isDictionary() && names->has("JavaScript")) {
        addFinding(result, "pdf_names_js", Severity::High, 50.0, "PDF contains named JavaScript scripts.",
                   locator + " /Names /JavaScript");
    }
}

void PdfAnalyzer::inspectObjects(AnalysisResult &result, const pdf::Document &document) const {
    std::size_t iteration = 0;
    for (const auto &object : document.objects()) {
        ScanDeadline::poll(iteration++, "pdf object inspection");
        if (hasActiveContent(object.value, 0)) {
            addFinding(result, "pdf_deep_js", Severity::High, 60.0, "Hidden JavaScript/Launch actions found in objects.",
                       locate(object));
            return;
        }
    }
}

void PdfAnalyzer::rawPatternFallback(AnalysisResult &result, const std::string &bytes) const {
    static const std::vector<std::string> patterns = {"/JavaScript", "/JS", "/Launch", "/OpenAction", "/AA"};
    for (const auto &pattern : patterns) {
        if (bytes.find(pattern) != std::string::npos) {
            addFinding(result, "pdf_regex_match", Severity::Medium, 40.0,
                       "PDF raw structure matches script patterns (" + pattern + ").");
            return;
        }
    }
}

void PdfAnalyzer::inspectEntropy(AnalysisResult &result, const std::string &bytes) const {
    const auto entropy = heuristics::normalizedEntropy(bytes, settings.entropyWindow, settings.entropyChunkSize);
    if (entropy > settings.entropyThreshold) {
        std::ostringstream message;
        message << "High entropy (" << std::fixed << std::setprecision(2) << entropy
                << ") indicates packed/encrypted content.";
        addFinding(result, "high_entropy", Severity::Medium, 20.0, message.str());
    }
}

} // namespace docshield
