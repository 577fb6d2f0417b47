#include "DocShield/RtfAnalyzer.hpp"

#include "DocShield/RtfDocument.hpp"
#include "DocShield/ScanDeadline.hpp"

#include <set>

namespace docshield {

AnalysisResult RtfAnalyzer::detectFindings(const std::string &bytes) const {
    AnalysisResult result;
    scanSuspiciousStrings(result, bytes);

    const auto document = rtf::Document::parse(bytes, false, rtf::parseLimitsFor(settings));
    if (!rtf::hasRtfHeader(bytes)) {
        result.diagnostics.push_back("Missing {\\rtf header; scanned leniently");
    }
    if (document.truncated()) {
        addFinding(result, "resource_limit", Severity::Info, 0.0,
                   "RTF group or control word limit reached; analysis is partial.");
    }

    std::set<std::string> reported;
    auto report = [&](const std::string &id, const std::string &message, std::size_t offset) {
        if (reported.insert(id).second) {
            addFinding(result, id, Severity::High, 70.0, message, "offset " + std::to_string(offset));
        }
    };

    std::size_t iteration = 0;
    for (const auto &word : document.controlWords()) {
        ScanDeadline::poll(iteration++, "rtf analysis");
        if (word.word == "object" || word.word == "objupdate" || word.word == "objclass") {
            report("rtf_object", "RTF contains an embedded object (\\" + word.word + ").", word.begin);
        } else if (word.word == "objdata") {
            report("rtf_objdata", "RTF contains embedded object data (\\objdata).", word.begin);
        } else if (word.word == "pict") {
            report("rtf_pict", "RTF contains a picture block (\\pict).", word.begin);
        }
    }

    bool plainField = false;
    for (const auto &group : document.groups()) {
        ScanDeadline::poll(iteration++, "rtf analysis");
        if (group.destination != "field") {
            continue;
        }
        switch (rtf::classifyField(document.fieldInstruction(group))) {
        case rtf::FieldKind::Dde:
            report("rtf_dde_field", "RTF field executes a DDE instruction.", group.begin);
            break;
        case rtf::FieldKind::Include:
            report("rtf_include_field", "RTF field includes external content (INCLUDEPICTURE/INCLUDETEXT).", group.begin);
            break;
        case rtf::FieldKind::Plain:
            if (!plainField) {
                plainField = true;
                addFinding(result, "rtf_field", Severity::Low, 10.0, "RTF contains fields.",
                           "offset " + std::to_string(group.begin));
            }
            break;
        }
    }
    return result;
}

} // namespace docshield
