#include "DocShield/OoxmlAnalyzer.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/OoxmlPackage.hpp"

#include <optional>

namespace docshield {

namespace {

bool isVbaProject(const std::string &name) {
    const auto lowered = heuristics::asciiLower(name);
    return lowered.size() >= 14 && lowered.compare(lowered.size() - 14, 14, "vbaproject.bin") == 0;
}

bool hasActiveXMarker(const std::string &xml) {
    return xml.find("<w:control") != std::string::npos || xml.find("ax:ocx") != std::string::npos;
}

} // namespace

AnalysisResult OoxmlAnalyzer::detectFindings(const std::string &bytes) const {
    AnalysisResult result;

    std::optional<ZipReader> reader;
    try {
        reader.emplace(ZipReader::open(bytes, zipLimitsFor(settings)));
    } catch (const std::runtime_error &error) {
        result.diagnostics.push_back(std::string("Container unreadable: ") + error.what());
        addFinding(result, "office_unsupported_structure", Severity::Info, 0.0,
                   "Office container could not be read as a zip package.");
        scanSuspiciousStrings(result, bytes);
        return result;
    }
    if (reader->truncated()) {
        addFinding(result, "resource_limit", Severity::Info, 0.0,
                   "Zip entry limit of " + std::to_string(settings.maxZipEntries) + " reached; analysis is partial.");
    }

    bool macroFound = false;
    bool activeXFound = false;
    std::string activeXLocator;
    std::vector<std::string> externalTargets;
    std::string remoteTemplate;
    std::string text;

    for (const auto &entry : reader->entries()) {
        if (!macroFound && isVbaProject(entry.name)) {
            macroFound = true;
            addFinding(result, "office_macro", Severity::High, 70.0,
                       "Office document contains VBA macros (vbaProject.bin).", entry.name);
        }
        if (heuristics::asciiLower(entry.name).find("/embeddings/") != std::string::npos) {
            addFinding(result, "office_ole", Severity::Medium, 20.0, "Office document contains an embedded OLE object.",
                       entry.name);
        }
        if (!activeXFound && heuristics::asciiLower(entry.name).find("/activex/") != std::string::npos) {
            activeXFound = true;
            activeXLocator = entry.name;
        }

        const bool rels = ooxml::isRelationshipsPart(entry.name);
        if (!rels && !ooxml::isXmlPart(entry.name)) {
            continue;
        }
        std::string xml;
        try {
            xml = reader->read(entry);
        } catch (const ResourceLimitExceeded &error) {
            addFinding(result, "resource_limit", Severity::Info, 0.0, error.what(), entry.name);
            break;
        } catch (const MalformedContainer &error) {
            result.diagnostics.push_back(entry.name + ": " + error.what());
            continue;
        }
        if (text.size() < settings.textScanWindow) {
            text += xml.substr(0, settings.textScanWindow - text.size());
        }

        if (rels) {
            try {
                for (const auto &relationship : ooxml::parseRelationships(xml)) {
                    if (relationship.typeIs("/attachedTemplate") && relationship.isExternal()) {
                        remoteTemplate = relationship.target;
                    } else if (relationship.isExternal() || relationship.typeIs("/externalLink")) {
                        externalTargets.push_back(relationship.target);
                    }
                }
            } catch (const MalformedContainer &error) {
                result.diagnostics.push_back(entry.name + ": " + error.what());
            }
        } else if (!activeXFound && hasActiveXMarker(xml)) {
            activeXFound = true;
            activeXLocator = entry.name;
        }
    }

    if (activeXFound) {
        addFinding(result, "office_activex", Severity::High, 40.0, "Office document contains ActiveX controls.",
                   activeXLocator);
    }
    if (!remoteTemplate.empty()) {
        addFinding(result, "office_remote_template", Severity::High, 50.0,
                   "Document attaches a remote template (template injection).", remoteTemplate);
    }
    if (!externalTargets.empty()) {
        std::string joined;
        for (std::size_t i = 0; i < externalTargets.size() && i < 5; ++i) {
            joined += (i == 0 ? "" : ", ") + externalTargets[i];
        }
        addFinding(result, "office_external_rel", Severity::Medium, 20.0,
                   "Document references " + std::to_string(externalTargets.size()) + " external target(s).", joined);
    }

    scanSuspiciousStrings(result, text);
    return result;
}

} // namespace docshield
