#include "DocShield/OoxmlSanitizer.hpp"

#include "DocShield/OoxmlPackage.hpp"
#include "DocShield/ScanDeadline.hpp"
#include "DocShield/ScanTypes.hpp"

#include <map>
#include <set>

namespace docshield {

namespace {

const std::string kContentTypes = "[Content_Types].xml";

StageResult rebuildPackage(ZipReader &reader, const std::string &original, bool lenient) {
    std::set<std::string> removed;
    std::set<std::string> dropped;
    for (const auto &entry : reader.entries()) {
        if (ooxml::isDangerousPart(entry.name)) {
            dropped.insert(entry.name);
            removed.insert(ooxml::constructForPart(entry.name));
        }
    }
    for (const auto &entry : reader.entries()) {
        if (ooxml::isRelationshipsPart(entry.name) && dropped.count(ooxml::sourcePartOf(entry.name)) > 0) {
            dropped.insert(entry.name);
        }
    }

    std::map<std::string, std::string> replaced;
    for (const auto &entry : reader.entries()) {
        if (dropped.count(entry.name) > 0 || entry.name == kContentTypes) {
            continue;
        }
        const bool rels = ooxml::isRelationshipsPart(entry.name);
        if (!rels && !ooxml::isXmlPart(entry.name)) {
            continue;
        }
        try {
            const auto xml = reader.read(entry);
            if (rels) {
                auto rewrite = ooxml::cleanRelationships(entry.name, xml, dropped);
                if (rewrite.changed()) {
                    removed.insert(rewrite.removed.begin(), rewrite.removed.end());
                    replaced[entry.name] = std::move(rewrite.xml);
                }
            } else if (ooxml::mayContainActiveNodes(xml)) {
                auto rewrite = ooxml::removeActiveNodes(xml);
                if (rewrite.changed()) {
                    removed.insert(rewrite.removed.begin(), rewrite.removed.end());
                    replaced[entry.name] = std::move(rewrite.xml);
                }
            }
        } catch (const std::runtime_error &error) {
            if (!lenient) {
                throw;
            }
            dropped.insert(entry.name);
            removed.insert("damaged_part");
        }
    }

    if (removed.empty()) {
        return StageResult::success(original, {});
    }

    if (const auto *contentTypes = reader.find(kContentTypes)) {
        auto rewrite = ooxml::cleanContentTypes(reader.read(*contentTypes), dropped);
        if (rewrite.changed()) {
            removed.insert(rewrite.removed.begin(), rewrite.removed.end());
            replaced[kContentTypes] = std::move(rewrite.xml);
        }
    } else if (!lenient) {
        throw MalformedContainer("Package has no [Content_Types].xml");
    }

    ZipWriter writer;
    std::size_t iteration = 0;
    for (const auto &entry : reader.entries()) {
        ScanDeadline::poll(iteration++, "ooxml rebuild");
        if (dropped.count(entry.name) > 0) {
            continue;
        }
        const auto replacement = replaced.find(entry.name);
        if (replacement != replaced.end()) {
            writer.add(entry.name, replacement->second, ZipWriter::kDeflated, entry.modified);
            continue;
        }
        std::string data;
        if (lenient) {
            try {
                data = reader.read(entry);
            } catch (const MalformedContainer &) {
                removed.insert("damaged_part");
                continue;
            }
        } else {
            data = reader.read(entry);
        }
        writer.add(entry.name, std::move(data), entry.method, entry.modified);
    }
    if (writer.size() == 0) {
        return StageResult::failure("No members left after cleaning");
    }
    return StageResult::success(writer.finish(), removed);
}

} // namespace

StageResult OoxmlRewriteStage::attempt(const std::string &bytes) const {
    auto reader = ZipReader::open(bytes, zipLimitsFor(settings));
    if (reader.truncated()) {
        return StageResult::failure("Zip entry limit reached");
    }
    return rebuildPackage(reader, bytes, false);
}

StageResult OoxmlSalvageStage::attempt(const std::string &bytes) const {
    auto reader = ZipReader::salvage(bytes, zipLimitsFor(settings));
    if (reader.truncated()) {
        return StageResult::failure("Zip entry limit reached");
    }
    return rebuildPackage(reader, bytes, true);
}

std::string addPackageMarker(const std::string &bytes, const ScanSettings &settings) {
    auto reader = ZipReader::open(bytes, zipLimitsFor(settings));
    ZipWriter writer;
    for (const auto &entry : reader.entries()) {
        writer.add(entry.name, reader.read(entry), entry.method, entry.modified);
    }
    writer.add("docshield.txt", "Sanitized by DocShield.\n", ZipWriter::kStored);
    return writer.finish();
}

} // namespace docshield
