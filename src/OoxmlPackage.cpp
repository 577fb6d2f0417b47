#include "DocShield/OoxmlPackage.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/ScanTypes.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <functional>
#include <map>

namespace docshield::ooxml {

namespace {

constexpr unsigned int kParseFlags = pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata;

struct StringWriter : pugi::xml_writer {
    std::string text;
    void write(const void *data, size_t size) override { text.append(static_cast<const char *>(data), size); }
};

void loadXml(pugi::xml_document &document, const std::string &xml) {
    const auto result = document.load_buffer(xml.data(), xml.size(), kParseFlags, pugi::encoding_utf8);
    if (!result) {
        throw MalformedContainer(std::string("XML parse error: ") + result.description() + " at offset " +
                                 std::to_string(result.offset));
    }
}

std::string saveXml(const pugi::xml_document &document) {
    StringWriter writer;
    document.save(writer, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return writer.text;
}

std::string localName(const char *qualified) {
    const std::string name(qualified);
    const auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

bool containsPath(const std::string &name, const std::string &segment) {
    return heuristics::asciiLower(name).find(segment) != std::string::npos;
}

std::string normalizePath(const std::string &path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto part = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    std::string joined;
    for (const auto &part : parts) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += part;
    }
    return joined;
}

} // namespace

bool Relationship::isExternal() const {
    return heuristics::asciiLower(targetMode) == "external" || target.find("://") != std::string::npos ||
           target.rfind("\\\\", 0) == 0 || hasUnsafeScheme();
}

bool Relationship::hasUnsafeScheme() const {
    static const std::vector<std::string> schemes = {"file:", "javascript:", "vbscript:", "data:", "mhtml:"};
    const auto lowered = heuristics::asciiLower(target);
    return std::any_of(schemes.begin(), schemes.end(),
                       [&](const std::string &scheme) { return lowered.rfind(scheme, 0) == 0; });
}

bool Relationship::typeIs(const std::string &suffix) const {
    return type.size() >= suffix.size() && type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isDangerousPart(const std::string &name) {
    const auto lowered = heuristics::asciiLower(name);
    const auto slash = lowered.find_last_of('/');
    const auto base = slash == std::string::npos ? lowered : lowered.substr(slash + 1);
    if (base == "vbaproject.bin" || base == "vbaprojectsignature.bin" || base == "vbadata.xml") {
        return true;
    }
    return containsPath(name, "/embeddings/") || containsPath(name, "/activex/") ||
           containsPath(name, "/webextensions/") || containsPath(name, "/externallinks/") ||
           lowered.rfind("webextensions/", 0) == 0;
}

std::string constructForPart(const std::string &name) {
    if (containsPath(name, "vbaproject") || containsPath(name, "vbadata")) {
        return "vba_macro";
    }
    if (containsPath(name, "/embeddings/")) {
        return "embedded_ole";
    }
    if (containsPath(name, "/activex/")) {
        return "activex";
    }
    if (containsPath(name, "webextensions/")) {
        return "web_extension";
    }
    return "external_link";
}

bool isRelationshipsPart(const std::string &name) {
    return name.size() > 5 && name.compare(name.size() - 5, 5, ".rels") == 0;
}

bool isXmlPart(const std::string &name) {
    return name.size() > 4 && heuristics::asciiLower(name.substr(name.size() - 4)) == ".xml";
}

std::string sourcePartOf(const std::string &relsPath) {
    const auto marker = relsPath.rfind("_rels/");
    if (marker == std::string::npos || !isRelationshipsPart(relsPath)) {
        return {};
    }
    const auto directory = relsPath.substr(0, marker);
    const auto file = relsPath.substr(marker + 6, relsPath.size() - marker - 6 - 5);
    return directory + file;
}

std::string resolveTarget(const std::string &relsPath, const std::string &target) {
    if (!target.empty() && target[0] == '/') {
        return normalizePath(target.substr(1));
    }
    const auto source = sourcePartOf(relsPath);
    const auto slash = source.find_last_of('/');
    const auto directory = slash == std::string::npos ? std::string() : source.substr(0, slash + 1);
    return normalizePath(directory + target);
}

std::vector<Relationship> parseRelationships(const std::string &xml) {
    pugi::xml_document document;
    loadXml(document, xml);
    std::vector<Relationship> relationships;
    for (const auto &node : document.document_element().children()) {
        if (localName(node.name()) != "Relationship") {
            continue;
        }
        Relationship relationship;
        relationship.id = node.attribute("Id").value();
        relationship.type = node.attribute("Type").value();
        relationship.target = node.attribute("Target").value();
        relationship.targetMode = node.attribute("TargetMode").value();
        relationships.push_back(std::move(relationship));
    }
    return relationships;
}

XmlRewrite cleanRelationships(const std::string &relsPath, const std::string &xml,
                              const std::set<std::string> &droppedParts) {
    pugi::xml_document document;
    loadXml(document, xml);
    XmlRewrite rewrite;

    std::vector<pugi::xml_node> doomed;
    for (const auto &node : document.document_element().children()) {
        if (localName(node.name()) != "Relationship") {
            continue;
        }
        Relationship relationship;
        relationship.id = node.attribute("Id").value();
        relationship.type = node.attribute("Type").value();
        relationship.target = node.attribute("Target").value();
        relationship.targetMode = node.attribute("TargetMode").value();

        std::string label;
        if (relationship.typeIs("/attachedTemplate") && relationship.isExternal()) {
            label = "remote_template";
        } else if (relationship.typeIs("/externalLink") || relationship.typeIs("/externalLinkPath")) {
            label = "external_link";
        } else if (relationship.isExternal()) {
            label = "external_relationship";
        } else if (droppedParts.count(resolveTarget(relsPath, relationship.target)) > 0) {
            label = "dangling_relationship";
        }
        if (!label.empty()) {
            doomed.push_back(node);
            rewrite.removed.push_back(label);
        }
    }
    for (auto &node : doomed) {
        node.parent().remove_child(node);
    }
    rewrite.xml = rewrite.changed() ? saveXml(document) : xml;
    return rewrite;
}

XmlRewrite cleanContentTypes(const std::string &xml, const std::set<std::string> &droppedParts) {
    static const std::vector<std::string> dangerousTypes = {
        "vbaproject", "vbadata", "activex", "webextension", "externallink", "oleobject"
    };
    static const std::map<std::string, std::string> macroFreeTypes = {
        {"application/vnd.ms-word.document.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"},
        {"application/vnd.ms-word.template.macroEnabledTemplate.main+xml",
         "application/vnd.openxmlformats-officedocument.wordprocessingml.template.main+xml"},
        {"application/vnd.ms-excel.sheet.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"},
        {"application/vnd.ms-powerpoint.presentation.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.presentationml.presentation.main+xml"}
    };
    pugi::xml_document document;
    loadXml(document, xml);
    XmlRewrite rewrite;

    std::vector<pugi::xml_node> doomed;
    for (auto node : document.document_element().children()) {
        if (localName(node.name()) != "Override") {
            continue;
        }
        auto contentType = node.attribute("ContentType");
        const auto lowered = heuristics::asciiLower(contentType.value());
        std::string part = node.attribute("PartName").value();
        if (!part.empty() && part[0] == '/') {
            part = part.substr(1);
        }
        const bool dangerous = droppedParts.count(part) > 0 ||
                               std::any_of(dangerousTypes.begin(), dangerousTypes.end(), [&](const std::string &marker) {
                                   return lowered.find(marker) != std::string::npos;
                               });
        if (dangerous) {
            doomed.push_back(node);
            rewrite.removed.push_back("content_type_override");
            continue;
        }
        const auto downgrade = macroFreeTypes.find(contentType.value());
        if (downgrade != macroFreeTypes.end()) {
            contentType.set_value(downgrade->second.c_str());
            rewrite.removed.push_back("macro_content_type");
        }
    }
    for (auto &node : doomed) {
        node.parent().remove_child(node);
    }
    rewrite.xml = rewrite.changed() ? saveXml(document) : xml;
    return rewrite;
}

bool mayContainActiveNodes(const std::string &xml) {
    static const std::vector<std::string> markers = {"attachedTemplate", "control", "oleObj", "OLEObject", "webExtension"};
    return std::any_of(markers.begin(), markers.end(),
                       [&](const std::string &marker) { return xml.find(marker) != std::string::npos; });
}

XmlRewrite removeActiveNodes(const std::string &xml) {
    static const std::set<std::string> doomedNames = {
        "attachedTemplate", "control", "controls", "oleObject", "oleObjects", "OLEObject", "oleObj",
        "webExtension", "webExtensionRef", "webExtensions"
    };
    pugi::xml_document document;
    loadXml(document, xml);
    XmlRewrite rewrite;

    std::vector<pugi::xml_node> doomed;
    std::function<void(pugi::xml_node, int)> visit = [&](pugi::xml_node node, int depth) {
        if (depth > 256) {
            throw MalformedContainer("XML nested too deeply");
        }
        for (auto child : node.children()) {
            if (child.type() != pugi::node_element) {
                continue;
            }
            const auto name = localName(child.name());
            if (doomedNames.count(name) > 0) {
                doomed.push_back(child);
                rewrite.removed.push_back(name == "attachedTemplate" ? "attached_template"
                                          : name.rfind("webExtension", 0) == 0 ? "web_extension"
                                          : name.rfind("control", 0) == 0 ? "activex"
                                                                            : "ole_object");
            } else {
                visit(child, depth + 1);
            }
        }
    };
    visit(document, 0);
    for (auto &node : doomed) {
        node.parent().remove_child(node);
    }
    rewrite.xml = rewrite.changed() ? saveXml(document) : xml;
    return rewrite;
}

} // namespace docshield::ooxml
