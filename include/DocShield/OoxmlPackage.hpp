#pragma once

#include <set>
#include <string>
#include <vector>

namespace docshield::ooxml {

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
    std::string targetMode;

    bool isExternal() const;
    bool hasUnsafeScheme() const;
    bool typeIs(const std::string &suffix) const;
};

struct XmlRewrite {
    std::string xml;
    std::vector<std::string> removed;

    bool changed() const { return !removed.empty(); }
};

// Members removed from a package wholesale.
bool isDangerousPart(const std::string &name);
// Label recorded in SanitizationOutcome::removedConstructs for a dropped member.
std::string constructForPart(const std::string &name);

bool isRelationshipsPart(const std::string &name);
bool isXmlPart(const std::string &name);

// "word/_rels/document.xml.rels" -> "word/document.xml"; "_rels/.rels" -> "".
std::string sourcePartOf(const std::string &relsPath);
// Resolves an internal target against the directory of its source part.
std::string resolveTarget(const std::string &relsPath, const std::string &target);

// Throws MalformedContainer when the XML cannot be parsed.
std::vector<Relationship> parseRelationships(const std::string &xml);

XmlRewrite cleanRelationships(const std::string &relsPath, const std::string &xml,
                              const std::set<std::string> &droppedParts);
XmlRewrite cleanContentTypes(const std::string &xml, const std::set<std::string> &droppedParts);
// Strips oleObject, control, webExtension and attachedTemplate elements.
XmlRewrite removeActiveNodes(const std::string &xml);
bool mayContainActiveNodes(const std::string &xml);

} // namespace docshield::ooxml
