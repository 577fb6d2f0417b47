#include "DocShield/FormatClassifier.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/ZipArchive.hpp"

#include <map>

namespace docshield {

namespace {

const std::string kOleHeader("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8);

bool startsWith(const std::string &value, const std::string &prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

// %PDF may follow a short junk prefix, as viewers accept.
bool hasPdfMagic(const std::string &bytes) {
    const auto pos = bytes.find("%PDF-");
    return pos != std::string::npos && pos < 1024;
}

bool hasRtfMagic(const std::string &bytes) {
    std::size_t pos = 0;
    while (pos < bytes.size() && pos < 16 && (bytes[pos] == ' ' || bytes[pos] == '\r' || bytes[pos] == '\n' || bytes[pos] == '\t')) {
        ++pos;
    }
    return bytes.compare(pos, 5, "{\\rtf") == 0;
}

FormatKind makeKind(FormatFamily family, std::string evidence, OoxmlKind kind = OoxmlKind::None) {
    FormatKind format;
    format.family = family;
    format.ooxml = kind;
    format.evidence = std::move(evidence);
    return format;
}

OoxmlKind kindFromExtension(const std::string &extension) {
    static const std::map<std::string, OoxmlKind> kinds = {
        {"docx", OoxmlKind::WordProcessing}, {"docm", OoxmlKind::WordProcessing},
        {"dotx", OoxmlKind::WordProcessing}, {"dotm", OoxmlKind::WordProcessing},
        {"pptx", OoxmlKind::Presentation},   {"pptm", OoxmlKind::Presentation},
        {"potx", OoxmlKind::Presentation},   {"ppsx", OoxmlKind::Presentation},
        {"xlsx", OoxmlKind::Spreadsheet},    {"xlsm", OoxmlKind::Spreadsheet},
        {"xltx", OoxmlKind::Spreadsheet},    {"xltm", OoxmlKind::Spreadsheet}
    };
    const auto it = kinds.find(extension);
    return it == kinds.end() ? OoxmlKind::None : it->second;
}

} // namespace

std::string FormatClassifier::extensionOf(const std::string &filename) {
    const auto slash = filename.find_last_of("/\\");
    const auto base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    const auto dot = base.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= base.size()) {
        return {};
    }
    return heuristics::asciiLower(base.substr(dot + 1));
}

std::string FormatClassifier::guessMime(const std::string &filename) {
    static const std::map<std::string, std::string> mimes = {
        {"pdf", "application/pdf"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"rtf", "application/rtf"}
    };
    const auto it = mimes.find(extensionOf(filename));
    return it == mimes.end() ? "application/octet-stream" : it->second;
}

OoxmlKind FormatClassifier::sniffOoxmlKind(const std::string &bytes) {
    try {
        const auto reader = ZipReader::open(bytes);
        bool hasContentTypes = false;
        OoxmlKind kind = OoxmlKind::None;
        for (const auto &entry : reader.entries()) {
            if (entry.name == "[Content_Types].xml") {
                hasContentTypes = true;
            } else if (kind == OoxmlKind::None) {
                if (startsWith(entry.name, "word/")) {
                    kind = OoxmlKind::WordProcessing;
                } else if (startsWith(entry.name, "ppt/")) {
                    kind = OoxmlKind::Presentation;
                } else if (startsWith(entry.name, "xl/")) {
                    kind = OoxmlKind::Spreadsheet;
                }
            }
        }
        if (!hasContentTypes) {
            return OoxmlKind::None;
        }
        return kind == OoxmlKind::None ? OoxmlKind::WordProcessing : kind;
    } catch (const std::exception &) {
        // A zip whose directory cannot be read is not recognisable as OOXML by magic alone.
        return OoxmlKind::None;
    }
}

std::optional<FormatKind> FormatClassifier::fromExtension(const std::string &extension) {
    if (extension == "pdf") {
        return makeKind(FormatFamily::Pdf, "extension .pdf");
    }
    if (extension == "rtf") {
        return makeKind(FormatFamily::Rtf, "extension .rtf");
    }
    const auto kind = kindFromExtension(extension);
    if (kind != OoxmlKind::None) {
        return makeKind(FormatFamily::Ooxml, "extension ." + extension, kind);
    }
    return std::nullopt;
}

std::optional<FormatKind> FormatClassifier::fromContentType(const std::string &contentType) {
    const auto lowered = heuristics::asciiLower(contentType);
    if (lowered.find("application/pdf") != std::string::npos) {
        return makeKind(FormatFamily::Pdf, "content-type " + contentType);
    }
    if (lowered.find("rtf") != std::string::npos) {
        return makeKind(FormatFamily::Rtf, "content-type " + contentType);
    }
    if (lowered.find("wordprocessingml") != std::string::npos) {
        return makeKind(FormatFamily::Ooxml, "content-type " + contentType, OoxmlKind::WordProcessing);
    }
    if (lowered.find("presentationml") != std::string::npos) {
        return makeKind(FormatFamily::Ooxml, "content-type " + contentType, OoxmlKind::Presentation);
    }
    if (lowered.find("spreadsheetml") != std::string::npos) {
        return makeKind(FormatFamily::Ooxml, "content-type " + contentType, OoxmlKind::Spreadsheet);
    }
    return std::nullopt;
}

FormatKind FormatClassifier::fromMagic(const std::string &bytes) {
    if (hasPdfMagic(bytes)) {
        return makeKind(FormatFamily::Pdf, "magic %PDF");
    }
    if (hasRtfMagic(bytes)) {
        return makeKind(FormatFamily::Rtf, "magic {\\rtf");
    }
    if (looksLikeZip(bytes)) {
        const auto kind = sniffOoxmlKind(bytes);
        if (kind != OoxmlKind::None) {
            return makeKind(FormatFamily::Ooxml, "magic PK + [Content_Types].xml", kind);
        }
        return makeKind(FormatFamily::Unknown, "zip-without-content-types");
    }
    if (startsWith(bytes, kOleHeader)) {
        return makeKind(FormatFamily::Unknown, "ole-compound");
    }
    return makeKind(FormatFamily::Unknown, "no-match");
}

FormatKind FormatClassifier::classify(const std::string &filename, const std::string &bytes,
                                      const std::optional<std::string> &declaredContentType) {
    auto format = fromExtension(extensionOf(filename));
    if (!format && declaredContentType) {
        format = fromContentType(*declaredContentType);
    }
    auto magic = fromMagic(bytes);
    if (!format) {
        return magic;
    }
    if (magic.family != FormatFamily::Unknown && magic.family != format->family) {
        format->contentFamily = magic.family;
        if (magic.family == FormatFamily::Ooxml) {
            format->ooxml = magic.ooxml;
        }
    }
    return *format;
}

} // namespace docshield
