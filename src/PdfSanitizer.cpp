#include "DocShield/PdfSanitizer.hpp"

#include "DocShield/PdfDocument.hpp"
#include "DocShield/ScanDeadline.hpp"
#include "DocShield/ScanTypes.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFWriter.hh>

#include <map>
#include <set>
#include <vector>

namespace docshield {

namespace {

using pdf::Object;
using pdf::ObjectType;

struct Span {
    std::size_t begin;
    std::size_t end;
};

// Key -> removed construct label.
const std::map<std::string, std::string> &dangerousKeys() {
    static const std::map<std::string, std::string> keys = {
        {"OpenAction", "open_action"}, {"AA", "additional_actions"}, {"JS", "javascript"},
        {"JavaScript", "javascript"},  {"XFA", "xfa"},               {"EmbeddedFiles", "embedded_files"},
        {"RichMedia", "rich_media"},   {"RichMediaContent", "rich_media"}
    };
    return keys;
}

bool isDangerousAction(const Object &object) {
    if (!object.isDictionary()) {
        return false;
    }
    const auto *subtype = object.get("S");
    return subtype != nullptr && subtype->type == ObjectType::Name && isDangerousActionType(subtype->text);
}

class BlankingPlan {
  public:
    explicit BlankingPlan(const pdf::Document &document) : document(document) {}

    // Returns false when danger sits where it cannot be blanked in place.
    bool collect() {
        for (const auto &object : document.objects()) {
            found = false;
            if (isDangerousAction(object.value)) {
                found = true;
                removed.insert("action");
                if (!object.inObjectStream && object.value.end >= object.value.begin + 4) {
                    spans.push_back({object.value.begin + 2, object.value.end - 2});
                }
            } else {
                visit(object.value, 0);
            }
            if (object.inObjectStream && found) {
                return false;
            }
        }
        for (const auto number : scriptStreams) {
            const auto *target = document.find(number);
            if (target != nullptr && target->hasStream && !target->inObjectStream) {
                spans.push_back({target->streamBegin, target->streamEnd});
            }
        }
        return true;
    }

    std::vector<Span> spans;
    std::set<std::string> removed;

  private:
    void visit(const Object &object, int depth) {
        if (depth > pdf::kMaxNesting) {
            return;
        }
        if (object.isDictionary()) {
            for (const auto &entry : object.entries) {
                const auto key = dangerousKeys().find(entry.key);
                if (key != dangerousKeys().end()) {
                    mark(entry.keyBegin, entry.value.end, key->second);
                    if ((entry.key == "JS") && entry.value.type == ObjectType::Reference) {
                        scriptStreams.push_back(entry.value.refNumber);
                    }
                } else if (isDangerousAction(entry.value)) {
                    mark(entry.keyBegin, entry.value.end, "action");
                } else {
                    visit(entry.value, depth + 1);
                }
            }
        } else if (object.type == ObjectType::Array) {
            for (const auto &item : object.items) {
                if (isDangerousAction(item)) {
                    mark(item.begin, item.end, "action");
                } else {
                    visit(item, depth + 1);
                }
            }
        }
    }

    void mark(std::size_t begin, std::size_t end, const std::string &label) {
        found = true;
        removed.insert(label);
        spans.push_back({begin, end});
    }

    const pdf::Document &document;
    std::vector<int> scriptStreams;
    bool found{false};
};

bool isDangerousAction(QPDFObjectHandle object) {
    if (!object.isDictionary()) {
        return false;
    }
    auto subtype = object.getKey("/S");
    return subtype.isName() && isDangerousActionType(subtype.getName().substr(1));
}

// Removes active content from a qpdf object graph in place. Indirect objects
// are reached through QPDF::getAllObjects, so only direct values recurse.
class QpdfCleaner {
  public:
    void cleanDocument(QPDF &document) {
        std::size_t iteration = 0;
        for (auto &object : document.getAllObjects()) {
            ScanDeadline::poll(iteration++, "pdf rebuild");
            clean(object.isStream() ? object.getDict() : object, 0);
        }
    }

    std::set<std::string> removed;

  private:
    void clean(QPDFObjectHandle object, int depth) {
        if (depth > pdf::kMaxNesting) {
            return;
        }
        if (object.isDictionary()) {
            if (isDangerousAction(object)) {
                for (const auto &key : object.getKeys()) {
                    object.removeKey(key);
                }
                removed.insert("action");
                return;
            }
            for (const auto &key : object.getKeys()) {
                const auto bare = key.substr(1);
                const auto label = dangerousKeys().find(bare);
                if (label != dangerousKeys().end()) {
                    object.removeKey(key);
                    removed.insert(label->second);
                    continue;
                }
                if (bare == "Annots" || bare == "AcroForm") {
                    object.removeKey(key);
                    removed.insert(bare == "Annots" ? "annotations" : "acroform");
                    continue;
                }
                auto value = object.getKey(key);
                if (value.isIndirect()) {
                    continue;
                }
                if (isDangerousAction(value)) {
                    object.removeKey(key);
                    removed.insert("action");
                    continue;
                }
                clean(value, depth + 1);
            }
        } else if (object.isArray()) {
            for (int i = object.getArrayNItems() - 1; i >= 0; --i) {
                auto item = object.getArrayItem(i);
                if (item.isIndirect()) {
                    continue;
                }
                if (isDangerousAction(item)) {
                    object.eraseItem(i);
                    removed.insert("action");
                    continue;
                }
                clean(item, depth + 1);
            }
        }
    }
};

} // namespace

bool isDangerousActionType(const std::string &subtype) {
    return subtype == "JavaScript" || subtype == "Launch" || subtype == "SubmitForm" || subtype == "ImportData" ||
           subtype == "RichMediaExecute" || subtype == "GoToE";
}

StageResult PdfBlankingStage::attempt(const std::string &bytes) const {
    const auto document = pdf::Document::parse(bytes, settings.maxPdfObjects);
    if (document.truncated()) {
        return StageResult::failure("Object limit reached; document cannot be disarmed in place");
    }
    if (document.skippedObjects() > 0) {
        return StageResult::failure(std::to_string(document.skippedObjects()) + " damaged object(s) present");
    }

    BlankingPlan plan(document);
    if (!plan.collect()) {
        return StageResult::failure("Active content inside compressed object streams");
    }
    if (plan.spans.empty()) {
        return StageResult::success(bytes, {});
    }

    std::string output = bytes;
    for (const auto &span : plan.spans) {
        for (std::size_t i = span.begin; i < span.end && i < output.size(); ++i) {
            if (output[i] != '\r' && output[i] != '\n') {
                output[i] = ' ';
            }
        }
    }
    return StageResult::success(std::move(output), plan.removed);
}

StageResult PdfRebuildStage::attempt(const std::string &bytes) const {
    QPDF document;
    document.setSuppressWarnings(true);
    document.setAttemptRecovery(true);
    document.processMemoryFile("artifact.pdf", bytes.data(), bytes.size());
    if (document.isEncrypted()) {
        return StageResult::failure("Encrypted documents cannot be rebuilt");
    }

    QpdfCleaner cleaner;
    cleaner.cleanDocument(document);
    if (cleaner.removed.empty()) {
        return StageResult::success(bytes, {});
    }

    // Unreferenced objects, detached scripts included, are not written.
    QPDFWriter writer(document);
    writer.setOutputMemory();
    writer.setObjectStreamMode(qpdf_o_disable);
    writer.setDeterministicID(true);
    writer.write();
    const auto buffer = writer.getBufferSharedPointer();
    std::string output(reinterpret_cast<const char *>(buffer->getBuffer()), buffer->getSize());
    return StageResult::success(std::move(output), cleaner.removed);
}

} // namespace docshield
