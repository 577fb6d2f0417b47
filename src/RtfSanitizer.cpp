#include "DocShield/RtfSanitizer.hpp"

#include "DocShield/RtfDocument.hpp"
#include "DocShield/ScanDeadline.hpp"

#include <algorithm>
#include <vector>

namespace docshield {

namespace {

struct Excision {
    std::size_t begin;
    std::size_t end;
};

std::string labelForGroup(const rtf::Document &document, const rtf::Group &group) {
    if (group.destination == "object") {
        return "embedded_object";
    }
    if (group.destination == "objdata") {
        return "object_data";
    }
    if (group.destination == "pict") {
        return "picture";
    }
    if (group.destination == "field") {
        switch (rtf::classifyField(document.fieldInstruction(group))) {
        case rtf::FieldKind::Dde:
            return "dde_field";
        case rtf::FieldKind::Include:
            return "include_field";
        case rtf::FieldKind::Plain:
            break;
        }
    }
    return {};
}

bool isDangerousWord(const std::string &word) {
    return word == "object" || word == "objdata" || word == "objupdate" || word == "objclass" || word == "pict";
}

// Answers "is this offset excised" for non-decreasing offsets over sorted,
// disjoint excisions.
class CoverageSweep {
  public:
    explicit CoverageSweep(const std::vector<Excision> &excisions) : excisions(excisions) {}

    bool covers(std::size_t offset) {
        while (next < excisions.size() && excisions[next].end <= offset) {
            ++next;
        }
        return next < excisions.size() && excisions[next].begin <= offset;
    }

  private:
    const std::vector<Excision> &excisions;
    std::size_t next{0};
};

// Outermost dangerous groups, in document order.
std::vector<Excision> planGroups(const rtf::Document &document, std::set<std::string> &removed) {
    std::vector<Excision> excisions;
    std::size_t coveredUntil = 0;
    std::size_t iteration = 0;
    for (const auto &group : document.groups()) {
        ScanDeadline::poll(iteration++, "rtf sanitize");
        if (group.begin < coveredUntil) {
            continue;
        }
        const auto label = labelForGroup(document, group);
        if (!label.empty()) {
            removed.insert(label);
            excisions.push_back({group.begin, group.end});
            coveredUntil = group.end;
        }
    }
    return excisions;
}

std::string applyExcisions(const std::string &bytes, std::vector<Excision> excisions) {
    std::sort(excisions.begin(), excisions.end(),
              [](const Excision &a, const Excision &b) { return a.begin < b.begin; });
    std::string output;
    output.reserve(bytes.size());
    std::size_t cursor = 0;
    for (const auto &excision : excisions) {
        if (excision.begin < cursor) {
            cursor = std::max(cursor, excision.end);
            continue;
        }
        output.append(bytes, cursor, excision.begin - cursor);
        cursor = excision.end;
    }
    if (cursor < bytes.size()) {
        output.append(bytes, cursor, std::string::npos);
    }
    return output;
}

} // namespace

StageResult RtfGroupStage::attempt(const std::string &bytes) const {
    const auto document = rtf::Document::parse(bytes, true, rtf::parseLimitsFor(settings));
    if (document.truncated()) {
        return StageResult::failure("RTF group or control word limit reached");
    }
    std::set<std::string> removed;
    const auto excisions = planGroups(document, removed);
    CoverageSweep sweep(excisions);
    for (const auto &word : document.controlWords()) {
        if (isDangerousWord(word.word) && !sweep.covers(word.begin)) {
            return StageResult::failure("\\" + word.word + " outside a removable group");
        }
    }
    if (excisions.empty()) {
        return StageResult::success(bytes, {});
    }
    return StageResult::success(applyExcisions(bytes, excisions), removed);
}

StageResult RtfLenientStage::attempt(const std::string &bytes) const {
    const auto document = rtf::Document::parse(bytes, false, rtf::parseLimitsFor(settings));
    if (document.truncated()) {
        return StageResult::failure("RTF group or control word limit reached");
    }
    std::set<std::string> removed;
    auto excisions = planGroups(document, removed);
    std::vector<Excision> stray;
    CoverageSweep sweep(excisions);
    std::size_t iteration = 0;
    for (const auto &word : document.controlWords()) {
        ScanDeadline::poll(iteration++, "rtf sanitize");
        if (sweep.covers(word.begin)) {
            continue;
        }
        if (isDangerousWord(word.word)) {
            stray.push_back({word.begin, word.end});
            removed.insert("control_word");
        } else if (word.word == "fldinst") {
            // Instruction text outside a recognisable field group.
            const auto tail = document.plainText(word.end, std::min(bytes.size(), word.end + 256));
            if (rtf::classifyField(tail) != rtf::FieldKind::Plain) {
                stray.push_back({word.begin, word.end});
                removed.insert("field_instruction");
            }
        }
    }
    excisions.insert(excisions.end(), stray.begin(), stray.end());
    if (excisions.empty()) {
        return StageResult::success(bytes, {});
    }
    auto output = applyExcisions(bytes, excisions);
    if (output.empty()) {
        return StageResult::failure("Nothing left after excision");
    }
    return StageResult::success(std::move(output), removed);
}

} // namespace docshield
