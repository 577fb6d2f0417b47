#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {
struct ScanSettings;
}

namespace docshield::rtf {

struct ControlWord {
    std::string word;
    bool hasParameter{false};
    long parameter{0};
    std::size_t begin{0};
    std::size_t end{0};
};

struct Group {
    std::size_t begin{0};
    // One past the closing brace; the end of input for unclosed groups.
    std::size_t end{0};
    // First control word of the group; for "{\*\x" groups this is "x".
    std::string destination;
    bool ignorable{false};
    bool closed{false};
    int depth{0};
    // For field groups, index of the direct \fldinst child; npos if none.
    std::size_t instruction{std::string::npos};
};

struct ParseLimits {
    std::size_t maxGroups{200000};
    std::size_t maxControlWords{2000000};
};

enum class FieldKind { Plain, Dde, Include };

class Document {
  public:
    // Strict parsing throws MalformedContainer on a missing {\rtf header or
    // unbalanced braces; lenient parsing closes what it can. Parsing stops
    // once either limit is reached; see truncated().
    static Document parse(std::string_view text, bool strict, ParseLimits limits = {});

    const std::vector<Group> &groups() const { return groupList; }
    const std::vector<ControlWord> &controlWords() const { return words; }
    bool truncated() const { return limitReached; }

    // Text of [begin, end) with control words, braces and \bin payloads removed
    // and \'hh escapes decoded.
    std::string plainText(std::size_t begin, std::size_t end) const;
    // Reads at most kInstructionBytes of source text.
    std::string fieldInstruction(const Group &field) const;

    static constexpr std::size_t kInstructionBytes = 1024;

  private:
    std::string_view text;
    std::vector<Group> groupList;
    std::vector<ControlWord> words;
    bool limitReached{false};
};

ParseLimits parseLimitsFor(const ScanSettings &settings);

FieldKind classifyField(const std::string &instruction);

bool hasRtfHeader(std::string_view text);

} // namespace docshield::rtf
