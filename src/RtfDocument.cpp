#include "DocShield/RtfDocument.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/ScanDeadline.hpp"
#include "DocShield/ScanSettings.hpp"
#include "DocShield/ScanTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace docshield::rtf {

namespace {

bool isLetter(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool isDigit(char ch) {
    return ch >= '0' && ch <= '9';
}

int hexValue(char ch) {
    if (isDigit(ch)) {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

// Reads a control word starting at the backslash. Returns the position after
// its delimiter and any \bin payload.
std::size_t readControlWord(std::string_view text, std::size_t pos, ControlWord &word) {
    word.begin = pos;
    std::size_t cursor = pos + 1;
    const auto nameStart = cursor;
    while (cursor < text.size() && isLetter(text[cursor]) && cursor - nameStart < 32) {
        ++cursor;
    }
    word.word = heuristics::asciiLower(std::string(text.substr(nameStart, cursor - nameStart)));
    const auto parameterStart = cursor;
    if (cursor < text.size() && text[cursor] == '-') {
        ++cursor;
    }
    while (cursor < text.size() && isDigit(text[cursor]) && cursor - parameterStart < 11) {
        ++cursor;
    }
    if (cursor > parameterStart && isDigit(text[cursor - 1])) {
        word.hasParameter = true;
        word.parameter = std::strtol(std::string(text.substr(parameterStart, cursor - parameterStart)).c_str(), nullptr, 10);
    } else {
        cursor = parameterStart;
    }
    if (cursor < text.size() && text[cursor] == ' ') {
        ++cursor;
    }
    if (word.word == "bin" && word.hasParameter && word.parameter > 0) {
        const auto remaining = text.size() - cursor;
        cursor += std::min<std::size_t>(static_cast<std::size_t>(word.parameter), remaining);
    }
    word.end = cursor;
    return cursor;
}

std::string trim(const std::string &value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

bool hasRtfHeader(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size() && pos < 16 && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return text.substr(pos, 5) == "{\\rtf";
}

Document Document::parse(std::string_view text, bool strict, ParseLimits limits) {
    if (strict && !hasRtfHeader(text)) {
        throw MalformedContainer("Missing {\\rtf header");
    }
    Document document;
    document.text = text;

    std::vector<std::size_t> open;
    bool expectDestination = false;
    bool sawStar = false;
    std::size_t pos = 0;
    for (std::size_t iteration = 0; pos < text.size(); ++iteration) {
        ScanDeadline::poll(iteration, "rtf parse");
        const char ch = text[pos];
        if (ch == '{') {
            if (document.groupList.size() >= limits.maxGroups) {
                document.limitReached = true;
                break;
            }
            Group group;
            group.begin = pos;
            group.depth = static_cast<int>(open.size());
            open.push_back(document.groupList.size());
            document.groupList.push_back(group);
            expectDestination = true;
            sawStar = false;
            ++pos;
        } else if (ch == '}') {
            if (open.empty()) {
                if (strict) {
                    throw MalformedContainer("Unbalanced closing brace at offset " + std::to_string(pos));
                }
            } else {
                auto &group = document.groupList[open.back()];
                group.end = pos + 1;
                group.closed = true;
                open.pop_back();
            }
            expectDestination = false;
            ++pos;
        } else if (ch == '\\' && pos + 1 < text.size() && isLetter(text[pos + 1])) {
            if (document.words.size() >= limits.maxControlWords) {
                document.limitReached = true;
                break;
            }
            ControlWord word;
            pos = readControlWord(text, pos, word);
            if (expectDestination && !open.empty()) {
                auto &group = document.groupList[open.back()];
                group.destination = word.word;
                group.ignorable = sawStar;
                if (word.word == "fldinst" && open.size() >= 2) {
                    auto &parent = document.groupList[open[open.size() - 2]];
                    if (parent.destination == "field" && parent.instruction == std::string::npos) {
                        parent.instruction = open.back();
                    }
                }
            }
            expectDestination = false;
            document.words.push_back(std::move(word));
        } else if (ch == '\\' && pos + 1 < text.size()) {
            const char symbol = text[pos + 1];
            if (symbol == '*' && expectDestination) {
                sawStar = true;
            } else {
                expectDestination = false;
            }
            pos += symbol == '\'' ? 4 : 2;
        } else {
            if (ch != '\r' && ch != '\n') {
                expectDestination = false;
            }
            ++pos;
        }
    }

    if (!open.empty()) {
        if (strict && !document.limitReached) {
            throw MalformedContainer("Unbalanced braces: " + std::to_string(open.size()) + " group(s) left open");
        }
        for (const auto index : open) {
            document.groupList[index].end = text.size();
        }
    }
    return document;
}

std::string Document::plainText(std::size_t begin, std::size_t end) const {
    std::string out;
    end = std::min(end, text.size());
    std::size_t pos = begin;
    while (pos < end) {
        const char ch = text[pos];
        if (ch == '{' || ch == '}' || ch == '\r' || ch == '\n') {
            ++pos;
        } else if (ch == '\\' && pos + 1 < end && isLetter(text[pos + 1])) {
            ControlWord word;
            pos = readControlWord(text, pos, word);
            if (word.word == "par" || word.word == "tab") {
                out.push_back(' ');
            }
        } else if (ch == '\\' && pos + 1 < end) {
            const char symbol = text[pos + 1];
            if (symbol == '\'' && pos + 3 < end && hexValue(text[pos + 2]) >= 0 && hexValue(text[pos + 3]) >= 0) {
                out.push_back(static_cast<char>(hexValue(text[pos + 2]) * 16 + hexValue(text[pos + 3])));
                pos += 4;
            } else {
                if (symbol == '\\' || symbol == '{' || symbol == '}') {
                    out.push_back(symbol);
                }
                pos += 2;
            }
        } else {
            out.push_back(ch);
            ++pos;
        }
    }
    return out;
}

std::string Document::fieldInstruction(const Group &field) const {
    const auto &source = field.instruction < groupList.size() ? groupList[field.instruction] : field;
    return trim(plainText(source.begin, std::min(source.end, source.begin + kInstructionBytes)));
}

ParseLimits parseLimitsFor(const ScanSettings &settings) {
    ParseLimits limits;
    limits.maxGroups = settings.maxRtfGroups;
    limits.maxControlWords = settings.maxRtfControlWords;
    return limits;
}

FieldKind classifyField(const std::string &instruction) {
    const auto lowered = heuristics::asciiLower(trim(instruction));
    const auto space = lowered.find_first_of(" \t\"\\");
    const auto keyword = lowered.substr(0, space);
    if (keyword == "dde" || keyword == "ddeauto") {
        return FieldKind::Dde;
    }
    if (keyword == "includepicture" || keyword == "includetext" || keyword == "import") {
        return FieldKind::Include;
    }
    return FieldKind::Plain;
}

} // namespace docshield::rtf
