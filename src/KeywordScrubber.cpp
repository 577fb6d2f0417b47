#include "DocShield/KeywordScrubber.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/ScanDeadline.hpp"

#include <cctype>

namespace docshield {

namespace {

constexpr std::size_t kLeetVariantCap = 8;
const std::string kZeroWidthSpace("\xE2\x80\x8B");

const std::map<char, std::vector<std::string>> &leetMap() {
    static const std::map<char, std::vector<std::string>> map = {
        {'a', {"a", "4", "@"}}, {'e', {"e", "3"}}, {'i', {"i", "1", "!"}},
        {'o', {"o", "0"}},      {'s', {"s", "5", "$"}}, {'t', {"t", "7"}}
    };
    return map;
}

std::vector<std::string> leetVariants(const std::string &token) {
    std::vector<std::string> variants = {""};
    for (const char ch : token) {
        const auto pool = leetMap().find(ch);
        std::vector<std::string> next;
        if (pool == leetMap().end()) {
            for (auto &variant : variants) {
                next.push_back(variant + ch);
            }
        } else {
            for (const auto &variant : variants) {
                for (const auto &replacement : pool->second) {
                    if (next.size() >= kLeetVariantCap) {
                        break;
                    }
                    next.push_back(variant + replacement);
                }
            }
        }
        variants = std::move(next);
    }
    return variants;
}

std::string replaceAll(std::string value, const std::string &from, const std::string &to) {
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

std::string compact(const std::string &value) {
    std::string out;
    for (const char ch : value) {
        if (ch != '/' && ch != '.' && ch != '-' && !std::isspace(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
        }
    }
    return out;
}

} // namespace

const std::vector<std::string> &KeywordScrubber::defaultSeeds() {
    static const std::vector<std::string> seeds = {
        // PDF actions and scripting
        "javascript", "/js", "openaction", "submitform", "launch", "gotor", "richmedia", "embeddedfile",
        "acroform", "/xfa", "doc.exportdataobject", "util.printf", "app.launchurl", "this.submitform", "geturl",
        // Office active content
        "macro", "vbaproject", "activex", "ddeauto", "includepicture", "includetext", "attachedtemplate",
        "objdata", "objupdate", "autoopen", "document_open",
        // URL schemes
        "http://", "https://", "javascript:", "vbscript:", "file:", "data:", "ftp://", "smb://",
        // LOLBins and tooling
        "cmd.exe", "powershell", "wscript", "cscript", "mshta", "regsvr32", "rundll32", "bitsadmin",
        "certutil", "schtasks", "whoami", "net user", "net group",
        // Script tricks
        "base64", "eval(", "fromcharcode", "unescape", "createobject", "activexobject", "shell(",
        // Malware vocabulary
        "dropper", "payload", "shellcode", "invoke-expression", "downloadstring", "add-type",
        "new-object system.net.webclient", "start-process", "set-mppreference", "amsienable"
    };
    return seeds;
}

std::vector<std::string> KeywordScrubber::expand(const std::string &seed) {
    static const std::vector<std::string> separators = {"", ".", "_", "-", kZeroWidthSpace};
    const auto lowered = heuristics::asciiLower(seed);
    std::set<std::string> forms;
    for (const auto &variant : leetVariants(lowered)) {
        forms.insert(variant);
    }
    if (lowered.find(' ') != std::string::npos) {
        for (const auto &separator : separators) {
            forms.insert(replaceAll(lowered, " ", separator));
        }
    }
    const auto compacted = compact(lowered);
    if (compacted.size() >= 4) {
        forms.insert(compacted);
    }
    return std::vector<std::string>(forms.begin(), forms.end());
}

KeywordScrubber::KeywordScrubber() : KeywordScrubber(defaultSeeds()) {}

KeywordScrubber::KeywordScrubber(const std::vector<std::string> &seeds) {
    trie.emplace_back();
    for (const auto &seed : seeds) {
        for (const auto &pattern : expand(seed)) {
            insert(pattern);
        }
    }
}

void KeywordScrubber::insert(const std::string &pattern) {
    if (pattern.empty() || !patterns.insert(pattern).second) {
        return;
    }
    std::size_t node = 0;
    for (const char ch : pattern) {
        const auto key = static_cast<unsigned char>(ch);
        const auto it = trie[node].next.find(key);
        if (it != trie[node].next.end()) {
            node = it->second;
            continue;
        }
        const auto created = trie.size();
        trie[node].next.emplace(key, created);
        trie.emplace_back();
        node = created;
    }
    trie[node].terminal = true;
}

bool KeywordScrubber::contains(const std::string &pattern) const {
    return patterns.count(heuristics::asciiLower(pattern)) > 0;
}

ScrubResult KeywordScrubber::scrub(const std::string &bytes) const {
    ScrubResult result;
    result.output = bytes;
    std::size_t pos = 0;
    for (std::size_t iteration = 0; pos < bytes.size(); ++iteration) {
        ScanDeadline::poll(iteration, "keyword scrub");
        std::size_t node = 0;
        std::size_t longest = 0;
        for (std::size_t i = pos; i < bytes.size(); ++i) {
            auto key = static_cast<unsigned char>(bytes[i]);
            if (key >= 'A' && key <= 'Z') {
                key = static_cast<unsigned char>(key + ('a' - 'A'));
            }
            const auto it = trie[node].next.find(key);
            if (it == trie[node].next.end()) {
                break;
            }
            node = it->second;
            if (trie[node].terminal) {
                longest = i - pos + 1;
            }
        }
        if (longest == 0) {
            ++pos;
            continue;
        }
        result.terms.insert(heuristics::asciiLower(bytes.substr(pos, longest)));
        for (std::size_t i = pos; i < pos + longest; ++i) {
            if (std::isalnum(static_cast<unsigned char>(result.output[i]))) {
                result.output[i] = 'x';
            }
        }
        ++result.matches;
        pos += longest;
    }
    return result;
}

} // namespace docshield
