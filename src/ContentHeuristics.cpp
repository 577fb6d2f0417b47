#include "DocShield/ContentHeuristics.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace docshield::heuristics {

namespace {

double chunkEntropy(const char *data, std::size_t length) {
    std::array<std::size_t, 256> counts{};
    for (std::size_t i = 0; i < length; ++i) {
        ++counts[static_cast<unsigned char>(data[i])];
    }
    double entropy = 0.0;
    for (const auto count : counts) {
        if (count == 0) {
            continue;
        }
        const double p = static_cast<double>(count) / static_cast<double>(length);
        entropy -= p * std::log2(p);
    }
    return entropy;
}

} // namespace

std::string asciiLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch);
    });
    return value;
}

bool containsIgnoreCase(const std::string &haystack, const std::string &needle) {
    return asciiLower(haystack).find(asciiLower(needle)) != std::string::npos;
}

double normalizedEntropy(const std::string &bytes, std::size_t window, std::size_t chunkSize) {
    const auto limit = std::min(bytes.size(), window);
    if (limit == 0 || chunkSize == 0) {
        return 0.0;
    }
    double total = 0.0;
    std::size_t chunks = 0;
    for (std::size_t offset = 0; offset < limit; offset += chunkSize) {
        const auto length = std::min(chunkSize, limit - offset);
        total += chunkEntropy(bytes.data() + offset, length) / 8.0;
        ++chunks;
    }
    return total / static_cast<double>(chunks);
}

double shannonEntropy(const std::string &bytes) {
    if (bytes.empty()) {
        return 0.0;
    }
    return chunkEntropy(bytes.data(), bytes.size());
}

const std::vector<std::string> &suspiciousStrings() {
    static const std::vector<std::string> strings = {
        "javascript", "<script", "eval(", "wscript.shell", "powershell", "activexobject", "shell(",
        "cmd.exe", "mshta", "autoopen", "document.open", "base64,", "fromcharcode(", "createobject("
    };
    return strings;
}

std::vector<std::string> findSuspiciousStrings(const std::string &bytes, std::size_t window) {
    const auto lowered = asciiLower(bytes.substr(0, std::min(bytes.size(), window)));
    std::vector<std::string> hits;
    for (const auto &needle : suspiciousStrings()) {
        if (lowered.find(needle) != std::string::npos) {
            hits.push_back(needle);
        }
    }
    return hits;
}

} // namespace docshield::heuristics
