#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docshield::heuristics {

std::string asciiLower(std::string value);

bool containsIgnoreCase(const std::string &haystack, const std::string &needle);

// Mean Shannon entropy of fixed-size chunks over the first `window` bytes,
// each chunk normalised by 8 bits. Returns 0 for empty input.
double normalizedEntropy(const std::string &bytes, std::size_t window, std::size_t chunkSize);

// Whole-buffer Shannon entropy in bits per byte, in [0, 8].
double shannonEntropy(const std::string &bytes);

const std::vector<std::string> &suspiciousStrings();

// Distinct entries of suspiciousStrings() found in the first `window` bytes.
std::vector<std::string> findSuspiciousStrings(const std::string &bytes, std::size_t window);

} // namespace docshield::heuristics
