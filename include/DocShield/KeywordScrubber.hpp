#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace docshield {

struct ScrubResult {
    std::string output;
    std::size_t matches{0};
    std::set<std::string> terms;
};

// Length-preserving neutralisation of a deny-list expanded from a seed
// vocabulary. Matching is ASCII case-insensitive and prefers the longest term
// at each position; letters and digits of a match become 'x'.
class KeywordScrubber {
  public:
    KeywordScrubber();
    explicit KeywordScrubber(const std::vector<std::string> &seeds);

    ScrubResult scrub(const std::string &bytes) const;

    std::size_t patternCount() const { return patterns.size(); }
    bool contains(const std::string &pattern) const;

    static const std::vector<std::string> &defaultSeeds();
    static std::vector<std::string> expand(const std::string &seed);

  private:
    struct Node {
        std::map<unsigned char, std::size_t> next;
        bool terminal{false};
    };

    void insert(const std::string &pattern);

    std::vector<Node> trie;
    std::set<std::string> patterns;
};

} // namespace docshield
