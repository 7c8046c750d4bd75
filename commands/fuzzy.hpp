#pragma once
#include <string>

// ------------------------------------------------------------
// String similarity, 0-100 scale
// ------------------------------------------------------------
namespace fuzzy {

    // Lowercase, non-alphanumerics -> space, trimmed
    std::string normalize(const std::string& input);

    // Similarity from the longest common subsequence: 2*LCS / (|a|+|b|)
    int ratio(const std::string& a, const std::string& b);

    // Best ratio of the shorter string against every same-length window
    // of the longer one
    int partialRatio(const std::string& a, const std::string& b);

    int tokenSortRatio(const std::string& a, const std::string& b, bool partial = false);
    int tokenSetRatio(const std::string& a, const std::string& b, bool partial = false);

    // Weighted combination of the scores above (normalizes its inputs)
    int weightedRatio(const std::string& a, const std::string& b);

} // namespace fuzzy
