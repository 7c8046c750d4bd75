#include "commands/fuzzy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>
#include <vector>

namespace fuzzy {

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static int toScore(double value) {
    return static_cast<int>(std::lround(value));
}

static std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

static std::string join(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

static std::string join(const std::set<std::string>& tokens) {
    return join(std::vector<std::string>(tokens.begin(), tokens.end()));
}

static size_t longestCommonSubsequence(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1, 0), curr(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); i++) {
        for (size_t j = 1; j <= b.size(); j++) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = std::max(prev[j], curr[j - 1]);
            }
        }
        prev.swap(curr);
    }
    return prev[b.size()];
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::string normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(std::isalnum(c) ? static_cast<char>(std::tolower(c)) : ' ');
    }
    return join(tokenize(out));
}

int ratio(const std::string& a, const std::string& b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 100;
    if (a.empty() || b.empty()) return 0;
    return toScore(200.0 * static_cast<double>(longestCommonSubsequence(a, b)) / total);
}

int partialRatio(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;

    const std::string& shorter = a.size() <= b.size() ? a : b;
    const std::string& longer  = a.size() <= b.size() ? b : a;

    int best = 0;
    for (size_t start = 0; start + shorter.size() <= longer.size(); start++) {
        best = std::max(best, ratio(shorter, longer.substr(start, shorter.size())));
        if (best >= 100) break;
    }
    return best;
}

int tokenSortRatio(const std::string& a, const std::string& b, bool partial) {
    auto ta = tokenize(a);
    auto tb = tokenize(b);
    std::sort(ta.begin(), ta.end());
    std::sort(tb.begin(), tb.end());

    std::string sa = join(ta), sb = join(tb);
    return partial ? partialRatio(sa, sb) : ratio(sa, sb);
}

int tokenSetRatio(const std::string& a, const std::string& b, bool partial) {
    auto va = tokenize(a);
    auto vb = tokenize(b);
    std::set<std::string> ta(va.begin(), va.end());
    std::set<std::string> tb(vb.begin(), vb.end());

    std::set<std::string> common, onlyA, onlyB;
    std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(),
                          std::inserter(common, common.begin()));
    std::set_difference(ta.begin(), ta.end(), tb.begin(), tb.end(),
                        std::inserter(onlyA, onlyA.begin()));
    std::set_difference(tb.begin(), tb.end(), ta.begin(), ta.end(),
                        std::inserter(onlyB, onlyB.begin()));

    std::string sect = join(common);
    std::string combinedA = sect.empty() ? join(onlyA) : (onlyA.empty() ? sect : sect + " " + join(onlyA));
    std::string combinedB = sect.empty() ? join(onlyB) : (onlyB.empty() ? sect : sect + " " + join(onlyB));

    auto score = [partial](const std::string& x, const std::string& y) {
        return partial ? partialRatio(x, y) : ratio(x, y);
    };

    int best = 0;
    if (!sect.empty()) {
        best = std::max(best, score(sect, combinedA));
        best = std::max(best, score(sect, combinedB));
    }
    best = std::max(best, score(combinedA, combinedB));
    return best;
}

int weightedRatio(const std::string& a, const std::string& b) {
    const std::string p1 = normalize(a);
    const std::string p2 = normalize(b);
    if (p1.empty() || p2.empty()) return 0;

    const double unbaseScale = 0.95;
    double partialScale = 0.90;

    const double base = ratio(p1, p2);
    const double lenRatio = static_cast<double>(std::max(p1.size(), p2.size())) /
                            static_cast<double>(std::min(p1.size(), p2.size()));

    if (lenRatio < 1.5) {
        double tsor = tokenSortRatio(p1, p2) * unbaseScale;
        double tser = tokenSetRatio(p1, p2) * unbaseScale;
        return toScore(std::max({ base, tsor, tser }));
    }

    if (lenRatio > 8.0) partialScale = 0.6;

    double partial = partialRatio(p1, p2) * partialScale;
    double ptsor = tokenSortRatio(p1, p2, true) * unbaseScale * partialScale;
    double ptser = tokenSetRatio(p1, p2, true) * unbaseScale * partialScale;
    return toScore(std::max({ base, partial, ptsor, ptser }));
}

} // namespace fuzzy
