/**
 * EditDistance.cpp - Levenshtein distance between command tokens
 */

#include "hint/EditDistance.hpp"

#include <algorithm>
#include <vector>

namespace hint {

size_t editDistance(const std::string& a, const std::string& b) {
    const size_t m = a.length();
    const size_t n = b.length();

    if (m == 0) return n;
    if (n == 0) return m;

    std::vector<std::vector<size_t>> dp(m + 1, std::vector<size_t>(n + 1));

    for (size_t i = 0; i <= m; i++) dp[i][0] = i;
    for (size_t j = 0; j <= n; j++) dp[0][j] = j;

    for (size_t i = 1; i <= m; i++) {
        for (size_t j = 1; j <= n; j++) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            dp[i][j] = std::min({dp[i - 1][j] + 1,
                                 dp[i][j - 1] + 1,
                                 dp[i - 1][j - 1] + cost});
        }
    }

    return dp[m][n];
}

} // namespace hint
