/**
 * EditDistance.hpp - Levenshtein distance between command tokens
 */

#pragma once

#include <cstddef>
#include <string>

namespace hint {

// Unit-cost insertions, deletions and substitutions; O(|a|*|b|)
size_t editDistance(const std::string& a, const std::string& b);

} // namespace hint
