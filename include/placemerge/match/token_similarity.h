#pragma once

#include <string_view>

namespace placemerge::match {

/**
 * @brief Normalized indel similarity on a 0..100 scale (rapidfuzz fuzz::ratio).
 *
 * 100 * (1 - (len(a) + len(b) - 2 * LCS(a, b)) / (len(a) + len(b))). Two empty strings
 * score 100.
 */
double indelRatio(std::string_view a, std::string_view b);

/**
 * @brief Order-independent token overlap ratio on a 0..100 scale (fuzz::token_set_ratio).
 *
 * Tokens are whitespace separated and deduplicated. A non-empty intersection that covers
 * either side scores 100. Empty input on either side scores 0.
 */
double tokenSetRatio(std::string_view a, std::string_view b);

} // namespace placemerge::match
