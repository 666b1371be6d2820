#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace placemerge::normalize {

/**
 * @brief Shared cleanup applied to every free-text attribute.
 *
 * Lowercases ASCII, folds Latin-1 accented letters (UTF-8 encoded) to their base letter,
 * drops any other non-ASCII byte, turns every character outside [a-z0-9] into a space and
 * collapses runs of whitespace. Total: any input (including invalid UTF-8) yields a string.
 */
std::string cleanText(std::string_view raw);

// Split on single spaces; expects cleaned input.
std::vector<std::string> splitTokens(std::string_view cleaned);

std::string joinTokens(const std::vector<std::string>& tokens, std::size_t count);

// Repeatedly strip trailing tokens found in `suffixes`. Never strips the last token.
std::string stripBusinessSuffixes(std::string_view cleaned,
                                  const std::unordered_set<std::string>& suffixes);

bool endsWithBusinessSuffix(std::string_view cleaned,
                            const std::unordered_set<std::string>& suffixes);

} // namespace placemerge::normalize
