#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <placemerge/core/types.h>

namespace placemerge::normalize {

/**
 * @brief Curated lookup data shared by the normalizer, aggregator and resolver.
 *
 * Immutable once built. Every alias and canonical brand string is stored in normalized form
 * (cleaned, trailing business suffixes removed) and every canonical brand maps to itself, so
 * applying the brand lookup to its own output is a no-op.
 */
class ReferenceTables {
public:
    // Built-in suffix list and a small brand table.
    static std::shared_ptr<const ReferenceTables> defaults();

    // aliases: surface form -> canonical brand, in any spelling; both sides are normalized.
    static std::shared_ptr<const ReferenceTables>
    build(const std::vector<std::string>& businessSuffixes,
          const std::map<std::string, std::string>& aliases);

    static std::vector<std::string> defaultBusinessSuffixes();
    static std::map<std::string, std::string> defaultBrandAliases();

    const std::unordered_set<std::string>& businessSuffixes() const { return suffixes_; }

    bool isBusinessSuffix(std::string_view token) const {
        return suffixes_.count(std::string(token)) > 0;
    }

    // Lookup by normalized name; returns the normalized canonical brand.
    std::optional<std::string> canonicalBrand(std::string_view normalizedName) const;

    // True when `cleanedName` (cleanText output, suffixes kept) is a canonical brand or a
    // known alias of one, either as configured or with its business suffixes removed.
    bool isBrandEntry(std::string_view cleanedName) const {
        const std::string key(cleanedName);
        return surfaces_.count(key) > 0 || brands_.count(key) > 0;
    }

    // Display form of a canonical brand as it was configured, if known.
    std::optional<std::string> brandDisplayName(std::string_view normalizedCanonical) const;

    size_t brandEntryCount() const { return brands_.size(); }

private:
    ReferenceTables() = default;

    std::unordered_set<std::string> suffixes_;
    std::unordered_set<std::string> surfaces_;              // cleaned entries, suffixes kept
    std::unordered_map<std::string, std::string> brands_;   // normalized alias -> canonical
    std::unordered_map<std::string, std::string> display_;  // normalized canonical -> display
};

// Load {"alias": "Canonical Brand", ...} from a JSON file.
Result<std::map<std::string, std::string>> loadBrandTable(const std::filesystem::path& path);

} // namespace placemerge::normalize
