#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <placemerge/core/place.h>
#include <placemerge/normalize/reference_tables.h>

namespace placemerge::normalize {

/**
 * @brief Canonicalizes attribute values for comparison.
 *
 * Deterministic and total: malformed or absent input yields an empty string. For every
 * attribute kind, normalize(normalize(x, k), k) == normalize(x, k).
 *
 * - name:     cleanup, strip trailing business suffixes, map aliases to canonical brands
 * - address:  cleanup (callers join structured components with joinAddress first)
 * - phone:    digits only, last 10 kept when longer
 * - website:  lowercase host without scheme or leading "www."
 * - category: cleanup
 */
class TextNormalizer {
public:
    explicit TextNormalizer(std::shared_ptr<const ReferenceTables> tables);

    std::string normalize(std::string_view raw, AttributeKind kind) const;

    // Raw attribute value for `kind`, nullopt when the provider did not supply one. Addresses
    // are assembled from components when the record carries no single "address" value.
    static std::optional<std::string> rawValue(const PlaceRecord& record, AttributeKind kind);

    // street, city, region, postal_code joined with ',' in that order.
    static std::string joinAddress(std::string_view street, std::string_view city,
                                   std::string_view region, std::string_view postalCode);

    // Copy of `record` with normalized_attributes filled for every attribute kind that has a
    // raw value.
    PlaceRecord normalizeRecord(PlaceRecord record) const;

    const ReferenceTables& tables() const { return *tables_; }

private:
    std::string normalizeName(std::string_view raw) const;
    static std::string normalizePhone(std::string_view raw);
    static std::string normalizeWebsite(std::string_view raw);

    std::shared_ptr<const ReferenceTables> tables_;
};

} // namespace placemerge::normalize
