#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <placemerge/core/place.h>
#include <placemerge/normalize/reference_tables.h>
#include <placemerge/normalize/text_normalizer.h>

namespace placemerge::resolve {

// Every candidate offered for one attribute of one matched place, ProviderA first.
struct CandidateSet {
    AttributeKind attribute = AttributeKind::Name;
    std::vector<AttributeCandidate> candidates;
    // Data-quality notes gathered while building candidates
    std::vector<std::string> quality_flags;
};

struct PlaceCandidates {
    std::string place_id;
    std::vector<CandidateSet> sets; // one per attribute, kAllAttributes order

    const CandidateSet* find(AttributeKind kind) const {
        for (const auto& set : sets) {
            if (set.attribute == kind)
                return &set;
        }
        return nullptr;
    }
};

// Outcome of parsing a provider confidence value.
struct ParsedConfidence {
    std::optional<double> value;
    bool malformed = false;
};

// Accepts a finite number within [0, 1]; empty input is absent, anything else malformed.
ParsedConfidence parseConfidence(std::string_view raw);

// A name carrying a store id: "#<digits>", "store <digits>" or a standalone 3-6 digit token.
bool hasStoreNumber(std::string_view rawName);

/**
 * @brief Listing and SEO noise in a raw name.
 *
 * One point per noise phrase found ("hours", "near me", "official site", ...), one for a
 * name of eight or more words, two more when it mentions both hours and address.
 */
std::size_t nameNoiseScore(std::string_view rawName);

// Domains that host listings rather than the place's own site.
const std::vector<std::string>& socialDomains();

/**
 * @brief Stateless transform from a MatchedPair to per-attribute candidate sets.
 */
class CandidateAggregator {
public:
    explicit CandidateAggregator(std::shared_ptr<const normalize::ReferenceTables> tables);

    PlaceCandidates aggregate(const MatchedPair& pair) const;

    // nullopt when `record` supplies no value for `kind`.
    std::optional<AttributeCandidate> buildCandidate(const PlaceRecord& record, AttributeKind kind,
                                                     const ParsedConfidence& confidence) const;

    CandidateFlags deriveFlags(std::string_view raw, std::string_view canonical,
                               AttributeKind kind) const;

private:
    std::shared_ptr<const normalize::ReferenceTables> tables_;
    normalize::TextNormalizer normalizer_;
};

} // namespace placemerge::resolve
