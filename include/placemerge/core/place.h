#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace placemerge {

// Exactly two independent sources are supported.
enum class Provider { ProviderA, ProviderB };

enum class AttributeKind { Name, Address, Phone, Website, Category };

inline constexpr std::array<AttributeKind, 5> kAllAttributes = {
    AttributeKind::Name, AttributeKind::Address, AttributeKind::Phone, AttributeKind::Website,
    AttributeKind::Category};

inline constexpr std::array<Provider, 2> kAllProviders = {Provider::ProviderA,
                                                          Provider::ProviderB};

constexpr const char* providerName(Provider provider) {
    switch (provider) {
        case Provider::ProviderA: return "provider_a";
        case Provider::ProviderB: return "provider_b";
    }
    return "provider_a";
}

constexpr const char* attributeName(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::Name: return "name";
        case AttributeKind::Address: return "address";
        case AttributeKind::Phone: return "phone";
        case AttributeKind::Website: return "website";
        case AttributeKind::Category: return "category";
    }
    return "name";
}

std::optional<Provider> parseProvider(std::string_view text);
std::optional<AttributeKind> parseAttributeKind(std::string_view text);

// Raw keys that make up a structured address, in concatenation order.
inline constexpr std::array<std::string_view, 4> kAddressComponentKeys = {"street", "city",
                                                                          "region", "postal_code"};

/**
 * @brief One place as reported by one provider.
 *
 * normalized_attributes is derived by TextNormalizer::normalizeRecord and is never edited by
 * hand. raw_confidence keeps the provider value verbatim; it is parsed when candidates are
 * built so that malformed values can be reported.
 */
struct PlaceRecord {
    std::string record_id;
    Provider provider = Provider::ProviderA;
    std::map<std::string, std::string> raw_attributes;
    std::map<AttributeKind, std::string> normalized_attributes;
    std::optional<std::string> raw_confidence;

    const std::string* raw(std::string_view key) const {
        auto it = raw_attributes.find(std::string(key));
        return it == raw_attributes.end() ? nullptr : &it->second;
    }

    const std::string& normalized(AttributeKind kind) const {
        static const std::string kEmpty;
        auto it = normalized_attributes.find(kind);
        return it == normalized_attributes.end() ? kEmpty : it->second;
    }
};

enum class MatchKind { Exact, Fuzzy };

constexpr const char* matchKindName(MatchKind kind) {
    return kind == MatchKind::Exact ? "exact" : "fuzzy";
}

struct MatchedPair {
    PlaceRecord recordA;
    PlaceRecord recordB;
    MatchKind match_kind = MatchKind::Exact;
    // Only meaningful for Fuzzy pairs; 0..100
    double name_similarity = 100.0;
    double address_similarity = 100.0;

    std::string placeId() const { return recordA.record_id + "|" + recordB.record_id; }
};

struct CandidateFlags {
    bool is_canonical_brand = false;
    bool has_business_suffix = false;
    bool has_store_number = false; // name: "#6285", "store 12", a bare 3-6 digit token
    std::size_t name_noise = 0;    // name: listing/SEO phrases, sentence-like length
    std::size_t token_count = 0;
    std::size_t component_count = 0; // address: non-empty comma separated parts
    bool has_postal_code = false;
    std::size_t digit_count = 0;     // phone
    bool is_valid_url = false;
    bool is_secure_url = false;
    bool is_social_domain = false;
    std::size_t category_count = 0;
};

// One provider's offered value for one attribute of one matched place.
struct AttributeCandidate {
    std::string value; // canonical form
    std::string raw_value;
    Provider source_provider = Provider::ProviderA;
    std::optional<double> source_confidence;
    CandidateFlags derived_flags;

    bool empty() const { return value.empty(); }
};

enum class ResolutionStatus { Resolved, NoUsableValue, Unresolved };

constexpr const char* resolutionStatusName(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Resolved: return "resolved";
        case ResolutionStatus::NoUsableValue: return "no_usable_value";
        case ResolutionStatus::Unresolved: return "unresolved";
    }
    return "unresolved";
}

// Final decision for one (place, attribute) pair. Immutable once produced.
struct ResolvedAttribute {
    AttributeKind attribute = AttributeKind::Name;
    ResolutionStatus status = ResolutionStatus::Unresolved;
    std::string winning_value;
    std::string canonical_value;
    std::optional<Provider> winning_provider;
    std::vector<std::string> decision_trace;
    std::string decided_by;
    std::vector<std::string> quality_flags;
};

struct ResolvedPlace {
    std::string place_id;
    std::string record_a_id;
    std::string record_b_id;
    MatchKind match_kind = MatchKind::Exact;
    std::vector<ResolvedAttribute> attributes;
    std::optional<Provider> best_source;

    const ResolvedAttribute* find(AttributeKind kind) const {
        for (const auto& attr : attributes) {
            if (attr.attribute == kind)
                return &attr;
        }
        return nullptr;
    }
};

} // namespace placemerge
