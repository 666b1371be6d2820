#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include <placemerge/core/place.h>
#include <placemerge/normalize/reference_tables.h>
#include <placemerge/resolve/attribute_resolver.h>
#include <placemerge/resolve/candidate_aggregator.h>

namespace placemerge::resolve {

struct AttributeMetrics {
    std::size_t conflicts = 0; // both providers offered a usable value
    std::array<std::size_t, 2> wins{0, 0}; // indexed by Provider
    std::size_t no_usable_value = 0;
    std::size_t unresolved = 0;
    std::size_t malformed_confidence = 0;
};

struct ResolutionMetrics {
    std::map<AttributeKind, AttributeMetrics> attributes;

    void record(const CandidateSet& candidates, const ResolvedAttribute& resolved);
    void logSummary() const;
};

struct ResolutionOutput {
    std::vector<ResolvedPlace> places;
    ResolutionMetrics metrics;
};

/**
 * @brief Resolves every attribute of matched places.
 *
 * Aggregates candidates for each MatchedPair and hands each attribute's candidate set to the
 * configured IAttributeResolver (RuleBasedResolver unless another is supplied). Never re-runs
 * matching and never fails: every place gets exactly one ResolvedAttribute per attribute.
 */
class ConflationResolver {
public:
    ConflationResolver(std::shared_ptr<const normalize::ReferenceTables> tables,
                       ResolverConfig config,
                       std::shared_ptr<const IAttributeResolver> attributeResolver = nullptr);

    ResolvedPlace resolvePlace(const MatchedPair& pair, ResolutionMetrics* metrics = nullptr) const;

    ResolutionOutput resolveAll(const std::vector<MatchedPair>& pairs) const;

    const IAttributeResolver& attributeResolver() const { return *attributeResolver_; }

private:
    std::optional<Provider> bestSource(const std::vector<ResolvedAttribute>& attributes) const;

    ResolverConfig config_;
    CandidateAggregator aggregator_;
    std::shared_ptr<const IAttributeResolver> attributeResolver_;
};

} // namespace placemerge::resolve
