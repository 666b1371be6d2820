#pragma once

#include <cstddef>
#include <map>
#include <string_view>
#include <vector>
#include <placemerge/core/place.h>
#include <placemerge/core/types.h>
#include <placemerge/resolve/candidate_aggregator.h>
#include <placemerge/resolve/resolution_rules.h>

namespace placemerge::resolve {

struct ResolverConfig {
    // Earlier providers win ties nothing else breaks
    std::vector<Provider> provider_priority{Provider::ProviderA, Provider::ProviderB};
    // Preferred name length in tokens (after suffix removal)
    std::size_t name_min_words = 2;
    std::size_t name_max_words = 6;

    Result<void> validate() const;
};

/**
 * @brief Picks one value among the candidates for one attribute of one place.
 *
 * Implementations must be total (always one ResolvedAttribute, never throw on malformed
 * candidates) and deterministic.
 */
class IAttributeResolver {
public:
    virtual ~IAttributeResolver() = default;
    virtual std::string_view name() const = 0;
    virtual ResolvedAttribute resolve(const CandidateSet& candidates) const = 0;
};

// Rule cascade per attribute; the decision trace lists every evaluated rule.
class RuleBasedResolver final : public IAttributeResolver {
public:
    explicit RuleBasedResolver(ResolverConfig config = {});

    std::string_view name() const override { return "rule_based"; }
    ResolvedAttribute resolve(const CandidateSet& candidates) const override;

    const RuleCascade& cascade(AttributeKind kind) const { return cascades_.at(kind); }
    const ResolverConfig& config() const { return config_; }

    static RuleCascade buildCascade(AttributeKind kind, const ResolverConfig& config);

private:
    ResolverConfig config_;
    std::map<AttributeKind, RuleCascade> cascades_;
};

} // namespace placemerge::resolve
