#include <placemerge/resolve/attribute_resolver.h>

#include <algorithm>
#include <memory>

namespace placemerge::resolve {

Result<void> ResolverConfig::validate() const {
    if (provider_priority.empty()) {
        return Error{ErrorCode::InvalidArgument, "provider_priority must not be empty"};
    }
    for (auto provider : kAllProviders) {
        const auto occurrences =
            std::count(provider_priority.begin(), provider_priority.end(), provider);
        if (occurrences > 1) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("provider_priority lists ") + providerName(provider) +
                             " more than once"};
        }
    }
    if (name_min_words > name_max_words) {
        return Error{ErrorCode::InvalidArgument, "name_min_words must not exceed name_max_words"};
    }
    return {};
}

RuleCascade RuleBasedResolver::buildCascade(AttributeKind kind, const ResolverConfig& config) {
    RuleCascade cascade;
    cascade.add(std::make_unique<CompletenessRule>());

    switch (kind) {
        case AttributeKind::Name:
            cascade.add(std::make_unique<CanonicalBrandRule>())
                .add(std::make_unique<ConfidenceRule>())
                .add(std::make_unique<BusinessSuffixRule>())
                .add(std::make_unique<StoreNumberRule>())
                .add(std::make_unique<NameNoiseRule>())
                .add(std::make_unique<WordCountWindowRule>(config.name_min_words,
                                                           config.name_max_words))
                .add(std::make_unique<CoreNameRule>());
            break;
        case AttributeKind::Address:
            cascade.add(std::make_unique<ConfidenceRule>())
                .add(std::make_unique<ComponentCountRule>())
                .add(std::make_unique<PostalCodeRule>());
            break;
        case AttributeKind::Phone:
            cascade.add(std::make_unique<ConfidenceRule>()).add(std::make_unique<PhoneDigitsRule>());
            break;
        case AttributeKind::Website:
            cascade.add(std::make_unique<ConfidenceRule>())
                .add(std::make_unique<UrlValidityRule>())
                .add(std::make_unique<SecureUrlRule>())
                .add(std::make_unique<SocialDomainRule>());
            break;
        case AttributeKind::Category:
            cascade.add(std::make_unique<ConfidenceRule>())
                .add(std::make_unique<CategoryCountRule>())
                .add(std::make_unique<CategorySpecificityRule>());
            break;
    }

    cascade.add(std::make_unique<ConfidencePresenceRule>())
        .add(std::make_unique<ProviderPriorityRule>(config.provider_priority));
    return cascade;
}

RuleBasedResolver::RuleBasedResolver(ResolverConfig config) : config_(std::move(config)) {
    for (auto kind : kAllAttributes) {
        cascades_.emplace(kind, buildCascade(kind, config_));
    }
}

ResolvedAttribute RuleBasedResolver::resolve(const CandidateSet& set) const {
    ResolvedAttribute resolved;
    resolved.attribute = set.attribute;
    resolved.quality_flags = set.quality_flags;

    if (set.candidates.empty()) {
        resolved.status = ResolutionStatus::Unresolved;
        resolved.decision_trace.push_back("no_candidates");
        resolved.decided_by = "no_candidates";
        return resolved;
    }

    const bool anyUsable = std::any_of(set.candidates.begin(), set.candidates.end(),
                                       [](const AttributeCandidate& c) { return !c.empty(); });
    if (!anyUsable) {
        resolved.status = ResolutionStatus::NoUsableValue;
        resolved.decision_trace.push_back("completeness:no_usable_value");
        resolved.decided_by = "completeness";
        return resolved;
    }

    const auto& rules = cascade(set.attribute);
    const AttributeCandidate* winner = &set.candidates.front();
    if (set.candidates.size() == 1) {
        resolved.decision_trace.push_back(std::string("completeness:") +
                                          providerName(winner->source_provider));
        resolved.decided_by = "completeness";
    }
    for (size_t i = 1; i < set.candidates.size(); ++i) {
        auto outcome = rules.decide(*winner, set.candidates[i]);
        if (!outcome.firstWins)
            winner = &set.candidates[i];
        resolved.decision_trace.insert(resolved.decision_trace.end(), outcome.trace.begin(),
                                       outcome.trace.end());
        resolved.decided_by = std::move(outcome.decidedBy);
    }

    resolved.status = ResolutionStatus::Resolved;
    resolved.winning_value = winner->raw_value;
    resolved.canonical_value = winner->value;
    resolved.winning_provider = winner->source_provider;
    return resolved;
}

} // namespace placemerge::resolve
