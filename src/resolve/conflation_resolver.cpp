#include <placemerge/resolve/conflation_resolver.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace placemerge::resolve {

void ResolutionMetrics::record(const CandidateSet& candidates, const ResolvedAttribute& resolved) {
    auto& m = attributes[resolved.attribute];

    const auto usable = std::count_if(candidates.candidates.begin(), candidates.candidates.end(),
                                      [](const AttributeCandidate& c) { return !c.empty(); });
    if (usable > 1)
        ++m.conflicts;
    if (!candidates.quality_flags.empty())
        ++m.malformed_confidence;

    switch (resolved.status) {
        case ResolutionStatus::Resolved:
            if (resolved.winning_provider)
                ++m.wins[static_cast<std::size_t>(*resolved.winning_provider)];
            break;
        case ResolutionStatus::NoUsableValue:
            ++m.no_usable_value;
            break;
        case ResolutionStatus::Unresolved:
            ++m.unresolved;
            break;
    }
}

void ResolutionMetrics::logSummary() const {
    for (const auto& [kind, m] : attributes) {
        const auto decided = m.wins[0] + m.wins[1];
        const double rateA = decided > 0 ? 100.0 * static_cast<double>(m.wins[0]) / decided : 0.0;
        spdlog::info("{}: {} conflicts, {} {} / {} {} ({:.1f}% {}), {} no usable value, {} "
                     "unresolved",
                     attributeName(kind), m.conflicts, m.wins[0],
                     providerName(Provider::ProviderA), m.wins[1],
                     providerName(Provider::ProviderB), rateA, providerName(Provider::ProviderA),
                     m.no_usable_value, m.unresolved);
        if (m.malformed_confidence > 0) {
            spdlog::warn("{}: {} decisions saw malformed provider confidence", attributeName(kind),
                         m.malformed_confidence);
        }
    }
}

ConflationResolver::ConflationResolver(std::shared_ptr<const normalize::ReferenceTables> tables,
                                       ResolverConfig config,
                                       std::shared_ptr<const IAttributeResolver> attributeResolver)
    : config_(std::move(config)), aggregator_(std::move(tables)),
      attributeResolver_(attributeResolver ? std::move(attributeResolver)
                                           : std::make_shared<RuleBasedResolver>(config_)) {}

std::optional<Provider>
ConflationResolver::bestSource(const std::vector<ResolvedAttribute>& attributes) const {
    std::array<std::size_t, 2> wins{0, 0};
    for (const auto& attr : attributes) {
        if (attr.winning_provider)
            ++wins[static_cast<std::size_t>(*attr.winning_provider)];
    }
    if (wins[0] == 0 && wins[1] == 0)
        return std::nullopt;
    if (wins[0] != wins[1])
        return wins[0] > wins[1] ? Provider::ProviderA : Provider::ProviderB;
    if (!config_.provider_priority.empty())
        return config_.provider_priority.front();
    return Provider::ProviderA;
}

ResolvedPlace ConflationResolver::resolvePlace(const MatchedPair& pair,
                                               ResolutionMetrics* metrics) const {
    const auto candidates = aggregator_.aggregate(pair);

    ResolvedPlace place;
    place.place_id = candidates.place_id;
    place.record_a_id = pair.recordA.record_id;
    place.record_b_id = pair.recordB.record_id;
    place.match_kind = pair.match_kind;
    place.attributes.reserve(candidates.sets.size());
    for (const auto& set : candidates.sets) {
        auto resolved = attributeResolver_->resolve(set);
        if (metrics)
            metrics->record(set, resolved);
        place.attributes.push_back(std::move(resolved));
    }
    place.best_source = bestSource(place.attributes);
    return place;
}

ResolutionOutput ConflationResolver::resolveAll(const std::vector<MatchedPair>& pairs) const {
    ResolutionOutput output;
    output.places.reserve(pairs.size());
    for (const auto& pair : pairs) {
        output.places.push_back(resolvePlace(pair, &output.metrics));
    }
    spdlog::info("Resolved {} places with the {} resolver", output.places.size(),
                 attributeResolver_->name());
    output.metrics.logSummary();
    return output;
}

} // namespace placemerge::resolve
