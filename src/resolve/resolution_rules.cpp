#include <placemerge/normalize/text_cleanup.h>
#include <placemerge/resolve/resolution_rules.h>

#include <algorithm>

namespace placemerge::resolve {

namespace {

RuleVerdict preferTrue(bool first, bool second) {
    if (first == second)
        return RuleVerdict::Tie;
    return first ? RuleVerdict::PreferFirst : RuleVerdict::PreferSecond;
}

template <typename T> RuleVerdict preferGreater(const T& first, const T& second) {
    if (first == second)
        return RuleVerdict::Tie;
    return first > second ? RuleVerdict::PreferFirst : RuleVerdict::PreferSecond;
}

std::string compactName(std::string_view raw) {
    auto cleaned = normalize::cleanText(raw);
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ' '), cleaned.end());
    return cleaned;
}

bool isCoreOf(const std::string& shorter, const std::string& longer) {
    return !shorter.empty() && shorter.size() < longer.size() &&
           longer.find(shorter) != std::string::npos && 2 * shorter.size() > longer.size();
}

} // namespace

RuleVerdict CompletenessRule::compare(const AttributeCandidate& first,
                                      const AttributeCandidate& second) const {
    return preferTrue(!first.empty(), !second.empty());
}

RuleVerdict CanonicalBrandRule::compare(const AttributeCandidate& first,
                                        const AttributeCandidate& second) const {
    return preferTrue(first.derived_flags.is_canonical_brand,
                      second.derived_flags.is_canonical_brand);
}

RuleVerdict ConfidenceRule::compare(const AttributeCandidate& first,
                                    const AttributeCandidate& second) const {
    if (!first.source_confidence || !second.source_confidence)
        return RuleVerdict::Tie;
    return preferGreater(*first.source_confidence, *second.source_confidence);
}

RuleVerdict BusinessSuffixRule::compare(const AttributeCandidate& first,
                                        const AttributeCandidate& second) const {
    return preferTrue(!first.derived_flags.has_business_suffix,
                      !second.derived_flags.has_business_suffix);
}

RuleVerdict StoreNumberRule::compare(const AttributeCandidate& first,
                                     const AttributeCandidate& second) const {
    return preferTrue(!first.derived_flags.has_store_number,
                      !second.derived_flags.has_store_number);
}

RuleVerdict NameNoiseRule::compare(const AttributeCandidate& first,
                                   const AttributeCandidate& second) const {
    return preferGreater(second.derived_flags.name_noise, first.derived_flags.name_noise);
}

RuleVerdict CoreNameRule::compare(const AttributeCandidate& first,
                                  const AttributeCandidate& second) const {
    const auto a = compactName(first.raw_value);
    const auto b = compactName(second.raw_value);
    if (isCoreOf(a, b))
        return RuleVerdict::PreferFirst;
    if (isCoreOf(b, a))
        return RuleVerdict::PreferSecond;
    return RuleVerdict::Tie;
}

RuleVerdict WordCountWindowRule::compare(const AttributeCandidate& first,
                                         const AttributeCandidate& second) const {
    auto inWindow = [this](const AttributeCandidate& c) {
        const auto words = c.derived_flags.token_count;
        return words >= minWords_ && words <= maxWords_;
    };
    return preferTrue(inWindow(first), inWindow(second));
}

RuleVerdict ComponentCountRule::compare(const AttributeCandidate& first,
                                        const AttributeCandidate& second) const {
    return preferGreater(first.derived_flags.component_count,
                         second.derived_flags.component_count);
}

RuleVerdict PostalCodeRule::compare(const AttributeCandidate& first,
                                    const AttributeCandidate& second) const {
    return preferTrue(first.derived_flags.has_postal_code, second.derived_flags.has_postal_code);
}

RuleVerdict PhoneDigitsRule::compare(const AttributeCandidate& first,
                                     const AttributeCandidate& second) const {
    return preferTrue(first.derived_flags.digit_count >= 10,
                      second.derived_flags.digit_count >= 10);
}

RuleVerdict UrlValidityRule::compare(const AttributeCandidate& first,
                                     const AttributeCandidate& second) const {
    return preferTrue(first.derived_flags.is_valid_url, second.derived_flags.is_valid_url);
}

RuleVerdict SecureUrlRule::compare(const AttributeCandidate& first,
                                   const AttributeCandidate& second) const {
    return preferTrue(first.derived_flags.is_secure_url, second.derived_flags.is_secure_url);
}

RuleVerdict SocialDomainRule::compare(const AttributeCandidate& first,
                                      const AttributeCandidate& second) const {
    return preferTrue(!first.derived_flags.is_social_domain,
                      !second.derived_flags.is_social_domain);
}

RuleVerdict CategoryCountRule::compare(const AttributeCandidate& first,
                                       const AttributeCandidate& second) const {
    return preferGreater(first.derived_flags.category_count,
                         second.derived_flags.category_count);
}

RuleVerdict CategorySpecificityRule::compare(const AttributeCandidate& first,
                                             const AttributeCandidate& second) const {
    return preferGreater(first.value.size(), second.value.size());
}

RuleVerdict ConfidencePresenceRule::compare(const AttributeCandidate& first,
                                            const AttributeCandidate& second) const {
    return preferTrue(first.source_confidence.has_value(), second.source_confidence.has_value());
}

std::size_t ProviderPriorityRule::rank(Provider provider) const {
    auto it = std::find(priority_.begin(), priority_.end(), provider);
    return static_cast<std::size_t>(it - priority_.begin());
}

RuleVerdict ProviderPriorityRule::compare(const AttributeCandidate& first,
                                          const AttributeCandidate& second) const {
    const auto a = rank(first.source_provider);
    const auto b = rank(second.source_provider);
    if (a == b)
        return RuleVerdict::Tie;
    return a < b ? RuleVerdict::PreferFirst : RuleVerdict::PreferSecond;
}

RuleCascade& RuleCascade::add(std::unique_ptr<ICandidateRule> rule) {
    if (rule)
        rules_.push_back(std::move(rule));
    return *this;
}

RuleCascade::Outcome RuleCascade::decide(const AttributeCandidate& first,
                                         const AttributeCandidate& second) const {
    Outcome outcome;
    for (const auto& rule : rules_) {
        const auto verdict = rule->compare(first, second);
        std::string step(rule->name());
        if (verdict == RuleVerdict::Tie) {
            outcome.trace.push_back(step + ":tie");
            continue;
        }
        outcome.firstWins = verdict == RuleVerdict::PreferFirst;
        const auto& winner = outcome.firstWins ? first : second;
        outcome.trace.push_back(step + ":" + providerName(winner.source_provider));
        outcome.decidedBy = std::move(step);
        return outcome;
    }

    outcome.firstWins = true;
    outcome.trace.push_back(std::string("fallback:") + providerName(first.source_provider));
    outcome.decidedBy = "fallback";
    return outcome;
}

std::vector<std::string> RuleCascade::ruleNames() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.emplace_back(rule->name());
    }
    return names;
}

} // namespace placemerge::resolve
