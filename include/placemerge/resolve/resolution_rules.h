#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <placemerge/core/place.h>

namespace placemerge::resolve {

enum class RuleVerdict { Tie, PreferFirst, PreferSecond };

/**
 * @brief One pure comparator in a resolution cascade.
 *
 * compare() must be deterministic and free of side effects. Returning Tie hands the
 * decision to the next rule.
 */
class ICandidateRule {
public:
    virtual ~ICandidateRule() = default;
    virtual std::string_view name() const = 0;
    virtual RuleVerdict compare(const AttributeCandidate& first,
                                const AttributeCandidate& second) const = 0;
};

// Non-empty beats empty.
class CompletenessRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "completeness"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// A name found in the canonical brand table beats one that is not.
class CanonicalBrandRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "canonical_brand"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// Higher provider confidence wins, only when both candidates carry one.
class ConfidenceRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "confidence"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// A name without a trailing business suffix beats one with it.
class BusinessSuffixRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "business_suffix"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// A name without a store id beats one with it.
class StoreNumberRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "store_number"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// Lower listing/SEO noise wins.
class NameNoiseRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "name_noise"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

/**
 * @brief The core of a longer name beats the longer name.
 *
 * Both raw names are reduced to their letters and digits. The shorter wins when it is
 * contained in the longer one and covers more than half of it ("Harbor Books" over
 * "Harbor Books Outlet"). Equal-length names tie.
 */
class CoreNameRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "core_name"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// Names whose token count lies in [minWords, maxWords] beat those outside.
class WordCountWindowRule final : public ICandidateRule {
public:
    WordCountWindowRule(std::size_t minWords, std::size_t maxWords)
        : minWords_(minWords), maxWords_(maxWords) {}
    std::string_view name() const override { return "word_count_window"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;

private:
    std::size_t minWords_;
    std::size_t maxWords_;
};

// More comma separated address components wins.
class ComponentCountRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "component_count"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

class PostalCodeRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "postal_code"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// A phone with at least 10 digits beats a shorter one.
class PhoneDigitsRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "phone_digits"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

class UrlValidityRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "url_valid"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

class SecureUrlRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "secure_url"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// The place's own domain beats a listing or social site.
class SocialDomainRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "social_domain"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

class CategoryCountRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "category_count"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// Longer canonical category text is taken as more specific.
class CategorySpecificityRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "category_specificity"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// A confidence score beats its absence; runs after every attribute specific rule.
class ConfidencePresenceRule final : public ICandidateRule {
public:
    std::string_view name() const override { return "confidence_presence"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;
};

// Fixed provider order. Distinct providers never tie.
class ProviderPriorityRule final : public ICandidateRule {
public:
    explicit ProviderPriorityRule(std::vector<Provider> priority) : priority_(std::move(priority)) {}
    std::string_view name() const override { return "provider_priority"; }
    RuleVerdict compare(const AttributeCandidate& first,
                        const AttributeCandidate& second) const override;

private:
    std::size_t rank(Provider provider) const;

    std::vector<Provider> priority_;
};

/**
 * @brief Ordered rules for one attribute, evaluated with early exit.
 *
 * Every evaluated rule is appended to the trace as "<rule>:tie" or "<rule>:<provider>".
 * When all rules tie the first candidate wins under "fallback:<provider>".
 */
class RuleCascade {
public:
    struct Outcome {
        bool firstWins = true;
        std::vector<std::string> trace;
        std::string decidedBy;
    };

    RuleCascade() = default;
    RuleCascade(RuleCascade&&) noexcept = default;
    RuleCascade& operator=(RuleCascade&&) noexcept = default;

    RuleCascade& add(std::unique_ptr<ICandidateRule> rule);

    Outcome decide(const AttributeCandidate& first, const AttributeCandidate& second) const;

    std::vector<std::string> ruleNames() const;

    std::size_t size() const { return rules_.size(); }

private:
    std::vector<std::unique_ptr<ICandidateRule>> rules_;
};

} // namespace placemerge::resolve
