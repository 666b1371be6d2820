#include <placemerge/normalize/text_cleanup.h>
#include <placemerge/resolve/candidate_aggregator.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace placemerge::resolve {

namespace {

std::string trimmed(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::size_t countParts(std::string_view raw, std::string_view separators) {
    std::size_t count = 0;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find_first_of(separators, start);
        if (end == std::string_view::npos)
            end = raw.size();
        if (!trimmed(raw.substr(start, end - start)).empty())
            ++count;
        start = end + 1;
    }
    return count;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// A standalone 5-digit group, optionally followed by -dddd (ZIP or ZIP+4).
bool containsPostalCode(std::string_view raw) {
    size_t i = 0;
    while (i < raw.size()) {
        if (!isDigit(raw[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < raw.size() && isDigit(raw[i]))
            ++i;
        if (i - start != 5)
            continue;
        const bool boundedLeft =
            start == 0 || !std::isalnum(static_cast<unsigned char>(raw[start - 1]));
        size_t after = i;
        if (after < raw.size() && raw[after] == '-') {
            size_t j = after + 1;
            while (j < raw.size() && isDigit(raw[j]))
                ++j;
            if (j - after - 1 == 4)
                after = j;
        }
        const bool boundedRight =
            after == raw.size() || !std::isalnum(static_cast<unsigned char>(raw[after]));
        if (boundedLeft && boundedRight)
            return true;
    }
    return false;
}

constexpr std::string_view kNoisePhrases[] = {
    "hours",  "address", "official site", "official", "site",  "near me",
    "nearby", "reviews", "location",      "directions", "best ", " in "};

std::string lowered(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool allDigits(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), isDigit);
}

} // namespace

bool hasStoreNumber(std::string_view rawName) {
    for (size_t i = 0; i < rawName.size(); ++i) {
        if (rawName[i] != '#')
            continue;
        size_t j = i + 1;
        while (j < rawName.size() && rawName[j] == ' ')
            ++j;
        if (j < rawName.size() && isDigit(rawName[j]))
            return true;
    }

    const auto tokens = normalize::splitTokens(normalize::cleanText(rawName));
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (allDigits(tokens[i]) && tokens[i].size() >= 3 && tokens[i].size() <= 6)
            return true;
        if (tokens[i] == "store" && i + 1 < tokens.size() && allDigits(tokens[i + 1]))
            return true;
    }
    return false;
}

std::size_t nameNoiseScore(std::string_view rawName) {
    const auto text = lowered(rawName);
    std::size_t noise = 0;
    for (auto phrase : kNoisePhrases) {
        if (text.find(phrase) != std::string::npos)
            ++noise;
    }
    if (normalize::splitTokens(normalize::cleanText(rawName)).size() >= 8)
        ++noise;
    if (text.find("hours") != std::string::npos && text.find("address") != std::string::npos)
        noise += 2;
    return noise;
}

ParsedConfidence parseConfidence(std::string_view raw) {
    ParsedConfidence parsed;
    auto text = trimmed(raw);
    if (text.empty())
        return parsed;

    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value) || value < 0.0 ||
        value > 1.0) {
        parsed.malformed = true;
        return parsed;
    }
    parsed.value = value;
    return parsed;
}

const std::vector<std::string>& socialDomains() {
    static const std::vector<std::string> domains = {
        "facebook.com", "instagram.com", "youtube.com", "twitter.com",
        "x.com",        "bing.com",      "yelp.com",    "tripadvisor.com"};
    return domains;
}

CandidateAggregator::CandidateAggregator(std::shared_ptr<const normalize::ReferenceTables> tables)
    : tables_(tables ? std::move(tables) : normalize::ReferenceTables::defaults()),
      normalizer_(tables_) {}

CandidateFlags CandidateAggregator::deriveFlags(std::string_view raw, std::string_view canonical,
                                                AttributeKind kind) const {
    CandidateFlags flags;
    const auto cleaned = normalize::cleanText(raw);
    flags.token_count = normalize::splitTokens(canonical).size();

    switch (kind) {
        case AttributeKind::Name:
            flags.is_canonical_brand = !cleaned.empty() && tables_->isBrandEntry(cleaned);
            flags.has_business_suffix =
                normalize::endsWithBusinessSuffix(cleaned, tables_->businessSuffixes());
            flags.has_store_number = hasStoreNumber(raw);
            flags.name_noise = nameNoiseScore(raw);
            break;
        case AttributeKind::Address:
            flags.component_count = countParts(raw, ",");
            flags.has_postal_code = containsPostalCode(raw);
            break;
        case AttributeKind::Phone:
            flags.digit_count = static_cast<std::size_t>(
                std::count_if(raw.begin(), raw.end(), [](char c) { return isDigit(c); }));
            break;
        case AttributeKind::Website: {
            std::string url = trimmed(raw);
            std::transform(url.begin(), url.end(), url.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const bool https = url.rfind("https://", 0) == 0;
            const bool http = url.rfind("http://", 0) == 0;
            const size_t hostStart = https ? 8 : (http ? 7 : 0);
            const bool hostPresent =
                hostStart < url.size() &&
                (std::isalnum(static_cast<unsigned char>(url[hostStart])) || url[hostStart] == '_' ||
                 url[hostStart] == '-' || url[hostStart] == '.');
            flags.is_valid_url = (https || http) && hostPresent;
            flags.is_secure_url = https && hostPresent;
            for (const auto& domain : socialDomains()) {
                if (canonical == domain ||
                    (canonical.size() > domain.size() &&
                     canonical.substr(canonical.size() - domain.size() - 1) == "." + domain)) {
                    flags.is_social_domain = true;
                    break;
                }
            }
            break;
        }
        case AttributeKind::Category:
            flags.category_count = countParts(raw, ",;");
            break;
    }
    return flags;
}

std::optional<AttributeCandidate>
CandidateAggregator::buildCandidate(const PlaceRecord& record, AttributeKind kind,
                                    const ParsedConfidence& confidence) const {
    auto raw = normalize::TextNormalizer::rawValue(record, kind);
    if (!raw)
        return std::nullopt;

    AttributeCandidate candidate;
    candidate.raw_value = *raw;
    candidate.value = normalizer_.normalize(*raw, kind);
    candidate.source_provider = record.provider;
    candidate.source_confidence = confidence.value;
    candidate.derived_flags = deriveFlags(*raw, candidate.value, kind);
    return candidate;
}

PlaceCandidates CandidateAggregator::aggregate(const MatchedPair& pair) const {
    PlaceCandidates out;
    out.place_id = pair.placeId();

    const PlaceRecord* sides[] = {&pair.recordA, &pair.recordB};
    ParsedConfidence confidences[2];
    for (int i = 0; i < 2; ++i) {
        if (sides[i]->raw_confidence) {
            confidences[i] = parseConfidence(*sides[i]->raw_confidence);
            if (confidences[i].malformed) {
                spdlog::debug("Place {}: unparseable {} confidence '{}', treating as absent",
                              out.place_id, providerName(sides[i]->provider),
                              *sides[i]->raw_confidence);
            }
        }
    }

    out.sets.reserve(kAllAttributes.size());
    for (auto kind : kAllAttributes) {
        CandidateSet set;
        set.attribute = kind;
        for (int i = 0; i < 2; ++i) {
            auto candidate = buildCandidate(*sides[i], kind, confidences[i]);
            if (!candidate)
                continue;
            if (confidences[i].malformed) {
                set.quality_flags.push_back(std::string("confidence_malformed:") +
                                            providerName(sides[i]->provider));
            }
            set.candidates.push_back(std::move(*candidate));
        }
        out.sets.push_back(std::move(set));
    }
    return out;
}

} // namespace placemerge::resolve
