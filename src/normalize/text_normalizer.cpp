#include <placemerge/normalize/text_cleanup.h>
#include <placemerge/normalize/text_normalizer.h>

#include <cctype>

namespace placemerge::normalize {

TextNormalizer::TextNormalizer(std::shared_ptr<const ReferenceTables> tables)
    : tables_(tables ? std::move(tables) : ReferenceTables::defaults()) {}

std::string TextNormalizer::normalize(std::string_view raw, AttributeKind kind) const {
    switch (kind) {
        case AttributeKind::Name:
            return normalizeName(raw);
        case AttributeKind::Phone:
            return normalizePhone(raw);
        case AttributeKind::Website:
            return normalizeWebsite(raw);
        case AttributeKind::Address:
        case AttributeKind::Category:
            return cleanText(raw);
    }
    return cleanText(raw);
}

std::string TextNormalizer::normalizeName(std::string_view raw) const {
    auto stripped = stripBusinessSuffixes(cleanText(raw), tables_->businessSuffixes());
    if (auto brand = tables_->canonicalBrand(stripped)) {
        return *brand;
    }
    return stripped;
}

std::string TextNormalizer::normalizePhone(std::string_view raw) {
    std::string digits;
    for (unsigned char c : raw) {
        if (std::isdigit(c))
            digits.push_back(static_cast<char>(c));
    }
    if (digits.size() > 10) {
        digits.erase(0, digits.size() - 10);
    }
    return digits;
}

std::string TextNormalizer::normalizeWebsite(std::string_view raw) {
    std::string url;
    url.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isspace(c))
            continue;
        url.push_back(static_cast<char>(std::tolower(c)));
    }

    for (std::string_view scheme : {"https://", "http://"}) {
        if (url.rfind(scheme, 0) == 0) {
            url.erase(0, scheme.size());
            break;
        }
    }
    while (url.rfind("www.", 0) == 0) {
        url.erase(0, 4);
    }

    auto end = url.find_first_of("/?#");
    if (end != std::string::npos)
        url.erase(end);

    // Host characters only; anything else makes the host unusable
    std::string host;
    for (char c : url) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-') {
            host.push_back(c);
        } else {
            return {};
        }
    }
    while (!host.empty() && host.back() == '.')
        host.pop_back();
    return host;
}

std::string TextNormalizer::joinAddress(std::string_view street, std::string_view city,
                                        std::string_view region, std::string_view postalCode) {
    std::string out;
    out.reserve(street.size() + city.size() + region.size() + postalCode.size() + 3);
    out.append(street);
    out.push_back(',');
    out.append(city);
    out.push_back(',');
    out.append(region);
    out.push_back(',');
    out.append(postalCode);
    return out;
}

std::optional<std::string> TextNormalizer::rawValue(const PlaceRecord& record,
                                                    AttributeKind kind) {
    if (const auto* direct = record.raw(attributeName(kind))) {
        return *direct;
    }
    if (kind != AttributeKind::Address) {
        return std::nullopt;
    }

    bool any = false;
    std::string parts[4];
    for (size_t i = 0; i < kAddressComponentKeys.size(); ++i) {
        if (const auto* component = record.raw(kAddressComponentKeys[i])) {
            parts[i] = *component;
            any = true;
        }
    }
    if (!any) {
        return std::nullopt;
    }
    return joinAddress(parts[0], parts[1], parts[2], parts[3]);
}

PlaceRecord TextNormalizer::normalizeRecord(PlaceRecord record) const {
    record.normalized_attributes.clear();
    for (auto kind : kAllAttributes) {
        auto raw = rawValue(record, kind);
        if (!raw)
            continue;
        auto normalized = normalize(*raw, kind);
        if (!normalized.empty()) {
            record.normalized_attributes.emplace(kind, std::move(normalized));
        }
    }
    return record;
}

} // namespace placemerge::normalize
