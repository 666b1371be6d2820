#include <placemerge/core/place.h>

#include <algorithm>
#include <cctype>

namespace placemerge {

namespace {
std::string lowered(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
} // namespace

std::optional<Provider> parseProvider(std::string_view text) {
    const auto key = lowered(text);
    if (key == "provider_a" || key == "a")
        return Provider::ProviderA;
    if (key == "provider_b" || key == "b")
        return Provider::ProviderB;
    return std::nullopt;
}

std::optional<AttributeKind> parseAttributeKind(std::string_view text) {
    const auto key = lowered(text);
    for (auto kind : kAllAttributes) {
        if (key == attributeName(kind))
            return kind;
    }
    // Accept the plural spellings used by some provider dumps
    if (key == "categories")
        return AttributeKind::Category;
    if (key == "phones")
        return AttributeKind::Phone;
    if (key == "websites")
        return AttributeKind::Website;
    return std::nullopt;
}

} // namespace placemerge
