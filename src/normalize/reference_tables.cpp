#include <placemerge/normalize/reference_tables.h>
#include <placemerge/normalize/text_cleanup.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace placemerge::normalize {

std::vector<std::string> ReferenceTables::defaultBusinessSuffixes() {
    return {"llc", "inc",     "incorporated", "corporation", "corp", "company", "co",
            "ltd", "limited", "plc",          "lp",          "llp",  "pllc",    "pc"};
}

std::map<std::string, std::string> ReferenceTables::defaultBrandAliases() {
    return {
        {"Walmart", "Walmart"},
        {"Wal-Mart", "Walmart"},
        {"Walmart Supercenter", "Walmart"},
        {"McDonald's", "McDonald's"},
        {"McDonalds", "McDonald's"},
        {"Mc Donalds", "McDonald's"},
        {"Starbucks", "Starbucks"},
        {"Starbucks Coffee", "Starbucks"},
        {"7-Eleven", "7-Eleven"},
        {"Seven Eleven", "7-Eleven"},
        {"CVS", "CVS"},
        {"CVS Pharmacy", "CVS"},
        {"Walgreens", "Walgreens"},
        {"Walgreens Pharmacy", "Walgreens"},
        {"The Home Depot", "Home Depot"},
        {"Home Depot", "Home Depot"},
        {"Target", "Target"},
        {"Subway", "Subway"},
    };
}

std::shared_ptr<const ReferenceTables> ReferenceTables::defaults() {
    static const auto tables = build(defaultBusinessSuffixes(), defaultBrandAliases());
    return tables;
}

std::shared_ptr<const ReferenceTables>
ReferenceTables::build(const std::vector<std::string>& businessSuffixes,
                       const std::map<std::string, std::string>& aliases) {
    std::shared_ptr<ReferenceTables> tables(new ReferenceTables());

    for (const auto& suffix : businessSuffixes) {
        auto cleaned = cleanText(suffix);
        // Multi-word suffixes cannot be matched as a trailing token
        if (!cleaned.empty() && cleaned.find(' ') == std::string::npos) {
            tables->suffixes_.insert(std::move(cleaned));
        }
    }

    auto normalizeBrand = [&](const std::string& text) {
        return stripBusinessSuffixes(cleanText(text), tables->suffixes_);
    };

    for (const auto& [alias, canonical] : aliases) {
        auto key = normalizeBrand(alias);
        auto value = normalizeBrand(canonical);
        if (key.empty() || value.empty()) {
            spdlog::warn("Ignoring brand entry '{}' -> '{}': normalizes to empty", alias,
                         canonical);
            continue;
        }
        tables->brands_[key] = value;
        tables->display_.emplace(value, canonical);
        tables->surfaces_.insert(cleanText(alias));
        tables->surfaces_.insert(cleanText(canonical));
    }

    // Canonical strings are fixed points of the lookup
    for (const auto& [value, display] : tables->display_) {
        tables->brands_[value] = value;
    }

    return tables;
}

std::optional<std::string> ReferenceTables::canonicalBrand(std::string_view normalizedName) const {
    auto it = brands_.find(std::string(normalizedName));
    if (it == brands_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string>
ReferenceTables::brandDisplayName(std::string_view normalizedCanonical) const {
    auto it = display_.find(std::string(normalizedCanonical));
    if (it == display_.end())
        return std::nullopt;
    return it->second;
}

Result<std::map<std::string, std::string>> loadBrandTable(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open brand table: " + path.string()};
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::ParseError,
                     "Brand table " + path.string() + " is not valid JSON: " + e.what()};
    }

    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData,
                     "Brand table must be a JSON object of alias -> brand: " + path.string()};
    }

    std::map<std::string, std::string> aliases;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string()) {
            spdlog::warn("Brand table {}: skipping non-string value for '{}'", path.string(),
                         it.key());
            continue;
        }
        aliases[it.key()] = it.value().get<std::string>();
    }
    spdlog::debug("Loaded {} brand aliases from {}", aliases.size(), path.string());
    return aliases;
}

} // namespace placemerge::normalize
