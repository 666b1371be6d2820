#include <placemerge/config/conflation_config.h>

#include <spdlog/spdlog.h>
#include <map>
#include <string>
#include <vector>

namespace placemerge::config {

namespace {

Error badValue(const std::string& section, const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for [" + section + "]." + key + ": '" + value + "'"};
}

Result<void> applyMatcher(const TomlSections& sections, match::MatcherConfig& matcher) {
    if (auto raw = lookup(sections, "matcher", "similarity_threshold")) {
        auto threshold = lookup_double(sections, "matcher", "similarity_threshold");
        if (!threshold)
            return badValue("matcher", "similarity_threshold", *raw);
        matcher.similarity_threshold = *threshold;
    }
    if (auto raw = lookup(sections, "matcher", "blocking")) {
        auto strategy = match::parseBlockingStrategy(*raw);
        if (!strategy)
            return badValue("matcher", "blocking", *raw);
        matcher.blocking = *strategy;
    }
    if (auto raw = lookup(sections, "matcher", "workers")) {
        auto workers = lookup_long(sections, "matcher", "workers");
        if (!workers || *workers < 0)
            return badValue("matcher", "workers", *raw);
        matcher.workers = static_cast<std::size_t>(*workers);
    }
    if (auto raw = lookup(sections, "matcher", "progress_interval")) {
        auto interval = lookup_long(sections, "matcher", "progress_interval");
        if (!interval || *interval <= 0)
            return badValue("matcher", "progress_interval", *raw);
        matcher.progress_interval = static_cast<std::size_t>(*interval);
    }
    return {};
}

Result<void> applyResolver(const TomlSections& sections, resolve::ResolverConfig& resolver) {
    if (auto raw = lookup(sections, "resolver", "provider_priority")) {
        std::vector<Provider> priority;
        for (const auto& item : parse_string_list(*raw)) {
            auto provider = parseProvider(item);
            if (!provider)
                return badValue("resolver", "provider_priority", item);
            priority.push_back(*provider);
        }
        resolver.provider_priority = std::move(priority);
    }
    if (auto raw = lookup(sections, "resolver", "name_min_words")) {
        auto words = lookup_long(sections, "resolver", "name_min_words");
        if (!words || *words < 0)
            return badValue("resolver", "name_min_words", *raw);
        resolver.name_min_words = static_cast<std::size_t>(*words);
    }
    if (auto raw = lookup(sections, "resolver", "name_max_words")) {
        auto words = lookup_long(sections, "resolver", "name_max_words");
        if (!words || *words < 0)
            return badValue("resolver", "name_max_words", *raw);
        resolver.name_max_words = static_cast<std::size_t>(*words);
    }
    return {};
}

Result<std::shared_ptr<const normalize::ReferenceTables>>
buildTables(const TomlSections& sections, const std::filesystem::path& baseDir) {
    const bool customSuffixes = lookup(sections, "reference", "business_suffixes").has_value();
    const auto brandTable = lookup(sections, "reference", "brand_table");
    const auto inlineBrands = sections.find("brands");
    const bool hasInlineBrands = inlineBrands != sections.end() && !inlineBrands->second.empty();

    if (!customSuffixes && !brandTable && !hasInlineBrands)
        return normalize::ReferenceTables::defaults();

    auto suffixes = normalize::ReferenceTables::defaultBusinessSuffixes();
    if (customSuffixes) {
        suffixes = parse_string_list(*lookup(sections, "reference", "business_suffixes"));
    }

    auto aliases = normalize::ReferenceTables::defaultBrandAliases();
    if (brandTable && !brandTable->empty()) {
        std::filesystem::path tablePath = expand_tilde(*brandTable);
        if (tablePath.is_relative() && !baseDir.empty())
            tablePath = baseDir / tablePath;
        auto loaded = normalize::loadBrandTable(tablePath);
        if (!loaded)
            return loaded.error();
        for (auto& [alias, canonical] : loaded.value()) {
            aliases[alias] = canonical;
        }
    }
    if (hasInlineBrands) {
        for (const auto& [alias, canonical] : inlineBrands->second) {
            aliases[alias] = canonical;
        }
    }

    return normalize::ReferenceTables::build(suffixes, aliases);
}

} // namespace

Result<void> ConflationConfig::validate() const {
    if (auto r = matcher.validate(); !r)
        return r;
    if (auto r = resolver.validate(); !r)
        return r;
    if (!tables)
        return Error{ErrorCode::InvalidArgument, "Reference tables are not loaded"};
    return {};
}

Result<ConflationConfig> conflationConfigFromToml(const TomlSections& sections,
                                                  const std::filesystem::path& baseDir) {
    ConflationConfig config;
    if (auto r = applyMatcher(sections, config.matcher); !r)
        return r.error();
    if (auto r = applyResolver(sections, config.resolver); !r)
        return r.error();

    auto tables = buildTables(sections, baseDir);
    if (!tables)
        return tables.error();
    config.tables = std::move(tables).value();

    if (auto r = config.validate(); !r)
        return r.error();
    return config;
}

Result<ConflationConfig> loadConflationConfig(const std::filesystem::path& path) {
    auto sections = parseTomlConfig(path);
    if (!sections)
        return sections.error();
    spdlog::debug("Loaded configuration from {}", path.string());
    return conflationConfigFromToml(sections.value(), path.parent_path());
}

} // namespace placemerge::config
