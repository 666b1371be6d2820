#pragma once

#include <filesystem>
#include <memory>
#include <placemerge/config/config_helpers.h>
#include <placemerge/core/types.h>
#include <placemerge/match/record_matcher.h>
#include <placemerge/normalize/reference_tables.h>
#include <placemerge/resolve/attribute_resolver.h>

namespace placemerge::config {

// Everything a run needs besides its input records.
struct ConflationConfig {
    match::MatcherConfig matcher;
    resolve::ResolverConfig resolver;
    std::shared_ptr<const normalize::ReferenceTables> tables = normalize::ReferenceTables::defaults();

    Result<void> validate() const;
};

/**
 * @brief Load and validate a configuration file.
 *
 * Reads [matcher], [resolver], [reference] and [brands]. Keys that are absent keep their
 * defaults; keys that are present but malformed fail with InvalidArgument. A relative
 * [reference].brand_table path resolves against the config file's directory.
 */
Result<ConflationConfig> loadConflationConfig(const std::filesystem::path& path);

// Build from already parsed sections; `baseDir` anchors relative brand table paths.
Result<ConflationConfig> conflationConfigFromToml(const TomlSections& sections,
                                                  const std::filesystem::path& baseDir = {});

} // namespace placemerge::config
