#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <placemerge/core/types.h>

namespace placemerge::config {

// section -> key -> raw value (quotes stripped, arrays kept verbatim)
using TomlSections = std::map<std::string, std::map<std::string, std::string>>;

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a TOML subset: [section] headers, key = value pairs, # comments.
Result<TomlSections> parseTomlConfig(const std::filesystem::path& path);

// Same as parseTomlConfig but from an in-memory document.
TomlSections parseTomlString(std::string_view text);

// Parse a one-line TOML array (["a", "b"]) or a comma separated list into its items.
std::vector<std::string> parse_string_list(const std::string& raw);

// Typed lookups; nullopt when the key is missing or the value does not parse.
std::optional<std::string> lookup(const TomlSections& sections, const std::string& section,
                                  const std::string& key);
std::optional<double> lookup_double(const TomlSections& sections, const std::string& section,
                                    const std::string& key);
std::optional<long> lookup_long(const TomlSections& sections, const std::string& section,
                                const std::string& key);

// Get standard config path
// Order: override, $PLACEMERGE_CONFIG, $XDG_CONFIG_HOME/placemerge/config.toml,
// ~/.config/placemerge/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace placemerge::config
