#include <cstdlib>
#include <fstream>
#include <sstream>
#include <placemerge/config/config_helpers.h>

namespace placemerge::config {

namespace {

void parseLine(std::string line, std::string& currentSection, TomlSections& config) {
    trim(line);
    if (line.empty() || line[0] == '#')
        return;

    // Check for section headers
    if (line[0] == '[') {
        size_t end = line.find(']');
        if (end != std::string::npos) {
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
        }
        return;
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos)
        return;

    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    trim(key);
    trim(value);
    key = unquote(key);

    // Remove inline comments outside quoted strings
    bool inQuotes = false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '"')
            inQuotes = !inQuotes;
        if (value[i] == '#' && !inQuotes) {
            value = value.substr(0, i);
            trim(value);
            break;
        }
    }

    if (!value.empty() && value[0] != '[') {
        value = unquote(value);
    }

    config[currentSection][key] = value;
}

} // namespace

Result<TomlSections> parseTomlConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }

    TomlSections config;
    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        parseLine(line, currentSection, config);
    }
    return config;
}

TomlSections parseTomlString(std::string_view text) {
    TomlSections config;
    std::string currentSection;
    std::istringstream in{std::string(text)};
    std::string line;
    while (std::getline(in, line)) {
        parseLine(line, currentSection, config);
    }
    return config;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    std::string current;
    bool inQuotes = false;
    auto flush = [&]() {
        auto item = unquote(current);
        if (!item.empty())
            out.push_back(std::move(item));
        current.clear();
    };
    for (char c : body) {
        if (c == '"') {
            inQuotes = !inQuotes;
            current.push_back(c);
        } else if (c == ',' && !inQuotes) {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

std::optional<std::string> lookup(const TomlSections& sections, const std::string& section,
                                  const std::string& key) {
    auto sit = sections.find(section);
    if (sit == sections.end())
        return std::nullopt;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end())
        return std::nullopt;
    return kit->second;
}

std::optional<double> lookup_double(const TomlSections& sections, const std::string& section,
                                    const std::string& key) {
    auto raw = lookup(sections, section, key);
    if (!raw)
        return std::nullopt;
    try {
        size_t consumed = 0;
        double v = std::stod(*raw, &consumed);
        if (consumed != raw->size())
            return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<long> lookup_long(const TomlSections& sections, const std::string& section,
                                const std::string& key) {
    auto raw = lookup(sections, section, key);
    if (!raw)
        return std::nullopt;
    try {
        size_t consumed = 0;
        long v = std::stol(*raw, &consumed);
        if (consumed != raw->size())
            return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("PLACEMERGE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "placemerge" / "config.toml";
    }

    return configHome / "placemerge" / "config.toml";
}

} // namespace placemerge::config
