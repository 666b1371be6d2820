#include <placemerge/io/place_reader.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <optional>
#include <string>

namespace placemerge::io {

namespace {

std::optional<std::string> scalarText(const nlohmann::json& value) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_number() || value.is_boolean())
        return value.dump();
    return std::nullopt;
}

std::optional<std::string> attributeText(const nlohmann::json& value) {
    if (auto text = scalarText(value))
        return text;
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value) {
            if (!item.is_string())
                continue;
            if (!joined.empty())
                joined += ", ";
            joined += item.get<std::string>();
        }
        return joined;
    }
    if (value.is_object()) {
        auto it = value.find("primary");
        if (it != value.end() && it->is_string())
            return it->get<std::string>();
    }
    return std::nullopt;
}

} // namespace

ReadReport readPlaceRecords(std::istream& in, Provider provider, std::string_view sourceName) {
    ReadReport report;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        ++report.lines;

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("{}:{}: skipping unparseable line: {}", sourceName, lineNo, e.what());
            ++report.skipped_lines;
            continue;
        }
        if (!doc.is_object()) {
            spdlog::warn("{}:{}: skipping line that is not a JSON object", sourceName, lineNo);
            ++report.skipped_lines;
            continue;
        }

        PlaceRecord record;
        record.provider = provider;
        if (auto it = doc.find("provider"); it != doc.end() && it->is_string()) {
            auto parsed = parseProvider(it->get<std::string>());
            if (!parsed) {
                spdlog::warn("{}:{}: skipping line with unknown provider '{}'", sourceName,
                             lineNo, it->get<std::string>());
                ++report.skipped_lines;
                continue;
            }
            record.provider = *parsed;
        }

        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const auto& key = it.key();
            if (key == "provider")
                continue;
            if (key == "id") {
                if (auto id = scalarText(it.value()))
                    record.record_id = *id;
                continue;
            }
            if (key == "confidence") {
                if (auto text = scalarText(it.value()))
                    record.raw_confidence = *text;
                continue;
            }
            if (auto text = attributeText(it.value()))
                record.raw_attributes[key] = *text;
        }
        if (record.record_id.empty()) {
            spdlog::warn("{}:{}: skipping record without an id", sourceName, lineNo);
            ++report.skipped_lines;
            continue;
        }
        report.records.push_back(std::move(record));
    }

    if (report.skipped_lines > 0) {
        spdlog::warn("{}: skipped {} of {} lines", sourceName, report.skipped_lines, report.lines);
    }
    return report;
}

Result<ReadReport> readPlaceRecords(const std::filesystem::path& path, Provider provider) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open input file: " + path.string()};
    }
    auto report = readPlaceRecords(file, provider, path.string());
    spdlog::info("Read {} {} records from {}", report.records.size(), providerName(provider),
                 path.string());
    return report;
}

} // namespace placemerge::io
