#pragma once

#include <filesystem>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <placemerge/core/place.h>
#include <placemerge/core/types.h>
#include <placemerge/match/record_matcher.h>
#include <placemerge/resolve/conflation_resolver.h>

namespace placemerge::io {

nlohmann::json toJson(const ResolvedAttribute& attribute);
nlohmann::json toJson(const ResolvedPlace& place);
nlohmann::json toJson(const resolve::ResolutionMetrics& metrics);

// Pairs are reported by id and similarity; full records are not repeated.
nlohmann::json toJson(const match::MatchResult& result);

/**
 * @brief Whole-run document written by `placemerge resolve`.
 *
 * {"places": [...], "match": {"pairs", "excluded", "unmatched", "stats"}, "metrics": {...}}
 */
nlohmann::json buildRunDocument(const match::MatchResult& matchResult,
                                const resolve::ResolutionOutput& resolution);

void writeJson(const nlohmann::json& doc, std::ostream& out);
Result<void> writeJsonFile(const nlohmann::json& doc, const std::filesystem::path& path);

// Non-empty winning values of one resolved place, as read back from a run document.
struct Prediction {
    std::string place_id;
    std::map<AttributeKind, std::string> values;
};

// Accepts a run document or a bare array of places. Places without a place_id are skipped.
Result<std::vector<Prediction>> predictionsFromJson(const nlohmann::json& doc);
Result<std::vector<Prediction>> readPredictions(const std::filesystem::path& path);

} // namespace placemerge::io
