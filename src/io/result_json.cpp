#include <placemerge/io/result_json.h>

#include <spdlog/spdlog.h>
#include <fstream>

namespace placemerge::io {

using nlohmann::json;

json toJson(const ResolvedAttribute& attribute) {
    json j;
    j["status"] = resolutionStatusName(attribute.status);
    j["value"] = attribute.winning_value;
    j["canonical_value"] = attribute.canonical_value;
    if (attribute.winning_provider)
        j["provider"] = providerName(*attribute.winning_provider);
    else
        j["provider"] = nullptr;
    j["decided_by"] = attribute.decided_by;
    j["trace"] = attribute.decision_trace;
    j["quality_flags"] = attribute.quality_flags;
    return j;
}

json toJson(const ResolvedPlace& place) {
    json j;
    j["place_id"] = place.place_id;
    j["record_a_id"] = place.record_a_id;
    j["record_b_id"] = place.record_b_id;
    j["match_kind"] = matchKindName(place.match_kind);
    if (place.best_source)
        j["best_source"] = providerName(*place.best_source);
    else
        j["best_source"] = nullptr;

    json attributes = json::object();
    for (const auto& attr : place.attributes) {
        attributes[attributeName(attr.attribute)] = toJson(attr);
    }
    j["attributes"] = std::move(attributes);
    return j;
}

json toJson(const resolve::ResolutionMetrics& metrics) {
    json j = json::object();
    for (const auto& [kind, m] : metrics.attributes) {
        json wins = json::object();
        for (auto provider : kAllProviders) {
            wins[providerName(provider)] = m.wins[static_cast<std::size_t>(provider)];
        }
        j[attributeName(kind)] = {{"conflicts", m.conflicts},
                                  {"wins", std::move(wins)},
                                  {"no_usable_value", m.no_usable_value},
                                  {"unresolved", m.unresolved},
                                  {"malformed_confidence", m.malformed_confidence}};
    }
    return j;
}

json toJson(const match::MatchResult& result) {
    json pairs = json::array();
    for (const auto& pair : result.pairs) {
        pairs.push_back({{"place_id", pair.placeId()},
                         {"record_a_id", pair.recordA.record_id},
                         {"record_b_id", pair.recordB.record_id},
                         {"match_kind", matchKindName(pair.match_kind)},
                         {"name_similarity", pair.name_similarity},
                         {"address_similarity", pair.address_similarity}});
    }

    json excluded = json::array();
    for (const auto& record : result.excluded) {
        excluded.push_back({{"record_id", record.record_id},
                            {"provider", providerName(record.provider)},
                            {"reason", match::exclusionReasonName(record.reason)}});
    }

    json unmatched = json::array();
    for (const auto& record : result.unmatched) {
        unmatched.push_back(
            {{"record_id", record.record_id}, {"provider", providerName(record.provider)}});
    }

    const auto& s = result.stats;
    json stats = {{"eligible_a", s.eligible_a},
                  {"eligible_b", s.eligible_b},
                  {"exact_pairs", s.exact_pairs},
                  {"fuzzy_candidates", s.fuzzy_candidates},
                  {"fuzzy_pairs", s.fuzzy_pairs},
                  {"rejected_ambiguous", s.rejected_ambiguous},
                  {"comparisons", s.comparisons},
                  {"buckets", s.buckets}};

    return {{"pairs", std::move(pairs)},
            {"excluded", std::move(excluded)},
            {"unmatched", std::move(unmatched)},
            {"stats", std::move(stats)}};
}

json buildRunDocument(const match::MatchResult& matchResult,
                      const resolve::ResolutionOutput& resolution) {
    json places = json::array();
    for (const auto& place : resolution.places) {
        places.push_back(toJson(place));
    }
    json doc;
    doc["places"] = std::move(places);
    doc["match"] = toJson(matchResult);
    doc["metrics"] = toJson(resolution.metrics);
    return doc;
}

void writeJson(const json& doc, std::ostream& out) {
    out << doc.dump(2) << '\n';
}

Result<void> writeJsonFile(const json& doc, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::WriteError, "Cannot open output file: " + path.string()};
    }
    writeJson(doc, file);
    file.flush();
    if (!file) {
        return Error{ErrorCode::WriteError, "Failed writing output file: " + path.string()};
    }
    spdlog::info("Wrote {}", path.string());
    return {};
}

Result<std::vector<Prediction>> predictionsFromJson(const json& doc) {
    const json* places = &doc;
    if (doc.is_object()) {
        auto it = doc.find("places");
        if (it == doc.end() || !it->is_array()) {
            return Error{ErrorCode::InvalidData, "Predictions document has no 'places' array"};
        }
        places = &*it;
    } else if (!doc.is_array()) {
        return Error{ErrorCode::InvalidData, "Predictions must be an object or an array"};
    }

    std::vector<Prediction> predictions;
    for (const auto& place : *places) {
        if (!place.is_object())
            continue;
        auto id = place.find("place_id");
        if (id == place.end() || !id->is_string())
            continue;

        Prediction prediction;
        prediction.place_id = id->get<std::string>();
        if (auto attrs = place.find("attributes"); attrs != place.end() && attrs->is_object()) {
            for (auto it = attrs->begin(); it != attrs->end(); ++it) {
                auto kind = parseAttributeKind(it.key());
                if (!kind || !it.value().is_object())
                    continue;
                auto value = it.value().find("value");
                if (value != it.value().end() && value->is_string() &&
                    !value->get_ref<const std::string&>().empty())
                    prediction.values[*kind] = value->get<std::string>();
            }
        }
        predictions.push_back(std::move(prediction));
    }
    return predictions;
}

Result<std::vector<Prediction>> readPredictions(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open predictions file: " + path.string()};
    }
    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ParseError,
                     "Predictions file " + path.string() + " is not valid JSON: " + e.what()};
    }
    return predictionsFromJson(doc);
}

} // namespace placemerge::io
