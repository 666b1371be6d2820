#include <placemerge/eval/accuracy_evaluator.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <unordered_map>
#include <placemerge/match/token_similarity.h>
#include <placemerge/normalize/text_cleanup.h>

namespace placemerge::eval {

namespace {
constexpr std::string_view kTruthPrefix = "truth_";
}

std::vector<TruthRow> readTruth(std::istream& in, std::string_view sourceName) {
    std::vector<TruthRow> rows;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("{}:{}: skipping unparseable truth line: {}", sourceName, lineNo,
                         e.what());
            continue;
        }
        if (!doc.is_object())
            continue;
        auto id = doc.find("place_id");
        if (id == doc.end() || !id->is_string()) {
            spdlog::warn("{}:{}: skipping truth line without place_id", sourceName, lineNo);
            continue;
        }

        TruthRow row;
        row.place_id = id->get<std::string>();
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            std::string_view key = it.key();
            if (key.substr(0, kTruthPrefix.size()) != kTruthPrefix || !it.value().is_string())
                continue;
            if (auto kind = parseAttributeKind(key.substr(kTruthPrefix.size())))
                row.values[*kind] = it.value().get<std::string>();
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<TruthRow>> readTruth(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open truth file: " + path.string()};
    }
    return readTruth(file, path.string());
}

std::optional<double> EvaluationReport::overall() const {
    double sum = 0.0;
    std::size_t counted = 0;
    for (const auto& [kind, accuracy] : attributes) {
        if (accuracy.total == 0)
            continue;
        sum += accuracy.percent();
        ++counted;
    }
    if (counted == 0)
        return std::nullopt;
    return sum / static_cast<double>(counted);
}

std::string formatReport(const EvaluationReport& report) {
    std::string out;
    for (auto kind : kAllAttributes) {
        auto it = report.attributes.find(kind);
        if (it == report.attributes.end() || it->second.total == 0) {
            out += fmt::format("{:<10} N/A (no rows)\n", attributeName(kind));
            continue;
        }
        out += fmt::format("{:<10} {:6.2f}% ({}/{})\n", attributeName(kind), it->second.percent(),
                           it->second.correct, it->second.total);
    }
    if (auto overall = report.overall())
        out += fmt::format("overall    {:6.2f}%\n", *overall);
    else
        out += "overall    N/A\n";
    return out;
}

AccuracyEvaluator::AccuracyEvaluator(std::shared_ptr<const normalize::ReferenceTables> tables,
                                     double minSimilarity)
    : normalizer_(std::move(tables)), minSimilarity_(minSimilarity) {}

std::string AccuracyEvaluator::evaluationForm(std::string_view value, AttributeKind kind) const {
    switch (kind) {
        case AttributeKind::Phone:
        case AttributeKind::Website:
            return normalizer_.normalize(value, kind);
        case AttributeKind::Name:
        case AttributeKind::Address:
        case AttributeKind::Category:
            break;
    }
    return normalize::cleanText(value);
}

bool AccuracyEvaluator::isCorrect(std::string_view truth, std::string_view prediction,
                                  AttributeKind kind) const {
    const auto t = evaluationForm(truth, kind);
    const auto p = evaluationForm(prediction, kind);
    return t == p || match::indelRatio(t, p) >= minSimilarity_;
}

EvaluationReport AccuracyEvaluator::evaluate(const std::vector<TruthRow>& truth,
                                             const std::vector<io::Prediction>& predictions) const {
    std::unordered_map<std::string, const io::Prediction*> byPlace;
    for (const auto& prediction : predictions) {
        byPlace.emplace(prediction.place_id, &prediction);
    }

    EvaluationReport report;
    report.truth_rows = truth.size();
    for (const auto& row : truth) {
        auto found = byPlace.find(row.place_id);
        if (found == byPlace.end()) {
            ++report.unmatched_truth_rows;
            continue;
        }
        for (const auto& [kind, truthValue] : row.values) {
            auto predicted = found->second->values.find(kind);
            if (predicted == found->second->values.end() || predicted->second.empty() ||
                truthValue.empty())
                continue;
            auto& accuracy = report.attributes[kind];
            ++accuracy.total;
            if (isCorrect(truthValue, predicted->second, kind))
                ++accuracy.correct;
        }
    }

    if (report.unmatched_truth_rows > 0) {
        spdlog::warn("{} of {} truth rows have no prediction", report.unmatched_truth_rows,
                     report.truth_rows);
    }
    return report;
}

} // namespace placemerge::eval
