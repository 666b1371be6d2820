#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <placemerge/core/place.h>
#include <placemerge/core/types.h>
#include <placemerge/io/result_json.h>
#include <placemerge/normalize/text_normalizer.h>

namespace placemerge::eval {

// Hand-labelled values for one place; keys come from "truth_<attribute>" fields.
struct TruthRow {
    std::string place_id;
    std::map<AttributeKind, std::string> values;
};

Result<std::vector<TruthRow>> readTruth(const std::filesystem::path& path);
std::vector<TruthRow> readTruth(std::istream& in, std::string_view sourceName = "<stream>");

struct AttributeAccuracy {
    std::size_t correct = 0;
    std::size_t total = 0; // rows where both truth and prediction are non-empty

    double percent() const {
        return total == 0 ? 0.0 : 100.0 * static_cast<double>(correct) / total;
    }
};

struct EvaluationReport {
    std::map<AttributeKind, AttributeAccuracy> attributes;
    std::size_t truth_rows = 0;
    std::size_t unmatched_truth_rows = 0; // place_id absent from the predictions

    // Mean of per-attribute percentages over attributes with at least one row.
    std::optional<double> overall() const;
};

std::string formatReport(const EvaluationReport& report);

/**
 * @brief Scores predicted attribute values against truth labels.
 *
 * Both sides are reduced to an evaluation form first: digits for phones, host for
 * websites, cleaned text otherwise. A prediction counts as correct when the forms are equal
 * or their indelRatio reaches `minSimilarity`.
 */
class AccuracyEvaluator {
public:
    explicit AccuracyEvaluator(std::shared_ptr<const normalize::ReferenceTables> tables = nullptr,
                               double minSimilarity = 90.0);

    std::string evaluationForm(std::string_view value, AttributeKind kind) const;
    bool isCorrect(std::string_view truth, std::string_view prediction, AttributeKind kind) const;

    EvaluationReport evaluate(const std::vector<TruthRow>& truth,
                              const std::vector<io::Prediction>& predictions) const;

private:
    normalize::TextNormalizer normalizer_;
    double minSimilarity_;
};

} // namespace placemerge::eval
