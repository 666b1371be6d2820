#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <sstream>
#include <placemerge/eval/accuracy_evaluator.h>

#include "common/place_fixtures.h"

using namespace placemerge;
using namespace placemerge::eval;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

namespace {

std::vector<TruthRow> truthFixture() {
    std::istringstream in(R"({"place_id": "a1|b1", "truth_name": "Tony's Pizzeria", "truth_phone": "(217) 555-0100"}
{"place_id": "a2|b2", "truth_name": "Joes Pizza", "truth_website": "https://joespizzanyc.com", "truth_hours": "9-5"}
{"place_id": "zz|zz", "truth_name": "Ghost Kitchen"}
{"truth_name": "no id"}
)");
    return readTruth(in, "truth.jsonl");
}

std::vector<io::Prediction> predictionFixture() {
    io::Prediction first;
    first.place_id = "a1|b1";
    first.values[AttributeKind::Name] = "Tony's Pizzeria";
    first.values[AttributeKind::Phone] = "217-555-0100";

    io::Prediction second;
    second.place_id = "a2|b2";
    second.values[AttributeKind::Name] = "Joe's Pizza LLC";
    second.values[AttributeKind::Website] = "http://www.joespizzanyc.com/";
    return {first, second};
}

} // namespace

TEST_CASE("readTruth: truth labels", "[eval][truth][catch2]") {
    auto rows = truthFixture();
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].values.at(AttributeKind::Phone) == "(217) 555-0100");
    CHECK(rows[1].values.size() == 2);
    CHECK(rows[2].place_id == "zz|zz");

    test::TempDirectory dir;
    auto missing = readTruth(dir.root() / "nope.jsonl");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("AccuracyEvaluator: correctness rule", "[eval][accuracy][catch2]") {
    AccuracyEvaluator evaluator;

    CHECK(evaluator.isCorrect("(217) 555-0100", "+1 217 555 0100", AttributeKind::Phone));
    CHECK(evaluator.isCorrect("https://joespizzanyc.com", "joespizzanyc.com/menu",
                              AttributeKind::Website));
    CHECK(evaluator.isCorrect("Blue Bottle Coffee", "blue bottle cofee", AttributeKind::Name));
    CHECK_FALSE(evaluator.isCorrect("Joes Pizza", "Joe's Pizza LLC", AttributeKind::Name));
    CHECK(evaluator.evaluationForm("Pizza_Place", AttributeKind::Category) == "pizza place");

    AccuracyEvaluator lenient(nullptr, 75.0);
    CHECK(lenient.isCorrect("Joes Pizza", "Joe's Pizza LLC", AttributeKind::Name));
}

TEST_CASE("AccuracyEvaluator: report", "[eval][accuracy][catch2]") {
    AccuracyEvaluator evaluator;
    auto report = evaluator.evaluate(truthFixture(), predictionFixture());

    CHECK(report.truth_rows == 3);
    CHECK(report.unmatched_truth_rows == 1);

    const auto& name = report.attributes.at(AttributeKind::Name);
    CHECK(name.total == 2);
    CHECK(name.correct == 1);
    CHECK(name.percent() == Approx(50.0));
    CHECK(report.attributes.at(AttributeKind::Phone).percent() == Approx(100.0));
    CHECK(report.attributes.at(AttributeKind::Website).percent() == Approx(100.0));
    CHECK(report.attributes.count(AttributeKind::Address) == 0);

    REQUIRE(report.overall());
    CHECK(*report.overall() == Approx(250.0 / 3.0));

    const auto text = formatReport(report);
    CHECK_THAT(text, ContainsSubstring("address"));
    CHECK_THAT(text, ContainsSubstring("N/A"));
    CHECK_THAT(text, ContainsSubstring("83.33%"));
}

TEST_CASE("AccuracyEvaluator: nothing to score", "[eval][accuracy][catch2]") {
    AccuracyEvaluator evaluator;
    auto report = evaluator.evaluate({}, predictionFixture());
    CHECK_FALSE(report.overall());
    CHECK_THAT(formatReport(report), ContainsSubstring("overall    N/A"));
}
