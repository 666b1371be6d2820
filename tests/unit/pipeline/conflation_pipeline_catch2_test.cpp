#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <placemerge/pipeline/conflation_pipeline.h>

#include "common/place_fixtures.h"

using namespace placemerge;
using namespace placemerge::pipeline;

namespace {

// Drop normalized attributes so the pipeline sees records as ingested.
std::vector<PlaceRecord> asIngested(std::vector<PlaceRecord> records) {
    for (auto& record : records) {
        record.normalized_attributes.clear();
    }
    return records;
}

const MatchedPair* findPair(const match::MatchResult& result, std::string_view placeId) {
    for (const auto& pair : result.pairs) {
        if (pair.placeId() == placeId)
            return &pair;
    }
    return nullptr;
}

} // namespace

TEST_CASE("ConflationPipeline: normalize, match and resolve", "[pipeline][catch2]") {
    config::ConflationConfig config;
    config.matcher.workers = 2;
    ConflationPipeline pipeline(config);

    std::atomic<std::size_t> progressCalls{0};
    pipeline.setProgressCallback([&](std::size_t, std::size_t) { ++progressCalls; });

    auto result = pipeline.run(asIngested(test::corpusA()), asIngested(test::corpusB()));
    REQUIRE(result);
    const auto& out = result.value();

    CHECK(out.match.pairs.size() == 7);
    REQUIRE(out.resolution.places.size() == 7);
    CHECK(out.match.unmatched.size() == 2);
    CHECK(out.match.excluded.empty());

    for (size_t i = 0; i < out.match.pairs.size(); ++i) {
        const auto& place = out.resolution.places[i];
        CHECK(place.place_id == out.match.pairs[i].placeId());
        CHECK(place.attributes.size() == kAllAttributes.size());
    }

    const auto* tonys = findPair(out.match, "a1|b1");
    REQUIRE(tonys);
    CHECK(tonys->match_kind == MatchKind::Fuzzy);
    CHECK(tonys->recordA.normalized(AttributeKind::Name) == "tony s pizzeria");

    const auto* blueBottle = out.resolution.places[2].find(AttributeKind::Phone);
    REQUIRE(blueBottle);
    CHECK(blueBottle->status == ResolutionStatus::Resolved);
    CHECK(blueBottle->canonical_value == "4155550101");

    CHECK(progressCalls.load() > 0);
}

TEST_CASE("ConflationPipeline: invalid configuration", "[pipeline][catch2]") {
    config::ConflationConfig config;
    config.matcher.similarity_threshold = 150.0;
    ConflationPipeline pipeline(config);

    auto result = pipeline.run(test::corpusA(), test::corpusB());
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::InvalidArgument);

    config::ConflationConfig noPriority;
    noPriority.resolver.provider_priority.clear();
    auto second = ConflationPipeline(noPriority).run({}, {});
    REQUIRE_FALSE(second);
    CHECK(second.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ConflationPipeline: configured brand table", "[pipeline][catch2]") {
    auto aliases = normalize::ReferenceTables::defaultBrandAliases();
    aliases["Tony's Pizzeria"] = "Tonys Pizzeria";

    config::ConflationConfig config;
    config.matcher.workers = 1;
    config.tables =
        normalize::ReferenceTables::build(normalize::ReferenceTables::defaultBusinessSuffixes(),
                                          aliases);

    auto result =
        ConflationPipeline(config).run(asIngested(test::corpusA()), asIngested(test::corpusB()));
    REQUIRE(result);

    const auto* tonys = findPair(result.value().match, "a1|b1");
    REQUIRE(tonys);
    CHECK(tonys->match_kind == MatchKind::Exact);
    CHECK(tonys->recordA.normalized(AttributeKind::Name) == "tonys pizzeria");
}

TEST_CASE("ConflationPipeline: empty inputs", "[pipeline][catch2]") {
    auto result = ConflationPipeline(config::ConflationConfig{}).run({}, {});
    REQUIRE(result);
    CHECK(result.value().match.pairs.empty());
    CHECK(result.value().resolution.places.empty());
}
