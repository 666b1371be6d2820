#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include <placemerge/match/record_matcher.h>

#include "common/place_fixtures.h"

using namespace placemerge;
using namespace placemerge::match;
using placemerge::test::recordA;
using placemerge::test::recordB;

namespace {

using PairKey = std::tuple<std::string, std::string, MatchKind>;

std::vector<PairKey> keysOf(const MatchResult& result) {
    std::vector<PairKey> keys;
    for (const auto& pair : result.pairs) {
        keys.emplace_back(pair.recordA.record_id, pair.recordB.record_id, pair.match_kind);
    }
    return keys;
}

MatchResult runMatcher(const std::vector<PlaceRecord>& a, const std::vector<PlaceRecord>& b,
                       MatcherConfig config = {}) {
    RecordMatcher matcher(config);
    auto result = matcher.match(a, b);
    REQUIRE(result);
    return std::move(result).value();
}

} // namespace

TEST_CASE("RecordMatcher: corpus pairing", "[match][matcher][catch2]") {
    const auto result = runMatcher(test::corpusA(), test::corpusB());

    const std::vector<PairKey> expected = {
        {"a1", "b1", MatchKind::Fuzzy}, {"a2", "b2", MatchKind::Exact},
        {"a3", "b3", MatchKind::Exact}, {"a4", "b4", MatchKind::Fuzzy},
        {"a5", "b5", MatchKind::Fuzzy}, {"a7", "b7", MatchKind::Exact},
        {"a8", "b8", MatchKind::Exact},
    };
    CHECK(keysOf(result) == expected);
    CHECK(result.stats.exact_pairs == 4);
    CHECK(result.stats.fuzzy_pairs == 3);
    CHECK(result.excluded.empty());

    REQUIRE(result.unmatched.size() == 2);
    CHECK(result.unmatched[0].record_id == "a6");
    CHECK(result.unmatched[0].provider == Provider::ProviderA);
    CHECK(result.unmatched[1].record_id == "b9");
    CHECK(result.unmatched[1].provider == Provider::ProviderB);
}

TEST_CASE("RecordMatcher: pair invariants", "[match][matcher][property][catch2]") {
    MatcherConfig config;
    config.blocking = BlockingStrategy::None;
    const auto result = runMatcher(test::corpusA(), test::corpusB(), config);

    SECTION("Every record appears in at most one pair") {
        std::set<std::string> seenA;
        std::set<std::string> seenB;
        for (const auto& pair : result.pairs) {
            CHECK(seenA.insert(pair.recordA.record_id).second);
            CHECK(seenB.insert(pair.recordB.record_id).second);
        }
    }

    SECTION("Exact pairs agree on normalized name and address") {
        for (const auto& pair : result.pairs) {
            if (pair.match_kind != MatchKind::Exact)
                continue;
            CHECK(pair.recordA.normalized(AttributeKind::Name) ==
                  pair.recordB.normalized(AttributeKind::Name));
            CHECK(pair.recordA.normalized(AttributeKind::Address) ==
                  pair.recordB.normalized(AttributeKind::Address));
        }
    }

    SECTION("Fuzzy pairs meet the threshold on both attributes") {
        for (const auto& pair : result.pairs) {
            if (pair.match_kind != MatchKind::Fuzzy)
                continue;
            CHECK(pair.name_similarity >= config.similarity_threshold);
            CHECK(pair.address_similarity >= config.similarity_threshold);
        }
    }

    SECTION("Pairs are ordered by record ids") {
        CHECK(std::is_sorted(result.pairs.begin(), result.pairs.end(),
                             [](const MatchedPair& x, const MatchedPair& y) {
                                 return std::tie(x.recordA.record_id, x.recordB.record_id) <
                                        std::tie(y.recordA.record_id, y.recordB.record_id);
                             }));
    }
}

TEST_CASE("RecordMatcher: input order does not change the result",
          "[match][matcher][determinism][catch2]") {
    const auto baseline = keysOf(runMatcher(test::corpusA(), test::corpusB()));

    std::mt19937 rng(20240917);
    for (int round = 0; round < 5; ++round) {
        auto a = test::corpusA();
        auto b = test::corpusB();
        std::shuffle(a.begin(), a.end(), rng);
        std::shuffle(b.begin(), b.end(), rng);
        CHECK(keysOf(runMatcher(a, b)) == baseline);
    }
}

TEST_CASE("RecordMatcher: blocking and parallel scoring", "[match][matcher][blocking][catch2]") {
    MatcherConfig unblocked;
    unblocked.blocking = BlockingStrategy::None;
    unblocked.workers = 1;
    const auto reference = runMatcher(test::corpusA(), test::corpusB(), unblocked);

    SECTION("Postal code blocking finds the same pairs with fewer comparisons") {
        MatcherConfig blocked;
        blocked.blocking = BlockingStrategy::PostalCode;
        blocked.workers = 1;
        const auto result = runMatcher(test::corpusA(), test::corpusB(), blocked);
        CHECK(keysOf(result) == keysOf(reference));
        CHECK(result.stats.comparisons < reference.stats.comparisons);
        CHECK(result.stats.buckets == 3);
    }

    SECTION("A mistyped postal code is only recovered without blocking") {
        std::vector<PlaceRecord> a = {recordA(
            "p1", {{"name", "Harbor Books"}, {"address", "5 Pier Rd, Seattle, WA 98101"}})};
        std::vector<PlaceRecord> b = {recordB(
            "p2", {{"name", "Harbor Books"}, {"address", "5 Pier Rd, Seattle, WA 98110"}})};

        MatcherConfig blocked;
        blocked.blocking = BlockingStrategy::PostalCode;
        CHECK(runMatcher(a, b, blocked).pairs.empty());

        MatcherConfig full;
        full.blocking = BlockingStrategy::None;
        const auto result = runMatcher(a, b, full);
        REQUIRE(result.pairs.size() == 1);
        CHECK(result.pairs[0].match_kind == MatchKind::Fuzzy);
    }

    SECTION("Records without a blocking key are compared against every bucket") {
        std::vector<PlaceRecord> a = {
            recordA("k1", {{"name", "Keyless Kitchen"}, {"address", "Main St, Smalltown"}})};
        std::vector<PlaceRecord> b = {
            recordB("k2", {{"name", "Keyless Kitchen LLC"},
                           {"address", "Main Street, Smalltown 12345"}}),
            recordB("k3", {{"name", "Other Place"}, {"address", "9 Side Rd 54321"}})};
        MatcherConfig blocked;
        blocked.workers = 1;
        const auto result = runMatcher(a, b, blocked);
        REQUIRE(result.pairs.size() == 1);
        CHECK(result.pairs[0].recordB.record_id == "k2");
    }

    SECTION("Thread pool scoring matches serial scoring") {
        MatcherConfig parallel;
        parallel.blocking = BlockingStrategy::None;
        parallel.workers = 4;
        CHECK(keysOf(runMatcher(test::corpusA(), test::corpusB(), parallel)) ==
              keysOf(reference));

        parallel.blocking = BlockingStrategy::PostalCode;
        CHECK(keysOf(runMatcher(test::corpusA(), test::corpusB(), parallel)) ==
              keysOf(reference));
    }

    SECTION("Progress callback reports every bucket") {
        MatcherConfig config;
        config.workers = 1;
        config.progress_interval = 1;
        RecordMatcher matcher(config);
        std::vector<std::pair<std::size_t, std::size_t>> calls;
        matcher.setProgressCallback(
            [&](std::size_t done, std::size_t total) { calls.emplace_back(done, total); });
        auto result = matcher.match(test::corpusA(), test::corpusB());
        REQUIRE(result);
        REQUIRE(calls.size() == result.value().stats.buckets);
        CHECK(calls.back().first == calls.back().second);
    }
}

TEST_CASE("RecordMatcher: exclusions", "[match][matcher][audit][catch2]") {
    std::vector<PlaceRecord> a = {
        recordA("dup", {{"name", "First Copy"}, {"address", "1 A St 11111"}}),
        recordA("dup", {{"name", "Second Copy"}, {"address", "2 B St 22222"}}),
        recordA("noname", {{"address", "3 C St 33333"}}),
        recordA("nothing", {{"phone", "555-1234"}}),
        recordB("wrong-side", {{"name", "Misfiled"}, {"address", "4 D St 44444"}}),
    };
    std::vector<PlaceRecord> b = {
        recordB("noaddr", {{"name", "Just A Name"}}),
        recordB("ok", {{"name", "First Copy"}, {"address", "1 A St 11111"}}),
    };

    const auto result = runMatcher(a, b);
    CHECK(result.pairs.empty());

    auto reasonFor = [&](const std::string& id) {
        std::vector<ExclusionReason> reasons;
        for (const auto& e : result.excluded) {
            if (e.record_id == id)
                reasons.push_back(e.reason);
        }
        return reasons;
    };
    CHECK(reasonFor("dup") ==
          std::vector<ExclusionReason>{ExclusionReason::DuplicateRecordId,
                                       ExclusionReason::DuplicateRecordId});
    CHECK(reasonFor("noname") == std::vector<ExclusionReason>{ExclusionReason::MissingName});
    CHECK(reasonFor("nothing") ==
          std::vector<ExclusionReason>{ExclusionReason::MissingNameAndAddress});
    CHECK(reasonFor("wrong-side") ==
          std::vector<ExclusionReason>{ExclusionReason::ProviderMismatch});
    CHECK(reasonFor("noaddr") == std::vector<ExclusionReason>{ExclusionReason::MissingAddress});

    REQUIRE(result.unmatched.size() == 1);
    CHECK(result.unmatched[0].record_id == "ok");
}

TEST_CASE("RecordMatcher: misfiled records do not shadow valid ids",
          "[match][matcher][audit][catch2]") {
    std::vector<PlaceRecord> a = {
        recordA("shared", {{"name", "Lantern Tea House"}, {"address", "8 Elm St Salem OR 97301"}}),
        recordB("shared", {{"name", "Misfiled Copy"}, {"address", "9 Oak St Salem OR 97301"}}),
    };
    std::vector<PlaceRecord> b = {
        recordB("t1", {{"name", "Lantern Tea House"}, {"address", "8 Elm St Salem OR 97301"}})};

    const auto result = runMatcher(a, b);
    REQUIRE(result.excluded.size() == 1);
    CHECK(result.excluded[0].record_id == "shared");
    CHECK(result.excluded[0].reason == ExclusionReason::ProviderMismatch);

    REQUIRE(result.pairs.size() == 1);
    CHECK(result.pairs[0].recordA.record_id == "shared");
    CHECK(result.pairs[0].recordA.provider == Provider::ProviderA);
    CHECK(result.pairs[0].recordB.record_id == "t1");
    CHECK(result.unmatched.empty());
}

TEST_CASE("RecordMatcher: greedy one-to-one assignment", "[match][matcher][greedy][catch2]") {
    SECTION("Ties resolve toward the smaller B id") {
        std::vector<PlaceRecord> a = {
            recordA("x1", {{"name", "Corner Cafe"}, {"address", "10 High St Lakeview OH 43331"}})};
        std::vector<PlaceRecord> b = {
            recordB("y2", {{"name", "The Corner Cafe"},
                           {"address", "10 High St Lakeview OH 43331"}}),
            recordB("y1", {{"name", "Corner Cafe East"},
                           {"address", "10 High St Lakeview OH 43331"}})};
        const auto result = runMatcher(a, b);
        REQUIRE(result.pairs.size() == 1);
        CHECK(result.pairs[0].recordB.record_id == "y1");
        CHECK(result.pairs[0].match_kind == MatchKind::Fuzzy);
        CHECK(result.stats.rejected_ambiguous == 1);
    }

    SECTION("Ambiguous exact groups fall through to fuzzy assignment") {
        std::vector<PlaceRecord> a = {
            recordA("d2", {{"name", "Twin Deli"}, {"address", "3 Fork Rd Ames IA 50010"}}),
            recordA("d1", {{"name", "Twin Deli"}, {"address", "3 Fork Rd Ames IA 50010"}})};
        std::vector<PlaceRecord> b = {
            recordB("e1", {{"name", "Twin Deli"}, {"address", "3 Fork Rd Ames IA 50010"}})};
        const auto result = runMatcher(a, b);
        CHECK(result.stats.exact_pairs == 0);
        REQUIRE(result.pairs.size() == 1);
        CHECK(result.pairs[0].recordA.record_id == "d1");
        CHECK(result.pairs[0].match_kind == MatchKind::Fuzzy);
    }

    SECTION("Higher total similarity wins over id order") {
        std::vector<FuzzyCandidate> candidates = {{0, 0, 90.0, 90.0}, {0, 1, 95.0, 99.0}};
        std::size_t rejected = 0;
        auto accepted = RecordMatcher::assignGreedy(candidates, {"a"}, {"b1", "b2"}, &rejected);
        REQUIRE(accepted.size() == 1);
        CHECK(accepted[0].indexB == 1);
        CHECK(rejected == 1);
    }
}

TEST_CASE("RecordMatcher: threshold and configuration", "[match][matcher][config][catch2]") {
    std::vector<PlaceRecord> a = {
        recordA("h1", {{"name", "Harbor Books"}, {"address", "5 Pier Rd, Seattle, WA 98101"}})};
    std::vector<PlaceRecord> b = {
        recordB("h2", {{"name", "Harbour Books"}, {"address", "5 Pier Rd, Seattle, WA 98101"}})};

    SECTION("Pairs below the threshold stay unmatched") {
        MatcherConfig strict;
        strict.similarity_threshold = 97.0;
        const auto result = runMatcher(a, b, strict);
        CHECK(result.pairs.empty());
        CHECK(result.unmatched.size() == 2);
    }

    SECTION("Threshold outside 0..100 is rejected") {
        MatcherConfig bad;
        bad.similarity_threshold = 101.0;
        RecordMatcher matcher(bad);
        auto result = matcher.match(a, b);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Empty inputs produce an empty result") {
        const auto result = runMatcher({}, b);
        CHECK(result.pairs.empty());
        CHECK(result.unmatched.size() == 1);
    }
}

TEST_CASE("RecordMatcher: blocking keys", "[match][matcher][blocking][catch2]") {
    auto record = recordA("r", {{"name", "Blue Bottle Coffee"},
                                {"address", "Suite 12345, 66 Mint St, San Francisco, CA 94103-1234"}});
    CHECK(RecordMatcher::blockingKey(record, BlockingStrategy::PostalCode) == "94103");
    CHECK(RecordMatcher::blockingKey(record, BlockingStrategy::NameToken) == "blue");
    CHECK(RecordMatcher::blockingKey(record, BlockingStrategy::None) == "*");

    auto noPostal = recordA("s", {{"name", "X"}, {"address", "Main St"}});
    CHECK(RecordMatcher::blockingKey(noPostal, BlockingStrategy::PostalCode).empty());

    CHECK(parseBlockingStrategy("name_token") == BlockingStrategy::NameToken);
    CHECK_FALSE(parseBlockingStrategy("zip"));
}
