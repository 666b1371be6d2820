#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <placemerge/resolve/candidate_aggregator.h>

#include "common/place_fixtures.h"

using namespace placemerge;
using namespace placemerge::resolve;
using Catch::Approx;

TEST_CASE("parseConfidence: accepted and rejected values", "[resolve][aggregator][catch2]") {
    auto ok = parseConfidence(" 0.25 ");
    REQUIRE(ok.value);
    CHECK(*ok.value == Approx(0.25));
    CHECK_FALSE(ok.malformed);

    CHECK(parseConfidence("1").value == 1.0);
    CHECK(parseConfidence("0").value == 0.0);

    auto empty = parseConfidence("");
    CHECK_FALSE(empty.value);
    CHECK_FALSE(empty.malformed);

    for (const char* bad : {"high", "1.5", "-0.1", "nan", "inf", "0.5x"}) {
        INFO(bad);
        auto parsed = parseConfidence(bad);
        CHECK_FALSE(parsed.value);
        CHECK(parsed.malformed);
    }
}

TEST_CASE("Name noise signals", "[resolve][aggregator][name][catch2]") {
    SECTION("Store ids") {
        CHECK(hasStoreNumber("Shell #6285"));
        CHECK(hasStoreNumber("Shell # 12"));
        CHECK(hasStoreNumber("Target Store 12"));
        CHECK(hasStoreNumber("Walgreens 0007"));
        CHECK_FALSE(hasStoreNumber("Pier 39 Cafe"));
        CHECK_FALSE(hasStoreNumber("7-Eleven"));
        CHECK_FALSE(hasStoreNumber("Corner Store"));
    }

    SECTION("Listing phrases and length") {
        CHECK(nameNoiseScore("Blue Door Cafe") == 0);
        CHECK(nameNoiseScore("Blue Door Cafe Reviews") == 1);
        CHECK(nameNoiseScore("Blue Door Cafe Official Site") == 3);
        CHECK(nameNoiseScore("Blue Door Cafe hours address") == 4);
        CHECK(nameNoiseScore("One Two Three Four Five Six Seven Eight") == 1);
    }
}

TEST_CASE("CandidateAggregator: derived flags", "[resolve][aggregator][flags][catch2]") {
    auto tables = normalize::ReferenceTables::build(normalize::ReferenceTables::defaultBusinessSuffixes(),
                                                    {{"Joe's Pizza", "Joe's Pizza"}});
    CandidateAggregator aggregator(tables);

    SECTION("Names") {
        auto brand = aggregator.deriveFlags("Joe's Pizza", "joe s pizza", AttributeKind::Name);
        CHECK(brand.is_canonical_brand);
        CHECK_FALSE(brand.has_business_suffix);
        CHECK(brand.token_count == 3);

        auto suffixed = aggregator.deriveFlags("Joe's Pizza LLC", "joe s pizza", AttributeKind::Name);
        CHECK_FALSE(suffixed.is_canonical_brand);
        CHECK(suffixed.has_business_suffix);
    }

    SECTION("Addresses") {
        auto full = aggregator.deriveFlags("12 Main St, Springfield, IL 62701", "",
                                           AttributeKind::Address);
        CHECK(full.component_count == 3);
        CHECK(full.has_postal_code);

        CHECK(aggregator.deriveFlags("Zip 62701-1234", "", AttributeKind::Address).has_postal_code);
        CHECK_FALSE(
            aggregator.deriveFlags("123456 Long Rd", "", AttributeKind::Address).has_postal_code);
        CHECK_FALSE(
            aggregator.deriveFlags("Unit A12345", "", AttributeKind::Address).has_postal_code);
        CHECK(aggregator.deriveFlags("Main St,, ,Town", "", AttributeKind::Address)
                  .component_count == 2);
    }

    SECTION("Phones") {
        CHECK(aggregator.deriveFlags("+1 (415) 555-0101", "4155550101", AttributeKind::Phone)
                  .digit_count == 11);
    }

    SECTION("Websites") {
        auto secure = aggregator.deriveFlags("https://joes.nyc/menu", "joes.nyc",
                                             AttributeKind::Website);
        CHECK(secure.is_valid_url);
        CHECK(secure.is_secure_url);
        CHECK_FALSE(secure.is_social_domain);

        auto social = aggregator.deriveFlags("http://www.facebook.com/joes", "facebook.com",
                                             AttributeKind::Website);
        CHECK(social.is_valid_url);
        CHECK_FALSE(social.is_secure_url);
        CHECK(social.is_social_domain);

        CHECK(aggregator.deriveFlags("m.yelp.com", "m.yelp.com", AttributeKind::Website)
                  .is_social_domain);
        CHECK_FALSE(aggregator.deriveFlags("notyelp.com", "notyelp.com", AttributeKind::Website)
                        .is_social_domain);
        CHECK_FALSE(
            aggregator.deriveFlags("joes.nyc", "joes.nyc", AttributeKind::Website).is_valid_url);
        CHECK_FALSE(
            aggregator.deriveFlags("https://", "", AttributeKind::Website).is_valid_url);
    }

    SECTION("Categories") {
        CHECK(aggregator.deriveFlags("pizza, italian; restaurant", "", AttributeKind::Category)
                  .category_count == 3);
    }
}

TEST_CASE("CandidateAggregator: candidate sets", "[resolve][aggregator][catch2]") {
    CandidateAggregator aggregator(nullptr);

    SECTION("One set per attribute with provider A first") {
        auto pair = test::makePair(
            test::recordA("a", {{"name", "Acme"}, {"address", "1 Main St"}}, "0.8"),
            test::recordB("b", {{"name", "Acme Inc"}, {"address", "1 Main St"}, {"phone", "555"}}));
        auto places = aggregator.aggregate(pair);
        CHECK(places.place_id == "a|b");
        REQUIRE(places.sets.size() == kAllAttributes.size());

        const auto* names = places.find(AttributeKind::Name);
        REQUIRE(names);
        REQUIRE(names->candidates.size() == 2);
        CHECK(names->candidates[0].source_provider == Provider::ProviderA);
        CHECK(names->candidates[0].source_confidence == 0.8);
        CHECK(names->candidates[1].raw_value == "Acme Inc");
        CHECK(names->candidates[1].value == "acme");
        CHECK_FALSE(names->candidates[1].source_confidence);

        const auto* phones = places.find(AttributeKind::Phone);
        REQUIRE(phones);
        REQUIRE(phones->candidates.size() == 1);
        CHECK(phones->candidates[0].source_provider == Provider::ProviderB);

        CHECK(places.find(AttributeKind::Website)->candidates.empty());
    }

    SECTION("Malformed confidence is absent and flagged") {
        auto pair = test::makePair(test::recordA("a", {{"name", "Acme"}}, "very high"),
                                   test::recordB("b", {{"name", "Acme"}}, "0.3"));
        auto places = aggregator.aggregate(pair);
        const auto* names = places.find(AttributeKind::Name);
        REQUIRE(names);
        CHECK_FALSE(names->candidates[0].source_confidence);
        CHECK(names->candidates[1].source_confidence == 0.3);
        CHECK(names->quality_flags == std::vector<std::string>{"confidence_malformed:provider_a"});
        CHECK(places.find(AttributeKind::Phone)->quality_flags.empty());
    }

    SECTION("Present but unusable values still become candidates") {
        auto pair = test::makePair(test::recordA("a", {{"phone", "n/a"}}),
                                   test::recordB("b", {{"phone", ""}}));
        auto places = aggregator.aggregate(pair);
        const auto* phones = places.find(AttributeKind::Phone);
        REQUIRE(phones->candidates.size() == 2);
        CHECK(phones->candidates[0].empty());
        CHECK(phones->candidates[1].empty());
    }
}
