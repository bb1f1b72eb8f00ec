//
// Created by fieldrel on 10/17/26.
//

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "analysis/CooccurrenceAggregator.hpp"

#include "fieldrel_test_helpers.hpp"

using namespace fieldrel;
using fieldrel::test_helpers::makeField;
using fieldrel::test_helpers::makeFieldWithValues;
using fieldrel::test_helpers::sequence;

namespace {
    const PairMatch *findPair(const std::vector<PairMatch> &pairs, const std::string &first, const std::string &second) {
        for (const auto &pair: pairs) {
            if (pair.first->ref().toString() == first && pair.second->ref().toString() == second) {
                return &pair;
            }
        }
        return nullptr;
    }
}

TEST_CASE("aggregator counts exact intersections", "[aggregator]") {
    CandidateFieldList fields {
        makeField("item", "name", { "Sword of Fire", "sword of fire", "Shield", "" }),
        makeField("drop", "item_name", { "Sword of Fire", "Shield", "Potion" }),
    };

    auto pairs = CooccurrenceAggregator().aggregate(fields);

    REQUIRE(pairs.size() == 1);
    REQUIRE(pairs[0].first->ref().toString() == "drop::item_name");
    REQUIRE(pairs[0].second->ref().toString() == "item::name");
    REQUIRE(pairs[0].matchCount == 2);
    REQUIRE(pairs[0].samples == std::vector<std::string> { "shield", "sword of fire" });
}

TEST_CASE("aggregator omits pairs without shared values", "[aggregator]") {
    CandidateFieldList fields {
        makeField("item", "name", { "Sword", "Shield" }),
        makeField("monster", "name", { "Slime", "Goblin" }),
    };

    REQUIRE(CooccurrenceAggregator().aggregate(fields).empty());
}

TEST_CASE("aggregator never pairs fields of the same source", "[aggregator]") {
    CandidateFieldList fields {
        makeField("item", "name", { "Sword", "Shield" }),
        makeField("item", "display_name", { "Sword", "Shield" }),
        makeField("shop", "item_name", { "Sword" }),
    };

    auto pairs = CooccurrenceAggregator().aggregate(fields);

    REQUIRE(pairs.size() == 2);
    REQUIRE(findPair(pairs, "item::display_name", "item::name") == nullptr);
    REQUIRE(findPair(pairs, "item::display_name", "shop::item_name") != nullptr);
    REQUIRE(findPair(pairs, "item::name", "shop::item_name") != nullptr);

    for (const auto &pair: pairs) {
        REQUIRE_FALSE(pair.first->sameSource(*pair.second));
    }
}

TEST_CASE("aggregator keeps the smallest shared values as samples", "[aggregator]") {
    auto shared = sequence("v", 10, 30);

    CandidateFieldList fields {
        makeFieldWithValues("a", "name", shared),
        makeFieldWithValues("b", "name", shared),
    };

    auto pairs = CooccurrenceAggregator(CooccurrenceAggregator::Options { 3, 1 }).aggregate(fields);

    REQUIRE(pairs.size() == 1);
    REQUIRE(pairs[0].matchCount == 20);
    REQUIRE(pairs[0].samples == std::vector<std::string> { "v10", "v11", "v12" });
}

TEST_CASE("aggregator counts every pair of a shared bucket", "[aggregator]") {
    CandidateFieldList fields {
        makeField("a", "name", { "x", "y" }),
        makeField("b", "name", { "x", "y" }),
        makeField("c", "name", { "x" }),
        makeField("d", "name", { "z" }),
    };

    auto pairs = CooccurrenceAggregator().aggregate(fields);

    REQUIRE(pairs.size() == 3);
    REQUIRE(findPair(pairs, "a::name", "b::name")->matchCount == 2);
    REQUIRE(findPair(pairs, "a::name", "c::name")->matchCount == 1);
    REQUIRE(findPair(pairs, "b::name", "c::name")->matchCount == 1);
}

TEST_CASE("sharded aggregation equals inline aggregation", "[aggregator]") {
    CandidateFieldList fields;
    for (int i = 0; i < 8; i++) {
        fields.push_back(makeFieldWithValues(
            "source" + std::to_string(i), "name",
            sequence("value-", i * 10, i * 10 + 40)
        ));
    }

    auto inlinePairs = CooccurrenceAggregator(CooccurrenceAggregator::Options { 4, 1 }).aggregate(fields);
    auto shardedPairs = CooccurrenceAggregator(CooccurrenceAggregator::Options { 4, 4 }).aggregate(fields);

    REQUIRE_FALSE(inlinePairs.empty());
    REQUIRE(inlinePairs.size() == shardedPairs.size());

    for (size_t i = 0; i < inlinePairs.size(); i++) {
        REQUIRE(inlinePairs[i].first->ref() == shardedPairs[i].first->ref());
        REQUIRE(inlinePairs[i].second->ref() == shardedPairs[i].second->ref());
        REQUIRE(inlinePairs[i].matchCount == shardedPairs[i].matchCount);
        REQUIRE(inlinePairs[i].samples == shardedPairs[i].samples);
    }
}
