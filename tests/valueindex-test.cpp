//
// Created by fieldrel on 10/17/26.
//

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "analysis/ValueIndex.hpp"

#include "fieldrel_test_helpers.hpp"

using namespace fieldrel;
using fieldrel::test_helpers::rawValues;

TEST_CASE("ValueIndex merges values differing only by case and surrounding whitespace", "[value-index]") {
    ValueIndexBuilder builder;
    builder.addAll(rawValues({ "Sword of Fire", "sword of fire", "  SWORD OF FIRE ", "Shield" }));

    auto index = std::move(builder).build();

    REQUIRE(index.distinctCount() == 2);
    REQUIRE(index.totalCount() == 4);
    REQUIRE(index.contains("sword of fire"));
    REQUIRE(index.contains("shield"));
    REQUIRE(index.count("sword of fire") == 3);
    REQUIRE(index.count("shield") == 1);
    REQUIRE(index.count("potion") == 0);
}

TEST_CASE("ValueIndex discards null and blank values", "[value-index]") {
    ValueIndexBuilder builder;
    builder.addAll(rawValues({ nullptr, "", "   ", "\t", "Potion" }));

    REQUIRE(builder.blankCount() == 4);

    auto index = std::move(builder).build();
    REQUIRE(index.distinctCount() == 1);
    REQUIRE(index.totalCount() == 1);
    REQUIRE_FALSE(index.contains(""));
}

TEST_CASE("ValueIndex of only blank values is empty", "[value-index]") {
    ValueIndexBuilder builder;
    builder.addAll(rawValues({ nullptr, "", "  " }));

    auto index = std::move(builder).build();
    REQUIRE(index.empty());
    REQUIRE(index.distinctCount() == 0);
}

TEST_CASE("ValueIndex ignores values longer than maxValueLength", "[value-index]") {
    ValueIndexBuilder builder(ValueIndexBuilder::Limits { 5, 100 });
    builder.add(std::string("short"));
    builder.add(std::string("much too long"));
    builder.add(std::string("  abc  "));

    REQUIRE(builder.ignoredCount() == 1);
    REQUIRE_FALSE(builder.isOverflow());

    auto index = std::move(builder).build();
    REQUIRE(index.distinctCount() == 2);
    REQUIRE(index.contains("short"));
    REQUIRE(index.contains("abc"));
}

TEST_CASE("ValueIndex overflows past maxDistinctValues", "[value-index]") {
    ValueIndexBuilder builder(ValueIndexBuilder::Limits { 256, 3 });
    builder.addAll(rawValues({ "a", "b", "c", "a", "b" }));
    REQUIRE_FALSE(builder.isOverflow());

    builder.add(std::string("d"));
    REQUIRE(builder.isOverflow());
}

TEST_CASE("ValueIndex limit of zero disables the distinct cap", "[value-index]") {
    ValueIndexBuilder builder(ValueIndexBuilder::Limits { 0, 0 });
    for (int i = 0; i < 1000; i++) {
        builder.add("value-" + std::to_string(i));
    }

    REQUIRE_FALSE(builder.isOverflow());
    REQUIRE(std::move(builder).build().distinctCount() == 1000);
}
