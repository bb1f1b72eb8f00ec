//
// Created by fieldrel on 10/17/26.
//

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "analysis/FieldNameFilter.hpp"
#include "utils/StringUtil.hpp"

using namespace fieldrel;

TEST_CASE("normalizeValue trims and lower-cases", "[string-util]") {
    REQUIRE(utility::normalizeValue("  Sword of Fire \t") == "sword of fire");
    REQUIRE(utility::normalizeValue("SHIELD") == "shield");
    REQUIRE(utility::normalizeValue("   ").empty());
    REQUIRE(utility::normalizeValue("").empty());
}

TEST_CASE("normalizeValue keeps inner whitespace", "[string-util]") {
    REQUIRE(utility::normalizeValue("Sword  of Fire") == "sword  of fire");
}

TEST_CASE("tokenizeIdentifier splits on separators and camel case", "[string-util]") {
    REQUIRE(utility::tokenizeIdentifier("item_name") == std::vector<std::string> { "item", "name" });
    REQUIRE(utility::tokenizeIdentifier("itemName") == std::vector<std::string> { "item", "name" });
    REQUIRE(utility::tokenizeIdentifier("ItemName") == std::vector<std::string> { "item", "name" });
    REQUIRE(utility::tokenizeIdentifier("XMLName") == std::vector<std::string> { "xml", "name" });
    REQUIRE(utility::tokenizeIdentifier("reward-item.name") == std::vector<std::string> { "reward", "item", "name" });
    REQUIRE(utility::tokenizeIdentifier("name") == std::vector<std::string> { "name" });
}

TEST_CASE("tokenizeIdentifier drops empty tokens", "[string-util]") {
    REQUIRE(utility::tokenizeIdentifier("__item__name__") == std::vector<std::string> { "item", "name" });
    REQUIRE(utility::tokenizeIdentifier("___").empty());
    REQUIRE(utility::tokenizeIdentifier("").empty());
}

TEST_CASE("globMatch supports wildcards and ignores case", "[string-util]") {
    REQUIRE(utility::globMatch("name", "name"));
    REQUIRE(utility::globMatch("name", "NAME"));
    REQUIRE_FALSE(utility::globMatch("name", "item_name"));

    REQUIRE(utility::globMatch("*_name", "item_name"));
    REQUIRE(utility::globMatch("*_name", "Reward_Item_Name"));
    REQUIRE_FALSE(utility::globMatch("*_name", "name"));
    REQUIRE_FALSE(utility::globMatch("*_name", "item_names"));

    REQUIRE(utility::globMatch("item_?d", "item_id"));
    REQUIRE_FALSE(utility::globMatch("item_?d", "item_d"));

    REQUIRE(utility::globMatch("*", ""));
    REQUIRE(utility::globMatch("*name*", "displayNameText"));
}

TEST_CASE("FieldNameFilter default patterns", "[field-filter]") {
    FieldNameFilter filter;

    REQUIRE(filter("name"));
    REQUIRE(filter("Name"));
    REQUIRE(filter("item_name"));
    REQUIRE(filter("ITEM_NAME"));

    REQUIRE_FALSE(filter("id"));
    REQUIRE_FALSE(filter("itemName"));
    REQUIRE_FALSE(filter("nickname"));
    REQUIRE_FALSE(filter("name_id"));
}

TEST_CASE("FieldNameFilter custom patterns", "[field-filter]") {
    FieldNameFilter filter({ "*Name", "code" });

    REQUIRE(filter("itemName"));
    REQUIRE(filter("item_name"));
    REQUIRE(filter("CODE"));
    REQUIRE_FALSE(filter("id"));

    REQUIRE(filter.patterns().size() == 2);
}
