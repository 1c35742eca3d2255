#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"

TEST_CASE("String helpers", "[util]") {
    SECTION("Trim and lower-case") {
        REQUIRE(util::trim("  Maria Chen \n") == "Maria Chen");
        REQUIRE(util::trim("   ").empty());
        REQUIRE(util::to_lower("JANE Smith") == "jane smith");
    }
    
    SECTION("Split drops empty tokens") {
        auto tokens = util::split("Bob Example, ,Test User ,", ',');
        REQUIRE(tokens.size() == 2);
        REQUIRE(tokens[0] == "Bob Example");
        REQUIRE(tokens[1] == "Test User");
    }
}

TEST_CASE("Thousands grouping", "[util]") {
    REQUIRE(util::group_thousands("1234567.50") == "1,234,567.50");
    REQUIRE(util::group_thousands("-1234") == "-1,234");
    REQUIRE(util::group_thousands("999.99") == "999.99");
    REQUIRE(util::group_thousands("100000") == "100,000");
    REQUIRE(util::group_thousands("0.00") == "0.00");
}

TEST_CASE("Number coercion", "[util]") {
    SECTION("Numeric text") {
        REQUIRE(util::parse_number(" 4.5 ") == 4.5);
        REQUIRE(util::parse_number("-12") == -12.0);
        REQUIRE_FALSE(util::parse_number("4.5abc").has_value());
        REQUIRE_FALSE(util::parse_number("").has_value());
        REQUIRE_FALSE(util::parse_number("0x10").has_value());
    }
    
    SECTION("JSON values") {
        REQUIRE(util::coerce_number(nlohmann::json(3)) == 3.0);
        REQUIRE(util::coerce_number(nlohmann::json("2.5")) == 2.5);
        REQUIRE_FALSE(util::coerce_number(nlohmann::json(true)).has_value());
        REQUIRE_FALSE(util::coerce_number(nlohmann::json()).has_value());
        REQUIRE_FALSE(util::coerce_number(nlohmann::json::array({1})).has_value());
        REQUIRE_FALSE(util::coerce_number(nlohmann::json("n/a")).has_value());
    }
    
    SECTION("Object fields") {
        nlohmann::json obj = {{"price", 10.5}, {"name", "ACME"}, {"empty", nullptr}};
        REQUIRE(util::number_field(obj, "price") == 10.5);
        REQUIRE_FALSE(util::number_field(obj, "missing").has_value());
        REQUIRE_FALSE(util::number_field(obj, "empty").has_value());
        REQUIRE(util::string_field(obj, "name") == std::optional<std::string>("ACME"));
        REQUIRE_FALSE(util::string_field(obj, "price").has_value());
        REQUIRE_FALSE(util::string_field(nlohmann::json::array(), "name").has_value());
    }
}
