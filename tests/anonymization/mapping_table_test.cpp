/**
 * @file mapping_table_test.cpp
 * @brief Unit tests for the session mapping table
 */

#include <inkognito/anonymization/mapping_table.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace inkognito;
using namespace inkognito::anonymization;

TEST_CASE("mapping_table: basic operations", "[anonymization][mapping_table]") {
    mapping_table table;
    CHECK(table.empty());

    SECTION("Add and look up") {
        REQUIRE(table.add_mapping("John Smith", "Alice Parker").is_ok());
        CHECK(table.size() == 1);
        CHECK(table.contains("John Smith"));
        CHECK(table.contains_synthetic("Alice Parker"));
        CHECK(table.get_synthetic("John Smith") == "Alice Parker");
        CHECK_FALSE(table.get_synthetic("Jane Doe").has_value());
    }

    SECTION("Re-adding the same pair is a no-op") {
        REQUIRE(table.add_mapping("a@x.com", "b@y.com").is_ok());
        REQUIRE(table.add_mapping("a@x.com", "b@y.com").is_ok());
        CHECK(table.size() == 1);
    }

    SECTION("An original never maps to two synthetic values") {
        REQUIRE(table.add_mapping("a@x.com", "b@y.com").is_ok());
        auto conflict = table.add_mapping("a@x.com", "c@z.com");
        REQUIRE(conflict.is_err());
        CHECK(conflict.error().code == error_codes::invalid_argument);
        CHECK(table.get_synthetic("a@x.com") == "b@y.com");
    }

    SECTION("Empty original is rejected") {
        CHECK(table.add_mapping("", "value").is_err());
        CHECK(table.empty());
    }

    SECTION("Entries keep insertion order") {
        REQUIRE(table.add_mapping("zeta", "1").is_ok());
        REQUIRE(table.add_mapping("alpha", "2").is_ok());
        REQUIRE(table.entries().size() == 2);
        CHECK(table.entries()[0].first == "zeta");
        CHECK(table.entries()[1].first == "alpha");
    }

    SECTION("Clear") {
        REQUIRE(table.add_mapping("x", "y").is_ok());
        table.clear();
        CHECK(table.empty());
        CHECK_FALSE(table.contains_synthetic("y"));
    }
}

TEST_CASE("mapping_table: merge keeps existing pairs", "[anonymization][mapping_table]") {
    mapping_table base;
    REQUIRE(base.add_mapping("John", "Alice").is_ok());

    mapping_table other;
    REQUIRE(other.add_mapping("John", "Bob").is_ok());
    REQUIRE(other.add_mapping("Acme", "Globex").is_ok());

    CHECK(base.merge(other) == 1);
    CHECK(base.size() == 2);
    CHECK(base.get_synthetic("John") == "Alice");
    CHECK(base.get_synthetic("Acme") == "Globex");
    CHECK_FALSE(base.contains_synthetic("Bob"));
}

TEST_CASE("mapping_table: equality follows entries", "[anonymization][mapping_table]") {
    mapping_table a;
    mapping_table b;
    REQUIRE(a.add_mapping("x", "1").is_ok());
    REQUIRE(b.add_mapping("x", "1").is_ok());
    CHECK(a == b);

    REQUIRE(b.add_mapping("y", "2").is_ok());
    CHECK_FALSE(a == b);
}
