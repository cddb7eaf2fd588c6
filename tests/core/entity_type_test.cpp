/**
 * @file entity_type_test.cpp
 * @brief Unit tests for entity type names
 */

#include <inkognito/core/entity_type.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

using namespace inkognito::core;

TEST_CASE("entity_type: names are unique and round-trip", "[core][entity_type]") {
    std::set<std::string> names;
    for (auto type : all_entity_types) {
        auto name = std::string{to_string(type)};
        CHECK(names.insert(name).second);
        CHECK(entity_type_from_string(name) == type);
    }
    CHECK(names.size() == 15);
    CHECK_FALSE(names.contains("UNKNOWN"));
}

TEST_CASE("entity_type: parsing", "[core][entity_type]") {
    SECTION("Names are case-insensitive") {
        CHECK(entity_type_from_string("person") == entity_type::person);
        CHECK(entity_type_from_string("Email_Address") == entity_type::email_address);
    }

    SECTION("Detector aliases map to canonical types") {
        CHECK(entity_type_from_string("US_DRIVER_LICENSE") == entity_type::driver_license);
        CHECK(entity_type_from_string("US_BANK_NUMBER") == entity_type::bank_number);
    }

    SECTION("UNKNOWN parses explicitly") {
        CHECK(entity_type_from_string("UNKNOWN") == entity_type::unknown);
    }

    SECTION("Unrecognized names are rejected") {
        CHECK_FALSE(entity_type_from_string("NRP").has_value());
        CHECK_FALSE(entity_type_from_string("").has_value());
    }
}

TEST_CASE("entity_type: classification folds unknown labels", "[core][entity_type]") {
    CHECK(classify_entity_type("LOCATION") == entity_type::location);
    CHECK(classify_entity_type("MEDICAL_RECORD") == entity_type::unknown);
    CHECK(to_string(entity_type::unknown) == "UNKNOWN");
}
