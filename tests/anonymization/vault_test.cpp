/**
 * @file vault_test.cpp
 * @brief Unit tests for vault serialization and persistence
 */

#include <inkognito/anonymization/vault.hpp>

#include "support/scripted_detector.hpp"
#include "support/temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace inkognito;
using namespace inkognito::anonymization;
using core::entity_type;

namespace {

auto sample_table() -> mapping_table {
    mapping_table table;
    REQUIRE(table.add_mapping("John Smith", "Alice Parker").is_ok());
    REQUIRE(table.add_mapping("john@x.com", "alice.parker7@example.com").is_ok());
    return table;
}

}  // namespace

TEST_CASE("vault: serialization layout", "[anonymization][vault]") {
    auto doc = serialize_vault(sample_table(), -42, 2,
                               {{entity_type::person, 3}, {entity_type::email_address, 1}});

    CHECK(doc["version"] == "2.0");
    CHECK(doc["date_offset"] == -42);
    CHECK(doc["file_count"] == 2);
    CHECK(doc["created_at"].get<std::string>().size() == 20);

    REQUIRE(doc["mappings"].size() == 2);
    CHECK(doc["mappings"][0][0] == "Alice Parker");
    CHECK(doc["mappings"][0][1] == "John Smith");

    CHECK(doc["statistics"]["PERSON"] == 3);
    CHECK(doc["statistics"]["EMAIL_ADDRESS"] == 1);

    auto keys = std::vector<std::string>{};
    for (const auto& [key, value] : doc.items()) {
        keys.push_back(key);
    }
    CHECK(keys == std::vector<std::string>{"version", "created_at", "date_offset", "mappings",
                                           "statistics", "file_count"});
}

TEST_CASE("vault: deserialize round trip", "[anonymization][vault]") {
    auto table = sample_table();
    auto contents = deserialize_vault(serialize_vault(table, 17, 1));

    REQUIRE(contents.date_offset.has_value());
    CHECK(*contents.date_offset == 17);
    CHECK(contents.mappings == table);
}

TEST_CASE("vault: deserialize tolerates bad input", "[anonymization][vault]") {
    auto logger = std::make_shared<test::capture_logger>();

    SECTION("Empty text") {
        auto contents = deserialize_vault_text("", logger);
        CHECK_FALSE(contents.date_offset.has_value());
        CHECK(contents.mappings.empty());
        CHECK(logger->count(integration::log_level::warn) == 1);
    }

    SECTION("Malformed JSON") {
        auto contents = deserialize_vault_text("{not json", logger);
        CHECK(contents == vault_contents{});
        CHECK(logger->count(integration::log_level::warn) == 1);
    }

    SECTION("Missing version") {
        vault_document doc = {{"date_offset", 3}, {"mappings", vault_document::array()}};
        auto contents = deserialize_vault(doc, logger);
        CHECK(contents == vault_contents{});
        CHECK(logger->contains("version"));
    }

    SECTION("Unsupported version") {
        auto doc = serialize_vault(sample_table(), 0, 1);
        doc["version"] = "1.0";
        CHECK(deserialize_vault(doc, logger) == vault_contents{});
        CHECK(logger->contains("1.0"));
    }

    SECTION("Empty object") {
        CHECK(deserialize_vault(vault_document::object(), logger) == vault_contents{});
    }
}

TEST_CASE("vault: strict parsing", "[anonymization][vault]") {
    auto doc = serialize_vault(sample_table(), 5, 1);

    SECTION("Valid document parses") {
        auto record = parse_vault_record(doc);
        REQUIRE(record.is_ok());
        CHECK(record.value().mappings.size() == 2);
        CHECK(record.value().file_count == 1);
    }

    SECTION("Mapping entries must be string pairs") {
        doc["mappings"].push_back(vault_document::array({"only-one"}));
        auto record = parse_vault_record(doc);
        REQUIRE(record.is_err());
        CHECK(record.error().code == error_codes::vault_format_error);
    }

    SECTION("Conflicting originals are rejected") {
        doc["mappings"].push_back(vault_document::array({"Other Name", "John Smith"}));
        CHECK(parse_vault_record(doc).is_err());
    }

    SECTION("Date offset must be an integer") {
        doc["date_offset"] = "five";
        CHECK(parse_vault_record(doc).is_err());
    }

    SECTION("Unknown statistic types are rejected") {
        doc["statistics"]["NOT_A_TYPE"] = 1;
        CHECK(parse_vault_record(doc).is_err());
    }
}

TEST_CASE("vault: save and load", "[anonymization][vault]") {
    test::temp_directory dir;
    auto path = dir.path() / "nested" / "vault.json";

    auto record = make_vault_record(sample_table(), -12, 2, {{entity_type::person, 4}},
                                    "2024-01-02T03:04:05Z");
    REQUIRE(save_vault(path, record).is_ok());

    SECTION("Round trip preserves the record") {
        auto loaded = load_vault(path);
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().created_at == "2024-01-02T03:04:05Z");
        CHECK(loaded.value().date_offset == -12);
        CHECK(loaded.value().mappings == record.mappings);
        CHECK(loaded.value().statistics.at(entity_type::person) == 4);
        CHECK(loaded.value().file_count == 2);
    }

    SECTION("Missing file is vault_not_found") {
        auto loaded = load_vault(dir.path() / "absent.json");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::vault_not_found);
    }

    SECTION("Corrupt file is vault_format_error") {
        auto corrupt = dir.write("corrupt.json", "{\"version\": ");
        auto loaded = load_vault(corrupt);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::vault_format_error);
    }

    SECTION("Well-formed vault with an unsupported version is vault_format_error") {
        auto old_version = dir.write(
            "old.json",
            R"({"version": "1.0", "date_offset": 3, "mappings": [["Alice", "John"]]})");
        auto loaded = load_vault(old_version);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::vault_format_error);
        CHECK(loaded.error().message.find("1.0") != std::string::npos);
    }

    SECTION("Well-formed vault without a version is vault_format_error") {
        auto unversioned =
            dir.write("unversioned.json", R"({"date_offset": 3, "mappings": []})");
        auto loaded = load_vault(unversioned);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::vault_format_error);
    }

    SECTION("Inaccessible path reports the cause instead of vault_not_found") {
        auto loaded = load_vault(dir.path() / (std::string(300, 'v') + ".json"));
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::vault_format_error);
        CHECK(loaded.error().message.find("could not be accessed") != std::string::npos);
    }

    SECTION("Saving into an unwritable location is persistence_failure") {
        auto blocker = dir.write("blocker", "x");
        auto saved = save_vault(blocker / "vault.json", record);
        REQUIRE(saved.is_err());
        CHECK(saved.error().code == error_codes::persistence_failure);
    }
}

TEST_CASE("vault: invert mappings", "[anonymization][vault]") {
    SECTION("Synthetic values map back to originals") {
        auto reversed = invert_mappings(sample_table());
        REQUIRE(reversed.size() == 2);
        CHECK(reversed.at("Alice Parker") == "John Smith");
    }

    SECTION("Later original wins on a shared synthetic value") {
        vault_record record;
        record.mappings = {{"Shared", "first"}, {"Shared", "second"}};
        auto reversed = invert_mappings(record);
        REQUIRE(reversed.size() == 1);
        CHECK(reversed.at("Shared") == "second");
    }
}
