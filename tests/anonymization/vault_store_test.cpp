/**
 * @file vault_store_test.cpp
 * @brief Unit tests for the vault file lifecycle
 */

#include <inkognito/anonymization/vault_store.hpp>

#include "support/temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace inkognito;
using namespace inkognito::anonymization;
using core::entity_type;

namespace {

auto make_batch(std::initializer_list<std::pair<const char*, const char*>> pairs,
                std::int64_t offset) -> batch_result {
    batch_result batch;
    batch.date_offset = offset;
    for (const auto& [original, synthetic] : pairs) {
        REQUIRE(batch.mappings.add_mapping(original, synthetic).is_ok());
    }
    file_outcome outcome;
    outcome.id = "doc.md";
    outcome.text = "anonymized";
    outcome.counts[entity_type::person] = pairs.size();
    batch.files.push_back(outcome);
    batch.statistics[entity_type::person] = pairs.size();
    return batch;
}

}  // namespace

TEST_CASE("vault_store: lifecycle of a new vault", "[anonymization][vault_store]") {
    test::temp_directory dir;
    auto path = dir.path() / "vault.json";

    auto opened = vault_store::open(path);
    REQUIRE(opened.is_ok());
    auto& store = opened.value();

    CHECK(store.state() == vault_state::absent);
    CHECK_FALSE(store.seed().has_value());

    auto batch = make_batch({{"John", "Alice"}}, 21);
    store.update(batch);
    CHECK(store.state() == vault_state::dirty);
    CHECK(store.record().date_offset == 21);
    CHECK(batch.date_offset == 21);
    CHECK_FALSE(store.record().created_at.empty());
    CHECK(store.record().file_count == 1);

    REQUIRE(store.persist().is_ok());
    CHECK(store.state() == vault_state::persisted);
    CHECK(std::filesystem::exists(path));
    CHECK(to_string(store.state()) == "persisted");
}

TEST_CASE("vault_store: extending an existing vault", "[anonymization][vault_store]") {
    test::temp_directory dir;
    auto path = dir.path() / "vault.json";

    {
        auto first = vault_store::open(path);
        REQUIRE(first.is_ok());
        auto batch = make_batch({{"John", "Alice"}}, -5);
        first.value().update(batch);
        REQUIRE(first.value().persist().is_ok());
    }

    auto reopened = vault_store::open(path);
    REQUIRE(reopened.is_ok());
    auto& store = reopened.value();
    CHECK(store.state() == vault_state::loaded);

    auto seed = store.seed();
    REQUIRE(seed.has_value());
    CHECK(seed->get_synthetic("John") == "Alice");

    SECTION("Existing pairs and offset are kept") {
        auto batch = make_batch({{"John", "Bob"}, {"Acme", "Globex"}}, 99);
        store.update(batch);
        CHECK(store.record().date_offset == -5);
        CHECK(batch.date_offset == -5);
        CHECK(store.record().mappings.size() == 2);
        CHECK(store.record().to_table().get_synthetic("John") == "Alice");
        CHECK(store.record().to_table().get_synthetic("Acme") == "Globex");
        CHECK(store.record().file_count == 2);
        CHECK(store.record().statistics.at(entity_type::person) == 3);
    }

    SECTION("Persisted offset matches the batch offset") {
        auto batch = make_batch({{"Acme", "Globex"}}, 42);
        store.update(batch);
        REQUIRE(store.persist().is_ok());

        auto persisted = load_vault(path);
        REQUIRE(persisted.is_ok());
        CHECK(persisted.value().date_offset == batch.date_offset);
        CHECK(persisted.value().date_offset == -5);
    }
}

TEST_CASE("vault_store: creation time survives extension", "[anonymization][vault_store]") {
    test::temp_directory dir;
    auto path = dir.path() / "vault.json";

    vault_record original;
    original.created_at = "2020-01-01T00:00:00Z";
    original.date_offset = 7;
    original.mappings.emplace_back("Alice", "John");
    original.file_count = 1;
    REQUIRE(save_vault(path, original).is_ok());

    auto opened = vault_store::open(path);
    REQUIRE(opened.is_ok());
    auto batch = make_batch({{"Acme", "Globex"}}, 3);
    opened.value().update(batch);
    REQUIRE(opened.value().persist().is_ok());

    auto reloaded = load_vault(path);
    REQUIRE(reloaded.is_ok());
    CHECK(reloaded.value().created_at == "2020-01-01T00:00:00Z");
    CHECK(reloaded.value().mappings.size() == 2);
}

TEST_CASE("vault_store: corrupt vault is reported", "[anonymization][vault_store]") {
    test::temp_directory dir;
    auto path = dir.write("vault.json", "[1, 2, 3]");

    auto opened = vault_store::open(path);
    REQUIRE(opened.is_err());
    CHECK(opened.error().code == error_codes::vault_format_error);
}
