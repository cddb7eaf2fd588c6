/**
 * @file vault.hpp
 * @brief Versioned, persistable record of a batch's mapping table
 *
 * A vault is an immutable value. It is produced from a session mapping
 * table by serialize_vault(), persisted with save_vault(), read back with
 * load_vault(), and turned into a synthetic -> original lookup with
 * invert_mappings() for restoration.
 *
 * Document layout (JSON, fields in this order):
 * @code
 * {
 *   "version": "2.0",
 *   "created_at": "2026-01-31T12:00:00Z",
 *   "date_offset": -42,
 *   "mappings": [["Robert Hale", "John Smith"], ...],
 *   "statistics": {"PERSON": 3, "EMAIL_ADDRESS": 1},
 *   "file_count": 2
 * }
 * @endcode
 */

#pragma once

#include "mapping_table.hpp"

#include <inkognito/core/entity_type.hpp>
#include <inkognito/core/result.hpp>
#include <inkognito/di/ilogger.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inkognito::anonymization {

/// Format version written into every vault
inline constexpr std::string_view vault_version = "2.0";

/// JSON document type preserving field order
using vault_document = nlohmann::ordered_json;

/// Occurrence counts per entity type
using entity_counts = std::map<core::entity_type, std::size_t>;

/**
 * @brief Parsed vault record
 */
struct vault_record {
    std::string version{vault_version};

    /// ISO-8601 UTC timestamp
    std::string created_at;

    /// Batch date-shift offset in days
    std::int64_t date_offset{0};

    /// (synthetic, original) pairs in discovery order
    std::vector<std::pair<std::string, std::string>> mappings;

    entity_counts statistics;

    std::size_t file_count{0};

    /**
     * @brief Rebuild the original -> synthetic table
     */
    [[nodiscard]] auto to_table() const -> mapping_table;
};

/**
 * @brief Result of the lenient deserializer
 *
 * date_offset is nullopt when the document was empty or carried a missing or
 * unsupported version; mappings is then empty.
 */
struct vault_contents {
    std::optional<std::int64_t> date_offset;
    mapping_table mappings;

    auto operator==(const vault_contents&) const -> bool = default;
};

/// synthetic -> original
using reverse_mappings = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Current UTC time as an ISO-8601 string ("YYYY-MM-DDTHH:MM:SSZ")
 */
[[nodiscard]] auto current_timestamp() -> std::string;

/**
 * @brief Build a vault record from a session table
 * @param table Session mapping table
 * @param date_offset Batch date-shift offset in days
 * @param file_count Number of files the table covers
 * @param statistics Per-type occurrence counts
 * @param created_at Timestamp to record (current time if empty)
 */
[[nodiscard]] auto make_vault_record(const mapping_table& table,
                                     std::int64_t date_offset,
                                     std::size_t file_count,
                                     entity_counts statistics = {},
                                     std::string created_at = {}) -> vault_record;

/**
 * @brief Render a record as a JSON document with a fixed field layout
 */
[[nodiscard]] auto to_document(const vault_record& record) -> vault_document;

/**
 * @brief Serialize a session table into a version "2.0" vault document
 */
[[nodiscard]] auto serialize_vault(const mapping_table& table,
                                   std::int64_t date_offset,
                                   std::size_t file_count,
                                   const entity_counts& statistics = {}) -> vault_document;

/**
 * @brief Strictly parse a vault document
 *
 * @return The record, or vault_format_error when the document is not an
 *         object, lacks a field, has a field of the wrong type, carries a
 *         version other than "2.0", or maps one original twice
 */
[[nodiscard]] auto parse_vault_record(const vault_document& document)
    -> Result<vault_record>;

/**
 * @brief Leniently deserialize a vault document
 *
 * Never fails. A null document, a missing or unsupported version, or a
 * malformed structure yields {nullopt, {}} and a warning on the logger.
 */
[[nodiscard]] auto deserialize_vault(const vault_document& document,
                                     std::shared_ptr<di::ILogger> logger = nullptr)
    -> vault_contents;

/**
 * @brief Leniently deserialize vault text
 *
 * Empty or unparseable text yields {nullopt, {}} and a warning.
 */
[[nodiscard]] auto deserialize_vault_text(std::string_view text,
                                          std::shared_ptr<di::ILogger> logger = nullptr)
    -> vault_contents;

/**
 * @brief Load a vault file
 * @return The record, vault_not_found if the path does not exist, or
 *         vault_format_error if the content is not a valid vault
 */
[[nodiscard]] auto load_vault(const std::filesystem::path& path,
                              std::shared_ptr<di::ILogger> logger = nullptr)
    -> Result<vault_record>;

/**
 * @brief Write a vault file atomically
 *
 * Concurrent writers to the same path are not serialized; the caller owns
 * that. A reader never observes a partially written file.
 *
 * @return Success, or persistence_failure
 */
[[nodiscard]] auto save_vault(const std::filesystem::path& path,
                              const vault_record& record,
                              std::shared_ptr<di::ILogger> logger = nullptr)
    -> VoidResult;

/**
 * @brief Invert original -> synthetic into synthetic -> original
 *
 * If two originals share a synthetic value the later-inserted one wins.
 */
[[nodiscard]] auto invert_mappings(const mapping_table& table) -> reverse_mappings;

/// @overload Inverts a record's (synthetic, original) pairs
[[nodiscard]] auto invert_mappings(const vault_record& record) -> reverse_mappings;

}  // namespace inkognito::anonymization
