/**
 * @file vault.cpp
 * @brief Implementation of vault serialization and persistence
 */

#include "inkognito/anonymization/vault.hpp"

#include <inkognito/core/file_io.hpp>
#include <inkognito/integration/logger_adapter.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace inkognito::anonymization {

namespace {

auto format_error(const std::string& message) -> Result<vault_record> {
    return inkognito_error<vault_record>(error_codes::vault_format_error, message);
}

}  // namespace

// =============================================================================
// Record
// =============================================================================

auto vault_record::to_table() const -> mapping_table {
    mapping_table table;
    for (const auto& [synthetic, original] : mappings) {
        auto added = table.add_mapping(original, synthetic);
        if (added.is_err()) {
            // First pair for an original wins
            continue;
        }
    }
    return table;
}

auto current_timestamp() -> std::string {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto make_vault_record(const mapping_table& table,
                       std::int64_t date_offset,
                       std::size_t file_count,
                       entity_counts statistics,
                       std::string created_at) -> vault_record {
    vault_record record;
    record.created_at = created_at.empty() ? current_timestamp() : std::move(created_at);
    record.date_offset = date_offset;
    record.file_count = file_count;
    record.statistics = std::move(statistics);
    record.mappings.reserve(table.size());
    for (const auto& [original, synthetic] : table.entries()) {
        record.mappings.emplace_back(synthetic, original);
    }
    return record;
}

// =============================================================================
// Serialization
// =============================================================================

auto to_document(const vault_record& record) -> vault_document {
    vault_document doc;
    doc["version"] = record.version;
    doc["created_at"] = record.created_at;
    doc["date_offset"] = record.date_offset;

    auto mappings = vault_document::array();
    for (const auto& [synthetic, original] : record.mappings) {
        mappings.push_back(vault_document::array({synthetic, original}));
    }
    doc["mappings"] = std::move(mappings);

    auto statistics = vault_document::object();
    for (const auto& [type, count] : record.statistics) {
        statistics[std::string{core::to_string(type)}] = count;
    }
    doc["statistics"] = std::move(statistics);
    doc["file_count"] = record.file_count;

    return doc;
}

auto serialize_vault(const mapping_table& table,
                     std::int64_t date_offset,
                     std::size_t file_count,
                     const entity_counts& statistics) -> vault_document {
    return to_document(make_vault_record(table, date_offset, file_count, statistics));
}

auto parse_vault_record(const vault_document& document) -> Result<vault_record> {
    if (!document.is_object()) {
        return format_error("Vault document is not an object");
    }

    auto version = document.find("version");
    if (version == document.end() || !version->is_string()) {
        return format_error("Vault has no version");
    }
    if (version->get<std::string>() != vault_version) {
        return format_error("Unsupported vault version: " + version->get<std::string>());
    }

    vault_record record;
    record.version = version->get<std::string>();

    auto created_at = document.find("created_at");
    if (created_at != document.end()) {
        if (!created_at->is_string()) {
            return format_error("Field 'created_at' must be a string");
        }
        record.created_at = created_at->get<std::string>();
    }

    auto date_offset = document.find("date_offset");
    if (date_offset == document.end() || !date_offset->is_number_integer()) {
        return format_error("Field 'date_offset' must be an integer");
    }
    record.date_offset = date_offset->get<std::int64_t>();

    auto mappings = document.find("mappings");
    if (mappings == document.end() || !mappings->is_array()) {
        return format_error("Field 'mappings' must be a list");
    }

    mapping_table seen;
    for (const auto& pair : *mappings) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() ||
            !pair[1].is_string()) {
            return format_error("Each mapping must be a [synthetic, original] pair");
        }
        auto synthetic = pair[0].get<std::string>();
        auto original = pair[1].get<std::string>();

        auto added = seen.add_mapping(original, synthetic);
        if (added.is_err()) {
            return format_error("Invalid mapping for '" + original + "': " +
                                added.error().message);
        }
        record.mappings.emplace_back(std::move(synthetic), std::move(original));
    }

    auto statistics = document.find("statistics");
    if (statistics != document.end()) {
        if (!statistics->is_object()) {
            return format_error("Field 'statistics' must be an object");
        }
        for (const auto& [name, count] : statistics->items()) {
            auto type = core::entity_type_from_string(name);
            if (!type) {
                return format_error("Unknown entity type in statistics: " + name);
            }
            if (!count.is_number_unsigned() && !count.is_number_integer()) {
                return format_error("Statistic for " + name + " must be an integer");
            }
            auto value = count.get<std::int64_t>();
            if (value < 0) {
                return format_error("Statistic for " + name + " must not be negative");
            }
            record.statistics[*type] += static_cast<std::size_t>(value);
        }
    }

    auto file_count = document.find("file_count");
    if (file_count != document.end()) {
        if (!file_count->is_number_integer() || file_count->get<std::int64_t>() < 0) {
            return format_error("Field 'file_count' must be a non-negative integer");
        }
        record.file_count = file_count->get<std::size_t>();
    }

    return record;
}

auto deserialize_vault(const vault_document& document,
                       std::shared_ptr<di::ILogger> logger) -> vault_contents {
    auto log = di::or_null(std::move(logger));

    if (document.is_null() || (document.is_object() && document.empty())) {
        log->warn("Vault data is empty");
        return {};
    }

    auto parsed = parse_vault_record(document);
    if (parsed.is_err()) {
        log->warn_fmt("Ignoring vault data: {}", parsed.error().message);
        return {};
    }

    const auto& record = parsed.value();
    return {record.date_offset, record.to_table()};
}

auto deserialize_vault_text(std::string_view text,
                            std::shared_ptr<di::ILogger> logger) -> vault_contents {
    auto log = di::or_null(std::move(logger));

    if (text.empty()) {
        log->warn("Vault data is empty");
        return {};
    }

    auto document = vault_document::parse(text, nullptr, false);
    if (document.is_discarded()) {
        log->warn("Ignoring vault data: not valid JSON");
        return {};
    }

    return deserialize_vault(document, log);
}

// =============================================================================
// Persistence
// =============================================================================

auto load_vault(const std::filesystem::path& path,
                std::shared_ptr<di::ILogger> logger) -> Result<vault_record> {
    auto log = di::or_null(std::move(logger));

    std::error_code ec;
    const bool present = std::filesystem::exists(path, ec);
    if (ec) {
        return inkognito_error<vault_record>(error_codes::vault_format_error,
                                             "Vault could not be accessed: " + ec.message(),
                                             path.string());
    }
    if (!present) {
        return inkognito_error<vault_record>(error_codes::vault_not_found,
                                             "Vault not found: " + path.string());
    }

    auto text = core::read_file(path);
    if (text.is_err()) {
        return inkognito_error<vault_record>(error_codes::vault_format_error,
                                             "Vault could not be read: " +
                                                 text.error().message,
                                             path.string());
    }

    vault_document document;
    try {
        document = vault_document::parse(text.value());
    } catch (const nlohmann::json::parse_error& e) {
        return inkognito_error<vault_record>(error_codes::vault_format_error,
                                             std::string{"Vault is not valid JSON: "} +
                                                 e.what(),
                                             path.string());
    }

    auto record = parse_vault_record(document);
    if (record.is_err()) {
        return inkognito_error<vault_record>(error_codes::vault_format_error,
                                             record.error().message, path.string());
    }

    log->debug_fmt("Loaded vault {} with {} mappings", path.string(),
                   record.value().mappings.size());
    integration::logger_adapter::log_vault_loaded(path.string(),
                                                  record.value().mappings.size());
    return record;
}

auto save_vault(const std::filesystem::path& path,
                const vault_record& record,
                std::shared_ptr<di::ILogger> logger) -> VoidResult {
    auto log = di::or_null(std::move(logger));

    std::string text;
    try {
        text = to_document(record).dump(2);
    } catch (const nlohmann::json::type_error& e) {
        // dump() rejects invalid UTF-8 in keys or values
        return inkognito_void_error(error_codes::persistence_failure,
                                    std::string{"Failed to encode vault: "} + e.what(),
                                    path.string());
    }
    text += '\n';

    auto written = core::write_file_atomically(path, text);
    if (written.is_err()) {
        log->error_fmt("Failed to save vault {}: {}", path.string(),
                       written.error().message);
        return inkognito_void_error(error_codes::persistence_failure,
                                    "Failed to save vault: " + written.error().message,
                                    path.string());
    }

    log->info_fmt("Saved vault {} ({} mappings, {} files)", path.string(),
                  record.mappings.size(), record.file_count);
    integration::logger_adapter::log_vault_saved(path.string(), record.mappings.size(),
                                                 record.file_count);
    return ok();
}

// =============================================================================
// Inversion
// =============================================================================

auto invert_mappings(const mapping_table& table) -> reverse_mappings {
    reverse_mappings reversed;
    for (const auto& [original, synthetic] : table.entries()) {
        reversed.insert_or_assign(synthetic, original);
    }
    return reversed;
}

auto invert_mappings(const vault_record& record) -> reverse_mappings {
    reverse_mappings reversed;
    for (const auto& [synthetic, original] : record.mappings) {
        reversed.insert_or_assign(synthetic, original);
    }
    return reversed;
}

}  // namespace inkognito::anonymization
