/**
 * @file config_loader.hpp
 * @brief Application configuration from JSON file and environment
 *
 * Settings are resolved in three layers, each overriding the previous:
 * built-in defaults, an optional JSON file, and INKOGNITO_* environment
 * variables. Command-line flags are applied on top by the CLI.
 *
 * @code
 * {
 *   "anonymization": {
 *     "entity_types": ["PERSON", "EMAIL_ADDRESS"],
 *     "score_threshold": 0.6,
 *     "date_shift_days": 180
 *   },
 *   "discovery": {"patterns": ["*.md"], "recursive": false},
 *   "segmentation": {"max_tokens": 8000, "min_tokens": 4000,
 *                    "break_at_headings": ["h1"]},
 *   "logging": {"level": "debug", "directory": "logs", "console": true,
 *               "file": false, "audit": true}
 * }
 * @endcode
 */

#pragma once

#include <inkognito/anonymization/anonymization_pipeline.hpp>
#include <inkognito/core/result.hpp>
#include <inkognito/documents/file_discovery.hpp>
#include <inkognito/documents/segmenter.hpp>
#include <inkognito/integration/logger_adapter.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace inkognito::config {

/**
 * @brief Logging section
 */
struct logging_settings {
    integration::log_level level{integration::log_level::info};
    std::filesystem::path directory{"logs"};
    bool console{true};
    bool file{false};
    bool audit{false};
};

/**
 * @brief Complete application configuration
 */
struct app_config {
    anonymization::pipeline_config anonymization;
    documents::discovery_options discovery;
    documents::segment_options segmentation;
    logging_settings logging;

    /**
     * @brief Logger settings derived from the logging section
     */
    [[nodiscard]] auto to_logger_config() const -> integration::logger_config;

    /**
     * @brief Check value ranges across all sections
     * @return config_parse_error describing the first invalid value
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

/**
 * @brief Resolves app_config from its sources
 */
class config_loader {
public:
    /// Returns the value of an environment variable, if set
    using environment_lookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Construct a loader
     * @param environment Variable lookup (process environment if empty)
     */
    explicit config_loader(environment_lookup environment = {});

    /**
     * @brief Load defaults, then the file (if given), then the environment
     * @return The configuration, or file_not_found / config_parse_error
     */
    [[nodiscard]] auto load(const std::optional<std::filesystem::path>& file) const
        -> Result<app_config>;

    /**
     * @brief Apply a JSON document on top of a configuration
     *
     * Sections and keys that are absent leave the base value unchanged.
     */
    [[nodiscard]] static auto parse(std::string_view json_text, app_config base = {})
        -> Result<app_config>;

    /**
     * @brief Apply INKOGNITO_* environment overrides
     */
    [[nodiscard]] auto apply_environment(app_config config) const -> Result<app_config>;

    /// Environment variable names
    static constexpr const char* env_log_level = "INKOGNITO_LOG_LEVEL";
    static constexpr const char* env_log_dir = "INKOGNITO_LOG_DIR";
    static constexpr const char* env_score_threshold = "INKOGNITO_SCORE_THRESHOLD";
    static constexpr const char* env_date_shift_days = "INKOGNITO_DATE_SHIFT_DAYS";

private:
    environment_lookup environment_;
};

/**
 * @brief Parse a comma-separated list of entity type names
 * @return The types, or config_parse_error naming the unknown entry
 */
[[nodiscard]] auto parse_entity_type_list(std::string_view list)
    -> Result<std::vector<core::entity_type>>;

}  // namespace inkognito::config
