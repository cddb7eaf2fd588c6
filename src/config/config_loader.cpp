/**
 * @file config_loader.cpp
 * @brief Implementation of configuration loading
 */

#include "inkognito/config/config_loader.hpp"

#include <inkognito/core/file_io.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <exception>

using json = nlohmann::json;

namespace inkognito::config {

namespace {

auto parse_error(const std::string& message) -> Result<app_config> {
    return inkognito_error<app_config>(error_codes::config_parse_error, message);
}

auto process_environment(const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string{value};
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_entity_types(const json& list) -> Result<std::vector<core::entity_type>> {
    std::vector<core::entity_type> types;
    for (const auto& item : list) {
        auto name = item.get<std::string>();
        auto type = core::entity_type_from_string(name);
        if (!type || *type == core::entity_type::unknown) {
            return inkognito_error<std::vector<core::entity_type>>(
                error_codes::config_parse_error, "Unknown entity type: " + name);
        }
        types.push_back(*type);
    }
    return types;
}

}  // namespace

// =============================================================================
// app_config
// =============================================================================

auto app_config::to_logger_config() const -> integration::logger_config {
    integration::logger_config config;
    config.min_level = logging.level;
    config.log_directory = logging.directory;
    config.enable_console = logging.console;
    config.enable_file = logging.file;
    config.enable_audit_log = logging.audit;
    return config;
}

auto app_config::validate() const -> VoidResult {
    auto pipeline = anonymization.validate();
    if (pipeline.is_err()) {
        return inkognito_void_error(error_codes::config_parse_error,
                                    pipeline.error().message);
    }
    if (segmentation.max_tokens == 0 || segmentation.min_tokens > segmentation.max_tokens) {
        return inkognito_void_error(error_codes::config_parse_error,
                                    "segmentation.min_tokens must not exceed max_tokens");
    }
    for (const auto& level : segmentation.break_at_headings) {
        if (!documents::parse_heading_level(level)) {
            return inkognito_void_error(error_codes::config_parse_error,
                                        "Unknown heading level: " + level);
        }
    }
    if (discovery.patterns.empty()) {
        return inkognito_void_error(error_codes::config_parse_error,
                                    "discovery.patterns must not be empty");
    }
    return ok();
}

// =============================================================================
// config_loader
// =============================================================================

config_loader::config_loader(environment_lookup environment)
    : environment_{environment ? std::move(environment)
                               : environment_lookup{process_environment}} {}

auto config_loader::load(const std::optional<std::filesystem::path>& file) const
    -> Result<app_config> {
    app_config config;

    if (file.has_value()) {
        auto text = core::read_file(*file);
        if (text.is_err()) {
            return Result<app_config>(text.error());
        }
        auto parsed = parse(text.value(), std::move(config));
        if (parsed.is_err()) {
            return parsed;
        }
        config = std::move(parsed.value());
    }

    auto resolved = apply_environment(std::move(config));
    if (resolved.is_err()) {
        return resolved;
    }

    auto valid = resolved.value().validate();
    if (valid.is_err()) {
        return Result<app_config>(valid.error());
    }
    return resolved;
}

auto config_loader::parse(std::string_view json_text, app_config base) -> Result<app_config> {
    try {
        auto root = json::parse(json_text);
        if (!root.is_object()) {
            return parse_error("Configuration root must be an object");
        }

        if (root.contains("anonymization")) {
            const auto& section = root["anonymization"];
            if (section.contains("entity_types")) {
                auto types = parse_entity_types(section["entity_types"]);
                if (types.is_err()) {
                    return Result<app_config>(types.error());
                }
                base.anonymization.entity_types = std::move(types.value());
            }
            if (section.contains("score_threshold")) {
                base.anonymization.score_threshold = section["score_threshold"].get<double>();
            }
            if (section.contains("date_shift_days")) {
                base.anonymization.date_shift_days = section["date_shift_days"].get<int>();
            }
        }

        if (root.contains("discovery")) {
            const auto& section = root["discovery"];
            if (section.contains("patterns")) {
                base.discovery.patterns =
                    section["patterns"].get<std::vector<std::string>>();
            }
            if (section.contains("recursive")) {
                base.discovery.recursive = section["recursive"].get<bool>();
            }
        }

        if (root.contains("segmentation")) {
            const auto& section = root["segmentation"];
            if (section.contains("max_tokens")) {
                base.segmentation.max_tokens = section["max_tokens"].get<std::size_t>();
            }
            if (section.contains("min_tokens")) {
                base.segmentation.min_tokens = section["min_tokens"].get<std::size_t>();
            }
            if (section.contains("break_at_headings")) {
                base.segmentation.break_at_headings =
                    section["break_at_headings"].get<std::vector<std::string>>();
            }
        }

        if (root.contains("logging")) {
            const auto& section = root["logging"];
            if (section.contains("level")) {
                auto name = section["level"].get<std::string>();
                auto level = integration::log_level_from_string(name);
                if (!level) {
                    return parse_error("Unknown log level: " + name);
                }
                base.logging.level = *level;
            }
            if (section.contains("directory")) {
                base.logging.directory = section["directory"].get<std::string>();
            }
            if (section.contains("console")) {
                base.logging.console = section["console"].get<bool>();
            }
            if (section.contains("file")) {
                base.logging.file = section["file"].get<bool>();
            }
            if (section.contains("audit")) {
                base.logging.audit = section["audit"].get<bool>();
            }
        }

        return base;
    } catch (const json::exception& ex) {
        return parse_error("JSON parsing error: " + std::string(ex.what()));
    }
}

auto config_loader::apply_environment(app_config config) const -> Result<app_config> {
    if (auto value = environment_(env_log_level)) {
        auto level = integration::log_level_from_string(*value);
        if (!level) {
            return parse_error(std::string{env_log_level} + ": unknown log level '" +
                               *value + "'");
        }
        config.logging.level = *level;
    }

    if (auto value = environment_(env_log_dir)) {
        config.logging.directory = *value;
    }

    if (auto value = environment_(env_score_threshold)) {
        try {
            std::size_t consumed = 0;
            config.anonymization.score_threshold = std::stod(*value, &consumed);
            if (consumed != value->size()) {
                return parse_error(std::string{env_score_threshold} + ": not a number");
            }
        } catch (const std::exception&) {
            return parse_error(std::string{env_score_threshold} + ": not a number");
        }
    }

    if (auto value = environment_(env_date_shift_days)) {
        try {
            std::size_t consumed = 0;
            config.anonymization.date_shift_days = std::stoi(*value, &consumed);
            if (consumed != value->size()) {
                return parse_error(std::string{env_date_shift_days} + ": not an integer");
            }
        } catch (const std::exception&) {
            return parse_error(std::string{env_date_shift_days} + ": not an integer");
        }
    }

    return config;
}

auto parse_entity_type_list(std::string_view list) -> Result<std::vector<core::entity_type>> {
    std::vector<core::entity_type> types;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto name = trim(list.substr(0, comma));
        list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
        if (name.empty()) {
            continue;
        }
        auto type = core::entity_type_from_string(name);
        if (!type || *type == core::entity_type::unknown) {
            return inkognito_error<std::vector<core::entity_type>>(
                error_codes::config_parse_error,
                "Unknown entity type: " + std::string{name});
        }
        types.push_back(*type);
    }
    return types;
}

}  // namespace inkognito::config
