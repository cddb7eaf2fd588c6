/**
 * @file logger_adapter.hpp
 * @brief Adapter for application and audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with anonymization operations. It supports standard logging and an audit
 * trail of vault and batch events, so that every re-identification of a
 * document can be traced afterwards.
 */

#pragma once

#include <inkognito/compat/format.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inkognito::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" .. "off")
 * @param name Level name, lower case
 * @return The level, or nullopt if the name is unknown
 */
[[nodiscard]] auto log_level_from_string(std::string_view name)
    -> std::optional<log_level>;

/**
 * @enum audit_event_type
 * @brief Events recorded in the audit trail
 */
enum class audit_event_type {
    batch_anonymized,
    vault_saved,
    vault_loaded,
    documents_restored
};

/**
 * @brief Upper-case event name written to the audit trail
 */
[[nodiscard]] auto to_string(audit_event_type type) noexcept -> std::string_view;

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{false};

    /// Enable separate audit trail file
    bool enable_audit_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Logging facade backed by logger_system
 *
 * Provides:
 * - Standard application logging (trace through fatal)
 * - An append-only JSON audit trail of vault and batch events
 *
 * Messages logged before initialize() or after shutdown() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Anonymized {} files", 3);
 * logger_adapter::log_vault_saved("out/vault.json", 42, 3);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail path. Repeated
     * calls are ignored until shutdown().
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release writers
     */
    static void shutdown();

    /**
     * @brief Check if the logger is initialized
     */
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record completion of an anonymization batch
     * @param files_processed Files that produced anonymized output
     * @param files_failed Files recorded as failures
     * @param date_offset Date-shift offset drawn for the batch
     */
    static void log_batch_anonymized(std::size_t files_processed,
                                     std::size_t files_failed,
                                     std::int64_t date_offset);

    /**
     * @brief Record that a vault was written
     * @param path Vault path
     * @param mapping_count Number of stored pairs
     * @param file_count Number of files recorded in the vault
     */
    static void log_vault_saved(const std::string& path,
                                std::size_t mapping_count,
                                std::size_t file_count);

    /**
     * @brief Record that a vault was read for restoration or seeding
     * @param path Vault path
     * @param mapping_count Number of stored pairs
     */
    static void log_vault_loaded(const std::string& path,
                                 std::size_t mapping_count);

    /**
     * @brief Record a restoration run
     * @param vault_path Vault used
     * @param files_restored Number of restored documents
     * @param replacements Total number of substitutions made
     */
    static void log_documents_restored(const std::string& vault_path,
                                       std::size_t files_restored,
                                       std::size_t replacements);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    /// Extra audit fields in output order
    using audit_fields = std::vector<std::pair<std::string, std::string>>;

    static void record_audit(audit_event_type type, std::string_view outcome,
                             audit_fields fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace inkognito::integration
