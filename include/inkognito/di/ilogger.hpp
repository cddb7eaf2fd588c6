/**
 * @file ilogger.hpp
 * @brief Logger interface for dependency injection
 *
 * The pipelines, the replacement generator and the vault functions take a
 * std::shared_ptr<ILogger>. A null pointer means "no logging" and is mapped
 * to the shared NullLogger by or_null().
 */

#pragma once

#include <inkognito/compat/format.hpp>
#include <inkognito/integration/logger_adapter.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace inkognito::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Abstract logger with a single sink
 *
 * Implementations provide write() and is_enabled(); the level helpers and
 * the formatting templates are built on top of them.
 *
 * Thread Safety:
 * - write() must be thread-safe in concrete implementations
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Emit one message
     * @param level Severity, already checked against is_enabled()
     * @param message Fully formatted text
     */
    virtual void write(integration::log_level level, std::string_view message) = 0;

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    void trace(std::string_view message) { emit(integration::log_level::trace, message); }
    void debug(std::string_view message) { emit(integration::log_level::debug, message); }
    void info(std::string_view message) { emit(integration::log_level::info, message); }
    void warn(std::string_view message) { emit(integration::log_level::warn, message); }
    void error(std::string_view message) { emit(integration::log_level::error, message); }

    // =========================================================================
    // Formatted Logging
    // =========================================================================

    template <typename... Args>
    void debug_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            write(integration::log_level::debug,
                  compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            write(integration::log_level::info,
                  compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            write(integration::log_level::warn,
                  compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            write(integration::log_level::error,
                  compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;

private:
    void emit(integration::log_level level, std::string_view message) {
        if (is_enabled(level)) {
            write(level, message);
        }
    }
};

// =============================================================================
// Implementations
// =============================================================================

/**
 * @brief Logger that discards everything
 */
class NullLogger final : public ILogger {
public:
    void write(integration::log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

/**
 * @brief ILogger backed by the process-wide logger_adapter
 *
 * An optional component name is prefixed to every message, e.g.
 * "[vault] Saved vault out/vault.json".
 */
class LoggerService final : public ILogger {
public:
    explicit LoggerService(std::string component = {})
        : prefix_{component.empty() ? std::string{} : "[" + component + "] "} {}

    void write(integration::log_level level, std::string_view message) override {
        std::string line = prefix_;
        line += message;
        integration::logger_adapter::log(level, line);
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

private:
    std::string prefix_;
};

/**
 * @brief Get the shared NullLogger instance
 */
[[nodiscard]] inline auto null_logger() -> std::shared_ptr<ILogger> {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

/**
 * @brief Substitute the null logger for an empty pointer
 */
[[nodiscard]] inline auto or_null(std::shared_ptr<ILogger> logger) -> std::shared_ptr<ILogger> {
    return logger ? std::move(logger) : null_logger();
}

}  // namespace inkognito::di
