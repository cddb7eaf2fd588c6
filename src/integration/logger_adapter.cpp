/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging and audit trail adapter
 */

#include <inkognito/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace inkognito::integration {

namespace {

constexpr std::size_t kBytesPerMegabyte = 1024 * 1024;

[[nodiscard]] auto to_backend(log_level level) -> kcenon::logger::log_level {
    using backend = kcenon::logger::log_level;
    static constexpr std::array<backend, 7> table{
        backend::trace, backend::debug, backend::info, backend::warn,
        backend::error, backend::fatal, backend::off};
    auto index = static_cast<std::size_t>(level);
    return index < table.size() ? table[index] : backend::off;
}

/// UTC time with millisecond precision, e.g. 2026-03-01T09:15:02.417Z
[[nodiscard]] auto utc_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

/**
 * @brief Append-only JSON lines file
 *
 * Each record is serialized on a single line. A closed trail ignores
 * records.
 */
class audit_trail {
public:
    void open(std::filesystem::path path) {
        std::lock_guard lock(mutex_);
        path_ = std::move(path);
    }

    void close() {
        std::lock_guard lock(mutex_);
        path_.clear();
    }

    void append(const nlohmann::ordered_json& record) {
        std::lock_guard lock(mutex_);
        if (path_.empty()) {
            return;
        }
        std::ofstream file(path_, std::ios::app);
        if (!file) {
            return;
        }
        file << record.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
             << '\n';
    }

private:
    std::mutex mutex_;
    std::filesystem::path path_;
};

}  // namespace

auto log_level_from_string(std::string_view name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

auto to_string(audit_event_type type) noexcept -> std::string_view {
    switch (type) {
        case audit_event_type::batch_anonymized: return "BATCH_ANONYMIZED";
        case audit_event_type::vault_saved: return "VAULT_SAVED";
        case audit_event_type::vault_loaded: return "VAULT_LOADED";
        case audit_event_type::documents_restored: return "DOCUMENTS_RESTORED";
    }
    return "UNKNOWN";
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (backend_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        auto backend = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        backend->set_min_level(to_backend(config.min_level));
        if (config.enable_console) {
            backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "inkognito.log").string(),
                config.max_file_size_mb * kBytesPerMegabyte,
                config.max_files));
        }
        backend->start();
        backend_ = std::move(backend);

        if (config.enable_audit_log) {
            audit_.open(config.log_directory / "audit.json");
        }
        running_.store(true);
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        running_.store(false);
        audit_.close();
        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
    }

    [[nodiscard]] auto running() const noexcept -> bool { return running_.load(); }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (backend_ && enabled(level)) {
            backend_->log(to_backend(level), message);
        }
    }

    [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
        return level != log_level::off && level >= min_level_.load();
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        if (backend_) {
            backend_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] auto min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto config() const -> const logger_config& { return config_; }

    void audit(audit_event_type type, std::string_view outcome, audit_fields fields) {
        if (!running()) {
            return;
        }
        nlohmann::ordered_json record;
        record["timestamp"] = utc_timestamp();
        record["event_type"] = std::string{to_string(type)};
        record["outcome"] = std::string{outcome};
        for (auto& [key, value] : fields) {
            record[key] = std::move(value);
        }
        audit_.append(record);
    }

private:
    std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    audit_trail audit_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Lifecycle and Standard Logging
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->running(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }

// =============================================================================
// Audit Events
// =============================================================================

void logger_adapter::log_batch_anonymized(std::size_t files_processed,
                                          std::size_t files_failed,
                                          std::int64_t date_offset) {
    const bool clean = files_failed == 0;
    if (clean) {
        info("Batch anonymized: {} files, date offset {} days", files_processed, date_offset);
    } else {
        warn("Batch anonymized with failures: {} succeeded, {} failed",
             files_processed, files_failed);
    }

    record_audit(audit_event_type::batch_anonymized, clean ? "success" : "partial",
                 {{"files_processed", std::to_string(files_processed)},
                  {"files_failed", std::to_string(files_failed)},
                  {"date_offset", std::to_string(date_offset)}});
}

void logger_adapter::log_vault_saved(const std::string& path,
                                     std::size_t mapping_count,
                                     std::size_t file_count) {
    info("Vault saved to {} ({} mappings, {} files)", path, mapping_count, file_count);
    record_audit(audit_event_type::vault_saved, "success",
                 {{"path", path},
                  {"mappings", std::to_string(mapping_count)},
                  {"file_count", std::to_string(file_count)}});
}

void logger_adapter::log_vault_loaded(const std::string& path, std::size_t mapping_count) {
    debug("Vault loaded from {} ({} mappings)", path, mapping_count);
    record_audit(audit_event_type::vault_loaded, "success",
                 {{"path", path}, {"mappings", std::to_string(mapping_count)}});
}

void logger_adapter::log_documents_restored(const std::string& vault_path,
                                            std::size_t files_restored,
                                            std::size_t replacements) {
    info("Restored {} files with {} replacements using {}",
         files_restored, replacements, vault_path);
    record_audit(audit_event_type::documents_restored, "success",
                 {{"vault_path", vault_path},
                  {"files_restored", std::to_string(files_restored)},
                  {"replacements", std::to_string(replacements)}});
}

void logger_adapter::record_audit(audit_event_type type, std::string_view outcome,
                                  audit_fields fields) {
    pimpl_->audit(type, outcome, std::move(fields));
}

}  // namespace inkognito::integration
