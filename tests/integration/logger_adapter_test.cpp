/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <inkognito/integration/logger_adapter.hpp>
#include <inkognito/di/ilogger.hpp>

#include "support/temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace inkognito::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Read file contents as string
 */
auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() { logger_adapter::shutdown(); }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

auto audit_config(const std::filesystem::path& directory) -> logger_config {
    logger_config config;
    config.log_directory = directory;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;
    return config;
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    inkognito::test::temp_directory temp_dir("inkognito_logger_test");

    SECTION("Basic initialization") {
        logger_config config = audit_config(temp_dir.path());
        config.enable_file = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config = audit_config(temp_dir.path());

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    inkognito::test::temp_directory temp_dir("inkognito_logger_test");
    logger_config config = audit_config(temp_dir.path());
    config.enable_file = true;
    config.enable_audit_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);
        logger_adapter::flush();

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(std::filesystem::exists(temp_dir.path() / "inkognito.log"));
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
    }

    SECTION("LoggerService forwards to the adapter") {
        inkognito::di::LoggerService service;
        logger_adapter::set_min_level(log_level::error);
        CHECK_FALSE(service.is_enabled(log_level::info));
        CHECK(service.is_enabled(log_level::error));
        service.error_fmt("Failed to save {}", "vault.json");
    }
}

// =============================================================================
// Audit Trail Tests
// =============================================================================

TEST_CASE("logger_adapter audit trail", "[logger_adapter][audit]") {
    inkognito::test::temp_directory temp_dir("inkognito_logger_test");
    logger_test_fixture fixture(audit_config(temp_dir.path()));
    auto audit_path = temp_dir.path() / "audit.json";

    SECTION("Batch anonymized") {
        logger_adapter::log_batch_anonymized(3, 0, -17);

        auto content = read_file_contents(audit_path);
        REQUIRE(content.find("BATCH_ANONYMIZED") != std::string::npos);
        REQUIRE(content.find("\"outcome\":\"success\"") != std::string::npos);
        REQUIRE(content.find("\"date_offset\":\"-17\"") != std::string::npos);
    }

    SECTION("Batch with failures is partial") {
        logger_adapter::log_batch_anonymized(2, 1, 5);

        auto content = read_file_contents(audit_path);
        REQUIRE(content.find("\"outcome\":\"partial\"") != std::string::npos);
        REQUIRE(content.find("\"files_failed\":\"1\"") != std::string::npos);
    }

    SECTION("Vault saved and loaded") {
        logger_adapter::log_vault_saved("out/vault.json", 42, 3);
        logger_adapter::log_vault_loaded("out/vault.json", 42);

        auto content = read_file_contents(audit_path);
        REQUIRE(content.find("VAULT_SAVED") != std::string::npos);
        REQUIRE(content.find("VAULT_LOADED") != std::string::npos);
        REQUIRE(content.find("\"mappings\":\"42\"") != std::string::npos);
    }

    SECTION("Documents restored") {
        logger_adapter::log_documents_restored("C:\\vault \"main\".json", 4, 19);

        auto content = read_file_contents(audit_path);
        REQUIRE(content.find("DOCUMENTS_RESTORED") != std::string::npos);
        REQUIRE(content.find(R"(C:\\vault \"main\".json)") != std::string::npos);
        REQUIRE(content.find("\"replacements\":\"19\"") != std::string::npos);
    }

    SECTION("One JSON object per line") {
        logger_adapter::log_vault_saved("a.json", 1, 1);
        logger_adapter::log_vault_saved("b.json", 2, 2);

        std::istringstream lines(read_file_contents(audit_path));
        std::string line;
        int count = 0;
        while (std::getline(lines, line)) {
            CHECK(line.front() == '{');
            CHECK(line.back() == '}');
            ++count;
        }
        CHECK(count == 2);
    }
}

TEST_CASE("logger_adapter audit trail disabled", "[logger_adapter][audit]") {
    inkognito::test::temp_directory temp_dir("inkognito_logger_test");
    logger_config config = audit_config(temp_dir.path());
    config.enable_audit_log = false;

    logger_test_fixture fixture(config);
    logger_adapter::log_vault_saved("out/vault.json", 1, 1);

    CHECK_FALSE(std::filesystem::exists(temp_dir.path() / "audit.json"));
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    inkognito::test::temp_directory temp_dir("inkognito_logger_test");

    logger_config config = audit_config(temp_dir.path());
    config.min_level = log_level::debug;
    config.max_file_size_mb = 50;
    config.max_files = 3;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    REQUIRE(retrieved.min_level == log_level::debug);
    REQUIRE(retrieved.enable_audit_log);
    REQUIRE(retrieved.max_file_size_mb == 50);
    REQUIRE(retrieved.max_files == 3);
}

TEST_CASE("logger_adapter level names", "[logger_adapter][config]") {
    CHECK(log_level_from_string("trace") == log_level::trace);
    CHECK(log_level_from_string("warning") == log_level::warn);
    CHECK(log_level_from_string("off") == log_level::off);
    CHECK_FALSE(log_level_from_string("verbose").has_value());
}

TEST_CASE("logger_adapter audit event names", "[logger_adapter][audit]") {
    CHECK(to_string(audit_event_type::batch_anonymized) == "BATCH_ANONYMIZED");
    CHECK(to_string(audit_event_type::vault_saved) == "VAULT_SAVED");
    CHECK(to_string(audit_event_type::vault_loaded) == "VAULT_LOADED");
    CHECK(to_string(audit_event_type::documents_restored) == "DOCUMENTS_RESTORED");
}
