/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <inkognito/di/ilogger.hpp>
#include <inkognito/anonymization/replacement_generator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>

using namespace inkognito;
using namespace inkognito::di;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Mock logger that counts calls and honours an enabled level
 */
class MockLogger final : public ILogger {
public:
    void write(integration::log_level level, std::string_view message) override {
        if (level == integration::log_level::info) {
            info_count_.fetch_add(1, std::memory_order_relaxed);
        }
        total_count_.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return level >= enabled_level_;
    }

    [[nodiscard]] size_t total_count() const noexcept {
        return total_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t info_count() const noexcept {
        return info_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] const std::string& last_message() const noexcept { return last_message_; }

    void set_enabled_level(integration::log_level level) noexcept { enabled_level_ = level; }

private:
    std::atomic<size_t> total_count_{0};
    std::atomic<size_t> info_count_{0};
    std::string last_message_;
    integration::log_level enabled_level_{integration::log_level::trace};
};

}  // namespace

// =============================================================================
// Formatted Logging Tests
// =============================================================================

TEST_CASE("ILogger: formatted logging", "[di][ilogger]") {
    MockLogger logger;

    SECTION("Arguments are formatted") {
        logger.info_fmt("Anonymized {} of {} files", 2, 3);
        CHECK(logger.last_message() == "Anonymized 2 of 3 files");
    }

    SECTION("Disabled levels are skipped before formatting") {
        logger.set_enabled_level(integration::log_level::warn);
        logger.debug_fmt("hidden {}", 1);
        logger.info_fmt("hidden {}", 2);
        CHECK(logger.total_count() == 0);

        logger.error_fmt("shown {}", 3);
        CHECK(logger.total_count() == 1);
        CHECK(logger.last_message() == "shown 3");
    }
}

TEST_CASE("ILogger: null logger", "[di][ilogger]") {
    auto logger = null_logger();
    REQUIRE(logger != nullptr);
    CHECK(logger == null_logger());
    CHECK_FALSE(logger->is_enabled(integration::log_level::fatal));

    logger->info("dropped");
    logger->error_fmt("dropped {}", 1);
}

TEST_CASE("ILogger: plain messages respect the enabled level", "[di][ilogger]") {
    MockLogger logger;
    logger.set_enabled_level(integration::log_level::info);

    logger.trace("hidden");
    logger.debug("hidden");
    CHECK(logger.total_count() == 0);

    logger.info("kept");
    logger.warn("kept too");
    CHECK(logger.total_count() == 2);
    CHECK(logger.info_count() == 1);
    CHECK(logger.last_message() == "kept too");
}

TEST_CASE("ILogger: or_null", "[di][ilogger]") {
    SECTION("Empty pointer becomes the null logger") {
        CHECK(or_null(nullptr) == null_logger());
    }

    SECTION("A real logger is passed through") {
        auto logger = std::make_shared<MockLogger>();
        std::shared_ptr<ILogger> as_base = logger;
        CHECK(or_null(as_base) == as_base);
    }
}

TEST_CASE("ILogger: injection into the generator", "[di][ilogger]") {
    auto logger = std::make_shared<MockLogger>();
    anonymization::replacement_generator generator(5, logger);
    anonymization::mapping_table table;

    auto result = generator.generate(core::entity_type::unknown, "opaque", table);
    REQUIRE(result.is_ok());
    CHECK(logger->info_count() == 1);
    CHECK(logger->last_message().find("UNKNOWN") != std::string::npos);
}
