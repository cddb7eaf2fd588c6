/**
 * @file file_io_test.cpp
 * @brief Unit tests for whole-file text I/O
 */

#include <inkognito/core/file_io.hpp>

#include "support/temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace inkognito;

TEST_CASE("file_io: read_file", "[core][file_io]") {
    test::temp_directory dir;

    SECTION("Reads content byte for byte") {
        auto path = dir.write("note.md", "line one\r\nline two\n");
        auto content = core::read_file(path);
        REQUIRE(content.is_ok());
        CHECK(content.value() == "line one\r\nline two\n");
    }

    SECTION("Missing file is file_not_found") {
        auto content = core::read_file(dir.path() / "missing.md");
        REQUIRE(content.is_err());
        CHECK(content.error().code == error_codes::file_not_found);
        CHECK(content.error().message.find("missing.md") != std::string::npos);
    }

    SECTION("A directory is not a readable file") {
        auto content = core::read_file(dir.path());
        REQUIRE(content.is_err());
        CHECK(content.error().code == error_codes::file_not_found);
    }
}

TEST_CASE("file_io: write_file_atomically", "[core][file_io]") {
    test::temp_directory dir;

    SECTION("Creates parent directories") {
        auto target = dir.path() / "a" / "b" / "out.md";
        REQUIRE(core::write_file_atomically(target, "hello").is_ok());

        auto content = core::read_file(target);
        REQUIRE(content.is_ok());
        CHECK(content.value() == "hello");
    }

    SECTION("Replaces existing content and leaves no temp files") {
        auto target = dir.write("out.md", "old content that is longer");
        REQUIRE(core::write_file_atomically(target, "new").is_ok());
        CHECK(core::read_file(target).value() == "new");

        std::size_t entries = 0;
        for ([[maybe_unused]] const auto& entry :
             std::filesystem::directory_iterator(dir.path())) {
            ++entries;
        }
        CHECK(entries == 1);
    }

    SECTION("Parent that is a file fails with file_write_error") {
        auto blocker = dir.write("blocker", "x");
        auto written = core::write_file_atomically(blocker / "child.md", "content");
        REQUIRE(written.is_err());
        CHECK(written.error().code == error_codes::file_write_error);
    }
}
