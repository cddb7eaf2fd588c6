/**
 * @file file_discovery_test.cpp
 * @brief Unit tests for input document discovery
 */

#include <inkognito/documents/file_discovery.hpp>

#include "support/temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

using namespace inkognito;
using namespace inkognito::documents;
namespace fs = std::filesystem;

namespace {

auto names(const std::vector<fs::path>& paths) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& path : paths) {
        result.push_back(path.filename().string());
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto names_of(const std::vector<fs::path>& files, std::string_view extension = {})
    -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& name : output_file_names(files, extension)) {
        result.push_back(name.string());
    }
    return result;
}

}  // namespace

TEST_CASE("file_discovery: glob matching", "[documents][discovery]") {
    CHECK(glob_match("*.md", "notes.md"));
    CHECK(glob_match("*.md", ".md"));
    CHECK_FALSE(glob_match("*.md", "notes.mdx"));
    CHECK(glob_match("report_??.txt", "report_01.txt"));
    CHECK_FALSE(glob_match("report_??.txt", "report_1.txt"));
    CHECK(glob_match("*", "anything"));
    CHECK(glob_match("a*b*c", "aXXbYYc"));
    CHECK_FALSE(glob_match("a*b*c", "aXXbYY"));
}

TEST_CASE("file_discovery: directory scan", "[documents][discovery]") {
    test::temp_directory dir;
    dir.write("one.md", "1");
    dir.write("two.txt", "2");
    dir.write("image.png", "x");
    dir.write("sub/three.md", "3");

    SECTION("Recursive scan applies the patterns") {
        auto found = find_files({}, dir.path());
        REQUIRE(found.is_ok());
        CHECK(names(found.value()) == std::vector<std::string>{"one.md", "three.md", "two.txt"});
        for (const auto& path : found.value()) {
            CHECK(path.is_absolute());
        }
    }

    SECTION("Non-recursive scan stays at the top level") {
        discovery_options options;
        options.recursive = false;
        options.patterns = {"*.md"};

        auto found = find_files({}, dir.path(), options);
        REQUIRE(found.is_ok());
        CHECK(names(found.value()) == std::vector<std::string>{"one.md"});
    }

    SECTION("Results are sorted") {
        auto found = find_files({}, dir.path());
        REQUIRE(found.is_ok());
        CHECK(std::is_sorted(found.value().begin(), found.value().end()));
    }

    SECTION("Missing directory") {
        auto found = find_files({}, dir.path() / "absent");
        REQUIRE(found.is_err());
        CHECK(found.error().code == error_codes::directory_not_found);
    }
}

TEST_CASE("file_discovery: explicit files", "[documents][discovery]") {
    test::temp_directory dir;
    auto b = dir.write("b.md", "b");
    auto a = dir.write("a.md", "a");

    SECTION("Order is kept and duplicates removed") {
        auto found = find_files({b, a, b}, std::nullopt);
        REQUIRE(found.is_ok());
        REQUIRE(found.value().size() == 2);
        CHECK(found.value()[0].filename() == "b.md");
        CHECK(found.value()[1].filename() == "a.md");
    }

    SECTION("Explicit files take precedence over the directory") {
        auto found = find_files({a}, dir.path());
        REQUIRE(found.is_ok());
        CHECK(found.value().size() == 1);
    }

    SECTION("Missing file") {
        auto found = find_files({dir.path() / "missing.md"}, std::nullopt);
        REQUIRE(found.is_err());
        CHECK(found.error().code == error_codes::file_not_found);
    }

    SECTION("No input at all") {
        auto found = find_files({}, std::nullopt);
        REQUIRE(found.is_err());
        CHECK(found.error().code == error_codes::invalid_argument);
    }
}

TEST_CASE("file_discovery: output file names", "[documents][discovery]") {
    SECTION("Distinct stems keep their names") {
        auto names = names_of({"in/a.txt", "in/b.md"}, ".md");
        CHECK(names == std::vector<std::string>{"a.md", "b.md"});
    }

    SECTION("Same stem in different directories") {
        auto names = names_of({"a/notes.md", "b/notes.md"}, ".md");
        CHECK(names == std::vector<std::string>{"notes.md", "notes_2.md"});
    }

    SECTION("Same stem with different extensions") {
        auto names = names_of({"notes.md", "notes.txt", "notes.markdown"}, ".md");
        CHECK(names == std::vector<std::string>{"notes.md", "notes_2.md",
                                                "notes_3.md"});
    }

    SECTION("Generated suffix does not clash with a real file") {
        auto names = names_of({"a/notes.md", "b/notes.md", "notes_2.md"}, ".md");
        CHECK(names == std::vector<std::string>{"notes.md", "notes_2.md",
                                                "notes_2_2.md"});
    }

    SECTION("Empty extension keeps the input extension") {
        auto names = names_of({"x/report.md", "y/report.md", "z/report.txt"});
        CHECK(names == std::vector<std::string>{"report.md", "report_2.md",
                                                "report.txt"});
    }
}
