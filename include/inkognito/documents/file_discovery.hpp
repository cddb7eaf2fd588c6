/**
 * @file file_discovery.hpp
 * @brief Locating input documents from a file list or a directory
 */

#pragma once

#include <inkognito/core/result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkognito::documents {

/**
 * @brief Directory scan options
 */
struct discovery_options {
    /// File-name glob patterns; '*' and '?' wildcards
    std::vector<std::string> patterns{"*.pdf", "*.md", "*.txt"};

    /// Descend into subdirectories
    bool recursive{true};
};

/**
 * @brief Match a file name against a glob pattern
 *
 * '*' matches any run of characters, '?' exactly one. Matching is
 * case-sensitive and applies to the whole name.
 */
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view name) -> bool;

/**
 * @brief Resolve the input documents of a command
 *
 * An explicit file list takes precedence: every entry must exist and the
 * result keeps the given order (duplicates removed). Otherwise the directory
 * is scanned for regular files whose name matches any pattern, and the
 * result is sorted.
 *
 * @param files Explicit files (may be empty)
 * @param directory Directory to scan when no files are given
 * @param options Patterns and recursion for the directory scan
 * @return Absolute paths, or file_not_found / directory_not_found /
 *         invalid_argument when neither input is given
 */
[[nodiscard]] auto find_files(const std::vector<std::filesystem::path>& files,
                              const std::optional<std::filesystem::path>& directory,
                              const discovery_options& options = {})
    -> Result<std::vector<std::filesystem::path>>;

/**
 * @brief Collision-free output file names for a list of inputs
 *
 * Each input keeps its stem. An input whose name was already handed out
 * gets "_2", "_3", ... appended to the stem, so "a/notes.md" and
 * "b/notes.md" become "notes.md" and "notes_2.md".
 *
 * @param files Inputs in processing order
 * @param extension Extension for every output (e.g. ".md"); empty keeps the
 *        input's own extension
 * @return One bare file name per input, in input order
 */
[[nodiscard]] auto output_file_names(const std::vector<std::filesystem::path>& files,
                                     std::string_view extension = {})
    -> std::vector<std::filesystem::path>;

}  // namespace inkognito::documents
