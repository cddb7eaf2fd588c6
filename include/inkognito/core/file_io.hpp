/**
 * @file file_io.hpp
 * @brief Whole-file text I/O with atomic replacement on write
 */

#pragma once

#include <inkognito/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace inkognito::core {

/**
 * @brief Read an entire file as bytes
 * @param path File to read
 * @return File contents, or file_not_found / file_read_error
 */
[[nodiscard]] auto read_file(const std::filesystem::path& path) -> Result<std::string>;

/**
 * @brief Write a file so readers never observe partial content
 *
 * The content is written to a sibling temporary file which is then renamed
 * over the target. Missing parent directories are created. On failure the
 * temporary file is removed and the target is left untouched.
 *
 * @param path Target file
 * @param content Bytes to write
 * @return Success, or file_write_error
 */
[[nodiscard]] auto write_file_atomically(const std::filesystem::path& path,
                                         std::string_view content) -> VoidResult;

}  // namespace inkognito::core
