/**
 * @file document_reader.hpp
 * @brief Loading documents as text
 *
 * Markdown and plain-text files are read directly. Other formats (PDF,
 * DOCX) require an external conversion service and are reported as
 * unsupported.
 */

#pragma once

#include <inkognito/core/result.hpp>

#include <filesystem>
#include <string>

namespace inkognito::documents {

/**
 * @brief Check whether a file can be read without conversion
 *
 * True for ".md", ".markdown" and ".txt" (case-insensitive).
 */
[[nodiscard]] auto is_text_document(const std::filesystem::path& path) -> bool;

/**
 * @brief Read a document's text
 * @return The text, unsupported_document for formats needing conversion,
 *         or file_not_found / file_read_error
 */
[[nodiscard]] auto read_document(const std::filesystem::path& path) -> Result<std::string>;

}  // namespace inkognito::documents
