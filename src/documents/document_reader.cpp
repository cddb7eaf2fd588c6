/**
 * @file document_reader.cpp
 * @brief Implementation of document loading
 */

#include "inkognito/documents/document_reader.hpp"

#include <inkognito/core/file_io.hpp>

#include <algorithm>
#include <cctype>

namespace inkognito::documents {

auto is_text_document(const std::filesystem::path& path) -> bool {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".md" || extension == ".markdown" || extension == ".txt";
}

auto read_document(const std::filesystem::path& path) -> Result<std::string> {
    if (!is_text_document(path)) {
        return inkognito_error<std::string>(
            error_codes::unsupported_document,
            "No extractor available for " + path.extension().string() + " documents",
            path.string());
    }
    return core::read_file(path);
}

}  // namespace inkognito::documents
