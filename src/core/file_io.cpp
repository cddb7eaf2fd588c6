/**
 * @file file_io.cpp
 * @brief Implementation of whole-file text I/O
 */

#include "inkognito/core/file_io.hpp"

#include <fstream>
#include <random>
#include <sstream>

namespace inkognito::core {

namespace {

/// Generate a unique temporary filename next to the target
auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." +
                     std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

}  // namespace

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return inkognito_error<std::string>(error_codes::file_not_found,
                                            "File not found: " + path.string());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return inkognito_error<std::string>(error_codes::file_read_error,
                                            "Failed to open file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return inkognito_error<std::string>(error_codes::file_read_error,
                                            "Failed to read file: " + path.string());
    }

    return buffer.str();
}

auto write_file_atomically(const std::filesystem::path& path,
                           std::string_view content) -> VoidResult {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return inkognito_void_error(error_codes::file_write_error,
                                        "Failed to create directory: " + ec.message(),
                                        path.parent_path().string());
        }
    }

    auto temp_path = generate_temp_filename(path);
    {
        std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return inkognito_void_error(error_codes::file_write_error,
                                        "Failed to create temp file: " +
                                            temp_path.string());
        }
        stream.write(content.data(), static_cast<std::streamsize>(content.size()));
        stream.flush();
        if (!stream) {
            stream.close();
            std::filesystem::remove(temp_path, ec);
            return inkognito_void_error(error_codes::file_write_error,
                                        "Failed to write temp file: " +
                                            temp_path.string());
        }
    }

    // Atomic rename
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        auto message = "Failed to rename temp file: " + ec.message();
        std::filesystem::remove(temp_path, ec);
        return inkognito_void_error(error_codes::file_write_error, message,
                                    path.string());
    }

    return ok();
}

}  // namespace inkognito::core
