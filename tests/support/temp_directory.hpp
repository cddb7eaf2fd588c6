/**
 * @file temp_directory.hpp
 * @brief Scoped temporary directory for filesystem tests
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

namespace inkognito::test {

/**
 * @brief RAII wrapper that creates a unique directory and removes it on exit
 */
class temp_directory {
public:
    explicit temp_directory(std::string_view prefix = "inkognito_test") {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (std::string{prefix} + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    temp_directory& operator=(const temp_directory&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Write a file below the directory, creating parents as needed
     */
    auto write(const std::filesystem::path& relative, std::string_view content) const
        -> std::filesystem::path {
        auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream file(target, std::ios::binary);
        file << content;
        return target;
    }

private:
    std::filesystem::path path_;
};

}  // namespace inkognito::test
