/**
 * @file file_discovery.cpp
 * @brief Implementation of input document discovery
 */

#include "inkognito/documents/file_discovery.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace inkognito::documents {

namespace fs = std::filesystem;

namespace {

auto matches_any(const std::vector<std::string>& patterns, const std::string& name) -> bool {
    return std::any_of(patterns.begin(), patterns.end(), [&name](const std::string& p) {
        return glob_match(p, name);
    });
}

template <typename Iterator>
auto collect(const fs::path& directory, const std::vector<std::string>& patterns,
             std::set<fs::path>& found) -> VoidResult {
    std::error_code ec;
    Iterator it(directory, ec);
    for (const Iterator end{}; !ec && it != end; it.increment(ec)) {
        std::error_code status_ec;
        if (it->is_regular_file(status_ec) &&
            matches_any(patterns, it->path().filename().string())) {
            found.insert(fs::absolute(it->path()));
        }
    }
    if (ec) {
        return inkognito_void_error(error_codes::file_read_error,
                                    "Directory scan failed: " + ec.message(),
                                    directory.string());
    }
    return ok();
}

}  // namespace

auto glob_match(std::string_view pattern, std::string_view name) -> bool {
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

auto find_files(const std::vector<fs::path>& files,
                const std::optional<fs::path>& directory,
                const discovery_options& options) -> Result<std::vector<fs::path>> {
    std::error_code ec;

    if (!files.empty()) {
        std::vector<fs::path> found;
        for (const auto& file : files) {
            if (!fs::exists(file, ec)) {
                return inkognito_error<std::vector<fs::path>>(
                    error_codes::file_not_found, "File not found: " + file.string());
            }
            auto absolute = fs::absolute(file);
            if (std::find(found.begin(), found.end(), absolute) == found.end()) {
                found.push_back(std::move(absolute));
            }
        }
        return found;
    }

    if (directory.has_value()) {
        if (!fs::is_directory(*directory, ec)) {
            return inkognito_error<std::vector<fs::path>>(
                error_codes::directory_not_found,
                "Directory not found: " + directory->string());
        }

        std::set<fs::path> found;
        auto scanned = options.recursive
            ? collect<fs::recursive_directory_iterator>(*directory, options.patterns, found)
            : collect<fs::directory_iterator>(*directory, options.patterns, found);
        if (scanned.is_err()) {
            return Result<std::vector<fs::path>>(scanned.error());
        }
        return std::vector<fs::path>(found.begin(), found.end());
    }

    return inkognito_error<std::vector<fs::path>>(
        error_codes::invalid_argument, "Either files or a directory must be provided");
}

auto output_file_names(const std::vector<fs::path>& files, std::string_view extension)
    -> std::vector<fs::path> {
    std::vector<fs::path> names;
    names.reserve(files.size());
    std::set<std::string> taken;

    for (const auto& file : files) {
        const auto stem = file.stem().string();
        const auto suffix = extension.empty() ? file.extension().string()
                                              : std::string{extension};

        auto candidate = stem + suffix;
        for (std::size_t counter = 2; taken.count(candidate) != 0; ++counter) {
            candidate = stem + "_" + std::to_string(counter) + suffix;
        }
        taken.insert(candidate);
        names.emplace_back(candidate);
    }
    return names;
}

}  // namespace inkognito::documents
