/**
 * @file mapping_table.cpp
 * @brief Implementation of the session mapping table
 */

#include "inkognito/anonymization/mapping_table.hpp"

namespace inkognito::anonymization {

auto mapping_table::add_mapping(std::string_view original,
                                std::string_view synthetic) -> VoidResult {
    if (original.empty()) {
        return inkognito_void_error(error_codes::invalid_argument,
                                    "Original value must not be empty");
    }

    auto existing = index_.find(original);
    if (existing != index_.end()) {
        if (entries_[existing->second].second != synthetic) {
            return inkognito_void_error(
                error_codes::invalid_argument,
                "Original value already mapped to a different synthetic value");
        }
        return ok();
    }

    index_.emplace(std::string{original}, entries_.size());
    entries_.emplace_back(std::string{original}, std::string{synthetic});
    ++synthetic_counts_[std::string{synthetic}];

    return ok();
}

auto mapping_table::get_synthetic(std::string_view original) const
    -> std::optional<std::string> {
    auto it = index_.find(original);
    if (it != index_.end()) {
        return entries_[it->second].second;
    }
    return std::nullopt;
}

auto mapping_table::contains(std::string_view original) const -> bool {
    return index_.contains(original);
}

auto mapping_table::contains_synthetic(std::string_view synthetic) const -> bool {
    return synthetic_counts_.contains(synthetic);
}

auto mapping_table::size() const noexcept -> std::size_t {
    return entries_.size();
}

auto mapping_table::empty() const noexcept -> bool {
    return entries_.empty();
}

auto mapping_table::entries() const noexcept -> const std::vector<entry>& {
    return entries_;
}

void mapping_table::clear() {
    entries_.clear();
    index_.clear();
    synthetic_counts_.clear();
}

auto mapping_table::merge(const mapping_table& other) -> std::size_t {
    std::size_t added = 0;
    for (const auto& [original, synthetic] : other.entries_) {
        if (!contains(original)) {
            index_.emplace(original, entries_.size());
            entries_.emplace_back(original, synthetic);
            ++synthetic_counts_[synthetic];
            ++added;
        }
    }
    return added;
}

}  // namespace inkognito::anonymization
