/**
 * @file mapping_table.hpp
 * @brief Session mapping table for consistent replacement across a batch
 *
 * This file provides the mapping_table class, the original -> synthetic
 * store that keeps replacements consistent across every document of one
 * anonymization batch.
 */

#pragma once

#include <inkognito/core/result.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inkognito::anonymization {

/**
 * @brief Ordered original -> synthetic mapping owned by one batch
 *
 * Keys are unique, non-empty original values. Iteration follows insertion
 * order, which is the order in which values were discovered. The table is
 * keyed by value only: the entity type a value was detected as plays no
 * part in the lookup.
 *
 * Thread Safety: This class is NOT thread-safe. A table belongs to exactly
 * one pipeline invocation.
 *
 * @example
 * @code
 * mapping_table table;
 * table.add_mapping("John Smith", "Robert Hale");
 *
 * auto synthetic = table.get_synthetic("John Smith");
 * // synthetic == "Robert Hale"
 * @endcode
 */
class mapping_table {
public:
    /// (original, synthetic) pair
    using entry = std::pair<std::string, std::string>;

    mapping_table() = default;

    // ========================================================================
    // Mapping Operations
    // ========================================================================

    /**
     * @brief Add a specific mapping
     *
     * Fails if the original is empty or already mapped to a different
     * synthetic value. Re-adding an identical pair is a no-op.
     *
     * @param original The original value
     * @param synthetic The synthetic replacement
     * @return Result indicating success or error
     */
    [[nodiscard]] auto add_mapping(std::string_view original,
                                   std::string_view synthetic) -> VoidResult;

    /**
     * @brief Look up the synthetic value for an original
     * @param original The original value
     * @return Optional containing the synthetic value, or nullopt
     */
    [[nodiscard]] auto get_synthetic(std::string_view original) const
        -> std::optional<std::string>;

    // ========================================================================
    // Query Operations
    // ========================================================================

    [[nodiscard]] auto contains(std::string_view original) const -> bool;

    /**
     * @brief Check whether any original already maps to a synthetic value
     */
    [[nodiscard]] auto contains_synthetic(std::string_view synthetic) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto empty() const noexcept -> bool;

    /**
     * @brief All pairs in discovery order
     */
    [[nodiscard]] auto entries() const noexcept -> const std::vector<entry>&;

    // ========================================================================
    // Management Operations
    // ========================================================================

    void clear();

    /**
     * @brief Merge mappings from another table
     *
     * Adds every pair from 'other' whose original is not yet present,
     * preserving the other table's order. Existing pairs are never
     * overwritten.
     *
     * @param other The table to merge from
     * @return Number of mappings added
     */
    auto merge(const mapping_table& other) -> std::size_t;

    auto operator==(const mapping_table& other) const -> bool {
        return entries_ == other.entries_;
    }

private:
    /// Pairs in insertion order
    std::vector<entry> entries_;

    /// original -> position in entries_
    std::map<std::string, std::size_t, std::less<>> index_;

    /// synthetic -> number of originals mapped to it
    std::map<std::string, std::size_t, std::less<>> synthetic_counts_;
};

}  // namespace inkognito::anonymization
