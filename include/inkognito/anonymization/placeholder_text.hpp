/**
 * @file placeholder_text.hpp
 * @brief Two-phase substitution primitive shared by anonymization and restoration
 *
 * A placeholder_text starts as plain text. Phase one binds literal
 * occurrences of search values to numbered slots; bound spans are never
 * searched again, so a later (shorter) value cannot match inside a span
 * that was already bound, nor inside a placeholder. Phase two renders the
 * text, resolving each slot to its final value exactly once.
 */

#pragma once

#include <inkognito/core/entity_type.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkognito::anonymization {

/**
 * @brief Build the display token for a placeholder slot
 *
 * Tokens are "[REDACTED_<TYPE>_<n>]". The closing delimiter guarantees no
 * token is a prefix of another.
 *
 * @param type Entity type of the bound value
 * @param ordinal 1-based index of the value within its type
 */
[[nodiscard]] auto make_placeholder(core::entity_type type, std::size_t ordinal)
    -> std::string;

/**
 * @brief Text with literal spans bound to placeholder slots
 */
class placeholder_text {
public:
    /// Resolves a slot number to the text rendered in its place
    using slot_resolver = std::function<std::string(std::size_t)>;

    explicit placeholder_text(std::string text);

    /**
     * @brief Bind every literal occurrence of a value to a slot
     *
     * Only text that is not yet bound is searched. Occurrences are found
     * left to right and do not overlap.
     *
     * @param value The literal value to search for (empty values bind nothing)
     * @param slot Slot number the occurrences are bound to
     * @return Number of occurrences bound
     */
    auto bind(std::string_view value, std::size_t slot) -> std::size_t;

    /**
     * @brief Slots that have at least one bound occurrence, in first-use order
     */
    [[nodiscard]] auto bound_slots() const -> std::vector<std::size_t>;

    /**
     * @brief Render the text, calling the resolver once per distinct slot
     * @param resolver Maps a slot number to its replacement text
     */
    [[nodiscard]] auto render(const slot_resolver& resolver) const -> std::string;

private:
    struct piece {
        std::string text;
        std::optional<std::size_t> slot;
    };

    std::vector<piece> pieces_;
};

}  // namespace inkognito::anonymization
