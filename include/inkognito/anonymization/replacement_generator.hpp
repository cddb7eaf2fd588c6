/**
 * @file replacement_generator.hpp
 * @brief Type-aware synthetic value generation with session consistency
 *
 * This file provides the replacement_generator class, which maps an
 * (entity type, original value) pair to a realistic synthetic value and
 * records the pair in the caller's session mapping table.
 */

#pragma once

#include "mapping_table.hpp"

#include <inkognito/core/entity_type.hpp>
#include <inkognito/core/result.hpp>
#include <inkognito/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace inkognito::anonymization {

/**
 * @brief Generates synthetic replacements for sensitive values
 *
 * The generator owns only its random engine; the mapping state lives in
 * the mapping_table passed to each call. A value already present in the
 * table is returned unchanged, so every occurrence of an original within a
 * batch receives the same replacement.
 *
 * Each instance is seeded once. Two generators constructed without an
 * explicit seed draw from std::random_device and are not expected to agree,
 * so identical content in independent batches gets unrelated replacements.
 *
 * Thread Safety: This class is NOT thread-safe. Create one per batch.
 *
 * @example
 * @code
 * mapping_table table;
 * replacement_generator generator;
 *
 * auto first = generator.generate(core::entity_type::person, "John Smith", table);
 * auto again = generator.generate(core::entity_type::person, "John Smith", table);
 * // first.value() == again.value()
 * @endcode
 */
class replacement_generator {
public:
    /**
     * @brief Construct a generator
     * @param seed Fixed seed, or nullopt to seed from std::random_device
     * @param logger Logger for fallback notices (null logger if empty)
     */
    explicit replacement_generator(std::optional<std::uint64_t> seed = std::nullopt,
                                   std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Get the cached replacement or create a new one
     *
     * If the original is already a key in the table its synthetic value is
     * returned regardless of the requested type. Otherwise a value is
     * generated for the type, inserted into the table and returned. Types
     * without a dedicated generator fall back to "REDACTED_<TYPE>".
     *
     * Newly generated values never equal a synthetic value already in the
     * table or the original itself, which keeps the table invertible.
     *
     * @param type Entity type the value was detected as
     * @param original The original value (must not be empty)
     * @param table Session mapping table (extended on a miss)
     * @return Result containing the synthetic value
     */
    [[nodiscard]] auto generate(core::entity_type type,
                                std::string_view original,
                                mapping_table& table) -> Result<std::string>;

    /**
     * @brief Draw a date-shift offset uniformly from [-window, window]
     * @param window_days Half-width of the window in days (negative treated as 0)
     * @return Offset in days
     */
    [[nodiscard]] auto draw_date_offset(int window_days) -> std::int64_t;

    /**
     * @brief Check whether a type has a dedicated generator
     */
    [[nodiscard]] static auto has_dedicated_generator(core::entity_type type) noexcept
        -> bool;

    /**
     * @brief Seed the engine was initialized with
     */
    [[nodiscard]] auto seed() const noexcept -> std::uint64_t;

private:
    [[nodiscard]] auto synthesize(core::entity_type type) -> std::string;

    [[nodiscard]] auto fallback_value(core::entity_type type,
                                      const mapping_table& table) const -> std::string;

    // Type-specific generators
    [[nodiscard]] auto person_name() -> std::string;
    [[nodiscard]] auto organization_name() -> std::string;
    [[nodiscard]] auto location_name() -> std::string;
    [[nodiscard]] auto email_address() -> std::string;
    [[nodiscard]] auto phone_number() -> std::string;
    [[nodiscard]] auto credit_card_number() -> std::string;
    [[nodiscard]] auto ssn() -> std::string;
    [[nodiscard]] auto passport_number() -> std::string;
    [[nodiscard]] auto driver_license_number() -> std::string;
    [[nodiscard]] auto ipv4_address() -> std::string;
    [[nodiscard]] auto date_time_string() -> std::string;
    [[nodiscard]] auto web_url() -> std::string;
    [[nodiscard]] auto bank_account() -> std::string;
    [[nodiscard]] auto crypto_address() -> std::string;
    [[nodiscard]] auto medical_license_number() -> std::string;

    // Primitives
    [[nodiscard]] auto uniform(int low, int high) -> int;
    [[nodiscard]] auto digits(std::size_t count) -> std::string;
    [[nodiscard]] auto letters(std::size_t count) -> std::string;

    template <typename Container>
    [[nodiscard]] auto pick(const Container& items) -> const auto& {
        return items[static_cast<std::size_t>(
            uniform(0, static_cast<int>(std::size(items)) - 1))];
    }

    std::uint64_t seed_;
    std::mt19937_64 engine_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace inkognito::anonymization
