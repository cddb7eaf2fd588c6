/**
 * @file entity_type.hpp
 * @brief Closed enumeration of sensitive entity categories
 *
 * Detectors report free-form type names; they are validated into this
 * enumeration at the detector boundary. Names that do not match a known
 * category become entity_type::unknown and are handled by the generic
 * replacement fallback.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace inkognito::core {

/**
 * @brief Categories of sensitive data the engine knows how to replace
 */
enum class entity_type : std::uint8_t {
    person = 0,
    organization = 1,
    location = 2,
    email_address = 3,
    phone_number = 4,
    credit_card = 5,
    us_ssn = 6,
    passport = 7,
    driver_license = 8,
    ip_address = 9,
    date_time = 10,
    url = 11,
    bank_number = 12,
    crypto = 13,
    medical_license = 14,
    unknown = 15
};

/// All known categories, in declaration order (unknown excluded)
inline constexpr std::array<entity_type, 15> all_entity_types{
    entity_type::person,        entity_type::organization,
    entity_type::location,      entity_type::email_address,
    entity_type::phone_number,  entity_type::credit_card,
    entity_type::us_ssn,        entity_type::passport,
    entity_type::driver_license, entity_type::ip_address,
    entity_type::date_time,     entity_type::url,
    entity_type::bank_number,   entity_type::crypto,
    entity_type::medical_license};

/**
 * @brief Canonical upper-case name used in vaults, reports and placeholders
 * @param type The entity type
 * @return Name such as "PERSON" or "EMAIL_ADDRESS"
 */
[[nodiscard]] constexpr auto to_string(entity_type type) noexcept
    -> std::string_view {
    switch (type) {
        case entity_type::person:
            return "PERSON";
        case entity_type::organization:
            return "ORGANIZATION";
        case entity_type::location:
            return "LOCATION";
        case entity_type::email_address:
            return "EMAIL_ADDRESS";
        case entity_type::phone_number:
            return "PHONE_NUMBER";
        case entity_type::credit_card:
            return "CREDIT_CARD";
        case entity_type::us_ssn:
            return "US_SSN";
        case entity_type::passport:
            return "PASSPORT";
        case entity_type::driver_license:
            return "DRIVER_LICENSE";
        case entity_type::ip_address:
            return "IP_ADDRESS";
        case entity_type::date_time:
            return "DATE_TIME";
        case entity_type::url:
            return "URL";
        case entity_type::bank_number:
            return "BANK_NUMBER";
        case entity_type::crypto:
            return "CRYPTO";
        case entity_type::medical_license:
            return "MEDICAL_LICENSE";
        case entity_type::unknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a canonical or detector-specific type name
 *
 * Accepts the canonical names plus the US-prefixed aliases some detectors
 * emit ("US_DRIVER_LICENSE", "US_BANK_NUMBER"). Matching is case-insensitive.
 *
 * @param name Type name
 * @return The entity type, or nullopt if the name is not recognized
 */
[[nodiscard]] auto entity_type_from_string(std::string_view name)
    -> std::optional<entity_type>;

/**
 * @brief Validate a detector-reported type name
 * @param name Type name as reported by a detector
 * @return The matching type, or entity_type::unknown
 */
[[nodiscard]] auto classify_entity_type(std::string_view name) -> entity_type;

}  // namespace inkognito::core
