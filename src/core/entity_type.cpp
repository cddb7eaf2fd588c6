/**
 * @file entity_type.cpp
 * @brief Entity type name parsing
 */

#include "inkognito/core/entity_type.hpp"

#include <algorithm>
#include <cctype>

namespace inkognito::core {

namespace {

auto to_upper(std::string_view value) -> std::string {
    std::string result{value};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

}  // namespace

auto entity_type_from_string(std::string_view name)
    -> std::optional<entity_type> {
    const auto upper = to_upper(name);

    for (auto type : all_entity_types) {
        if (upper == to_string(type)) {
            return type;
        }
    }

    if (upper == "US_DRIVER_LICENSE") return entity_type::driver_license;
    if (upper == "US_BANK_NUMBER") return entity_type::bank_number;
    if (upper == "UNKNOWN") return entity_type::unknown;

    return std::nullopt;
}

auto classify_entity_type(std::string_view name) -> entity_type {
    return entity_type_from_string(name).value_or(entity_type::unknown);
}

}  // namespace inkognito::core
