/**
 * @file placeholder_text.cpp
 * @brief Implementation of the two-phase substitution primitive
 */

#include "inkognito/anonymization/placeholder_text.hpp"

#include <algorithm>
#include <map>

namespace inkognito::anonymization {

auto make_placeholder(core::entity_type type, std::size_t ordinal) -> std::string {
    std::string token = "[REDACTED_";
    token += core::to_string(type);
    token += '_';
    token += std::to_string(ordinal);
    token += ']';
    return token;
}

placeholder_text::placeholder_text(std::string text) {
    pieces_.push_back({std::move(text), std::nullopt});
}

auto placeholder_text::bind(std::string_view value, std::size_t slot) -> std::size_t {
    if (value.empty()) {
        return 0;
    }

    std::size_t count = 0;
    std::vector<piece> result;
    result.reserve(pieces_.size());

    for (auto& current : pieces_) {
        if (current.slot.has_value()) {
            result.push_back(std::move(current));
            continue;
        }

        const std::string& text = current.text;
        std::size_t start = 0;
        auto pos = text.find(value);
        if (pos == std::string::npos) {
            result.push_back(std::move(current));
            continue;
        }

        while (pos != std::string::npos) {
            if (pos > start) {
                result.push_back({text.substr(start, pos - start), std::nullopt});
            }
            result.push_back({std::string{value}, slot});
            ++count;
            start = pos + value.size();
            pos = text.find(value, start);
        }
        if (start < text.size()) {
            result.push_back({text.substr(start), std::nullopt});
        }
    }

    pieces_ = std::move(result);
    return count;
}

auto placeholder_text::bound_slots() const -> std::vector<std::size_t> {
    std::vector<std::size_t> slots;
    for (const auto& current : pieces_) {
        if (current.slot.has_value() &&
            std::find(slots.begin(), slots.end(), *current.slot) == slots.end()) {
            slots.push_back(*current.slot);
        }
    }
    return slots;
}

auto placeholder_text::render(const slot_resolver& resolver) const -> std::string {
    std::map<std::size_t, std::string> resolved;
    for (auto slot : bound_slots()) {
        resolved.emplace(slot, resolver(slot));
    }

    std::string output;
    for (const auto& current : pieces_) {
        if (current.slot.has_value()) {
            output += resolved.at(*current.slot);
        } else {
            output += current.text;
        }
    }
    return output;
}

}  // namespace inkognito::anonymization
