/**
 * @file pattern_detector.cpp
 * @brief Implementation of the regular-expression detector
 */

#include "inkognito/anonymization/pattern_detector.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace inkognito::anonymization {

using core::entity_type;

namespace {

struct pattern_source {
    entity_type type;
    const char* expression;
};

// Unbroken runs longer than this (embedded base64 images, minified data)
// are skipped. Every quantifier below is bounded as well, since std::regex
// recurses once per matched character.
constexpr std::size_t kLongestToken = 4096;

// Listed in priority order for matches with the same start and length
constexpr pattern_source kPatterns[] = {
    {entity_type::email_address,
     R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(?:\.[A-Za-z0-9-]{1,63}){0,8}\.[A-Za-z]{2,63})"},
    {entity_type::url, R"(https?://[^\s<>"'()\[\]]{1,2047}[^\s<>"'()\[\].,;:!?])"},
    {entity_type::ip_address,
     R"(\b(?:(?:25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9]?[0-9])\.){3}(?:25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9]?[0-9])\b)"},
    {entity_type::us_ssn, R"(\b[0-9]{3}-[0-9]{2}-[0-9]{4}\b)"},
    {entity_type::credit_card, R"(\b(?:[0-9]{4}[ -]?){3}[0-9]{4}\b)"},
    {entity_type::phone_number,
     R"((?:\+1[ .-]?)?(?:\([0-9]{3}\) ?|\b[0-9]{3}[ .-])[0-9]{3}[ .-][0-9]{4}\b)"},
    {entity_type::date_time,
     R"(\b[0-9]{4}-[0-9]{2}-[0-9]{2}(?:[T ][0-9]{2}:[0-9]{2}(?::[0-9]{2})?)?\b|\b[0-9]{1,2}/[0-9]{1,2}/[0-9]{2,4}\b)"},
    {entity_type::crypto,
     R"(\b0x[0-9a-fA-F]{40}\b|\b(?:bc1|[13])[a-km-zA-HJ-NP-Z1-9]{25,39}\b)"},
};

/// Luhn checksum over the digits of a candidate card number
auto passes_luhn(std::string_view candidate) -> bool {
    int sum = 0;
    int count = 0;
    bool double_it = false;
    for (auto it = candidate.rbegin(); it != candidate.rend(); ++it) {
        if (!std::isdigit(static_cast<unsigned char>(*it))) {
            continue;
        }
        int digit = *it - '0';
        if (double_it) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_it = !double_it;
        ++count;
    }
    return count >= 13 && sum % 10 == 0;
}

struct match {
    std::size_t position;
    std::size_t length;
    std::size_t priority;
    entity_type type;
};

struct region {
    std::size_t offset;
    std::string_view text;
};

auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Pieces of text left after cutting out runs longer than kLongestToken
auto scannable_regions(std::string_view text) -> std::vector<region> {
    std::vector<region> regions;
    std::size_t region_start = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (is_space(text[pos])) {
            ++pos;
            continue;
        }
        std::size_t run_start = pos;
        while (pos < text.size() && !is_space(text[pos])) {
            ++pos;
        }
        if (pos - run_start > kLongestToken) {
            if (run_start > region_start) {
                regions.push_back(
                    {region_start, text.substr(region_start, run_start - region_start)});
            }
            region_start = pos;
        }
    }
    if (region_start < text.size()) {
        regions.push_back({region_start, text.substr(region_start)});
    }
    return regions;
}

}  // namespace

pattern_detector::pattern_detector(std::vector<entity_type> allowed) {
    for (const auto& source : kPatterns) {
        if (std::find(allowed.begin(), allowed.end(), source.type) == allowed.end()) {
            continue;
        }
        patterns_.push_back({source.type, std::regex(source.expression)});
    }
}

auto pattern_detector::supported_types() -> std::vector<entity_type> {
    std::vector<entity_type> types;
    for (const auto& source : kPatterns) {
        types.push_back(source.type);
    }
    return types;
}

auto pattern_detector::scan(std::string_view text) -> Result<std::vector<detection>> {
    std::vector<match> matches;

    try {
        for (const auto& piece : scannable_regions(text)) {
            for (std::size_t priority = 0; priority < patterns_.size(); ++priority) {
                const auto& current = patterns_[priority];
                auto begin = std::cregex_iterator(piece.text.data(),
                                                  piece.text.data() + piece.text.size(),
                                                  current.expression);
                for (auto it = begin; it != std::cregex_iterator(); ++it) {
                    const auto& found = *it;
                    if (found.length(0) == 0) {
                        continue;
                    }
                    auto position = piece.offset + static_cast<std::size_t>(found.position(0));
                    auto length = static_cast<std::size_t>(found.length(0));
                    if (current.type == entity_type::credit_card &&
                        !passes_luhn(text.substr(position, length))) {
                        continue;
                    }
                    matches.push_back({position, length, priority, current.type});
                }
            }
        }
    } catch (const std::regex_error& e) {
        return inkognito_error<std::vector<detection>>(
            error_codes::detection_failure,
            std::string{"Pattern matching failed: "} + e.what());
    }

    std::sort(matches.begin(), matches.end(), [](const match& a, const match& b) {
        if (a.position != b.position) {
            return a.position < b.position;
        }
        if (a.length != b.length) {
            return a.length > b.length;
        }
        return a.priority < b.priority;
    });

    std::vector<detection> detections;
    std::size_t covered_until = 0;
    for (const auto& candidate : matches) {
        if (candidate.position < covered_until) {
            continue;
        }
        detections.push_back({candidate.type,
                              std::string{text.substr(candidate.position, candidate.length)},
                              match_confidence});
        covered_until = candidate.position + candidate.length;
    }

    return detections;
}

}  // namespace inkognito::anonymization
