/**
 * @file pattern_detector.hpp
 * @brief Regular-expression detector for structured identifiers
 *
 * Recognizes identifiers with a fixed shape (e-mail addresses, URLs, IP
 * addresses, social security numbers, payment card numbers, phone numbers,
 * dates and crypto wallet addresses). Free-form entities such as names and
 * organizations need a model and are not detected here.
 */

#pragma once

#include "detection.hpp"

#include <inkognito/core/entity_type.hpp>
#include <inkognito/core/result.hpp>

#include <regex>
#include <string_view>
#include <vector>

namespace inkognito::anonymization {

/**
 * @brief entity_detector backed by std::regex patterns
 *
 * Every match is reported with confidence 0.85. When matches overlap, the
 * one starting first is kept, and among those starting together the longest.
 * Payment card candidates must pass the Luhn check.
 */
class pattern_detector final : public entity_detector {
public:
    /// Confidence attached to every match
    static constexpr double match_confidence = 0.85;

    /**
     * @brief Construct a detector
     * @param allowed Types to report; types outside supported_types() are ignored
     */
    explicit pattern_detector(
        std::vector<core::entity_type> allowed = {core::all_entity_types.begin(),
                                                  core::all_entity_types.end()});

    [[nodiscard]] auto scan(std::string_view text)
        -> Result<std::vector<detection>> override;

    /**
     * @brief Types this detector has a pattern for
     */
    [[nodiscard]] static auto supported_types() -> std::vector<core::entity_type>;

private:
    struct pattern {
        core::entity_type type;
        std::regex expression;
    };

    std::vector<pattern> patterns_;
};

}  // namespace inkognito::anonymization
