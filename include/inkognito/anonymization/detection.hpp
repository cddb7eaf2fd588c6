/**
 * @file detection.hpp
 * @brief Detected sensitive spans and the detector seam
 *
 * The entity-detection model lives outside this library. It is consumed
 * through the entity_detector interface, which returns typed spans with a
 * confidence score for a piece of text.
 */

#pragma once

#include <inkognito/core/entity_type.hpp>
#include <inkognito/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace inkognito::anonymization {

/**
 * @brief A sensitive span reported by a detector
 */
struct detection {
    /// Validated entity category
    core::entity_type type{core::entity_type::unknown};

    /// Literal text of the span as it appears in the document
    std::string value;

    /// Detector confidence in [0, 1]
    double confidence{0.0};

    /**
     * @brief Build a detection from a detector-reported type name
     *
     * Unrecognized names become entity_type::unknown.
     */
    [[nodiscard]] static auto from_raw(std::string_view type_name,
                                       std::string value,
                                       double confidence) -> detection {
        return {core::classify_entity_type(type_name), std::move(value), confidence};
    }

    auto operator==(const detection&) const -> bool = default;
};

/**
 * @brief Interface to an entity-detection model
 *
 * Implementations may be slow (model inference, a remote service). A
 * failure is reported through the Result and is treated by the pipeline as
 * a recoverable per-file failure.
 */
class entity_detector {
public:
    virtual ~entity_detector() = default;

    /**
     * @brief Detect sensitive spans in a text
     * @param text Raw document text
     * @return Detections in the order the detector found them
     */
    [[nodiscard]] virtual auto scan(std::string_view text)
        -> Result<std::vector<detection>> = 0;

protected:
    entity_detector() = default;
    entity_detector(const entity_detector&) = default;
    entity_detector& operator=(const entity_detector&) = default;
};

}  // namespace inkognito::anonymization
