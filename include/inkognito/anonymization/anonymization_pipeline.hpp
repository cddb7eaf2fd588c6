/**
 * @file anonymization_pipeline.hpp
 * @brief Batch anonymization with consistent replacement across documents
 *
 * This file provides the anonymization_pipeline class, which runs the
 * detector over each document of a batch, substitutes every detected value
 * through two-phase placeholder replacement, and resolves placeholders to
 * synthetic values from one session mapping table shared by the batch.
 */

#pragma once

#include "detection.hpp"
#include "mapping_table.hpp"
#include "replacement_generator.hpp"
#include "vault.hpp"

#include <inkognito/core/entity_type.hpp>
#include <inkognito/core/result.hpp>
#include <inkognito/di/ilogger.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace inkognito::anonymization {

/**
 * @brief Immutable configuration fixed at pipeline construction
 */
struct pipeline_config {
    /// Entity types acted upon; UNKNOWN detections are always processed
    std::vector<core::entity_type> entity_types{core::all_entity_types.begin(),
                                                core::all_entity_types.end()};

    /// Detections below this confidence are discarded
    double score_threshold{0.5};

    /// Half-width in days of the window the batch date offset is drawn from
    int date_shift_days{365};

    /// Fixed generator seed; nullopt draws a fresh seed per batch
    std::optional<std::uint64_t> seed;

    /**
     * @brief Check whether a detection of this type is acted upon
     */
    [[nodiscard]] auto allows(core::entity_type type) const -> bool;

    /**
     * @brief Validate ranges
     * @return invalid_argument if the threshold is outside [0, 1] or the
     *         date-shift window is negative
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

/**
 * @brief A document submitted for anonymization or restoration
 */
struct source_document {
    /// Caller-chosen identifier, usually the file path
    std::string id;

    std::string text;
};

/**
 * @brief Outcome for one document of a batch
 */
struct file_outcome {
    std::string id;

    /// Anonymized text; empty when the file failed
    std::optional<std::string> text;

    /// Failure reason; set exactly when text is empty
    std::optional<error_info> failure;

    /// Occurrences replaced in this file, per type
    entity_counts counts;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return text.has_value(); }
};

/**
 * @brief Everything a batch produced
 */
struct batch_result {
    /// One outcome per input document, in input order
    std::vector<file_outcome> files;

    /// Occurrence counts per type, summed over successful files
    entity_counts statistics;

    /// Seed table plus every pair discovered in this batch
    mapping_table mappings;

    /// Date-shift offset drawn once for the whole batch
    std::int64_t date_offset{0};

    /// Set by callers that persisted the mappings
    std::optional<std::filesystem::path> vault_path;

    /**
     * @brief Record a document that produced no output
     */
    void add_failure(std::string id, error_info reason);

    [[nodiscard]] auto succeeded_count() const noexcept -> std::size_t;

    [[nodiscard]] auto failed_count() const noexcept -> std::size_t;

    /**
     * @brief Total occurrences replaced across the batch
     */
    [[nodiscard]] auto total_replacements() const noexcept -> std::size_t;
};

/**
 * @brief Orchestrates detection, substitution and generation for a batch
 *
 * Documents are processed sequentially. Each call to anonymize_batch()
 * owns a fresh replacement generator and session table, so concurrent
 * calls on distinct pipelines share no mutable state. A failure on one
 * document is recorded in the result and the batch continues.
 *
 * @example
 * @code
 * anonymization_pipeline pipeline(detector);
 * auto result = pipeline.anonymize_batch({{"a.md", "Contact John Smith"}});
 * if (result.is_ok()) {
 *     auto vault = make_vault_record(result.value().mappings,
 *                                    result.value().date_offset,
 *                                    result.value().succeeded_count(),
 *                                    result.value().statistics);
 * }
 * @endcode
 */
class anonymization_pipeline {
public:
    /**
     * @brief Construct a pipeline
     * @param detector Entity detector consulted for every document
     * @param config Allow-list, threshold and date-shift window
     * @param logger Logger for progress and failures (null logger if empty)
     */
    explicit anonymization_pipeline(std::shared_ptr<entity_detector> detector,
                                    pipeline_config config = {},
                                    std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Anonymize a batch of documents
     *
     * @param documents Documents in processing order
     * @param seed Mapping table from an earlier batch; its pairs are reused
     *        and never regenerated
     * @param stop Cancellation is checked between documents; documents not
     *        reached are recorded as batch_cancelled failures
     * @return The batch result, or invalid_argument if the pipeline has no
     *         detector or an invalid configuration
     */
    [[nodiscard]] auto anonymize_batch(const std::vector<source_document>& documents,
                                       const std::optional<mapping_table>& seed = std::nullopt,
                                       std::stop_token stop = {}) -> Result<batch_result>;

    /**
     * @brief Replace detected values with placeholder tokens only
     *
     * Returns the intermediate text of the first substitution phase, in
     * which every detected value reads "[REDACTED_<TYPE>_<n>]". No synthetic
     * values are generated.
     *
     * @param text Document text
     * @return Placeholder text, or detection_failure
     */
    [[nodiscard]] auto redact_text(std::string_view text) -> Result<std::string>;

    [[nodiscard]] auto config() const noexcept -> const pipeline_config&;

private:
    struct substitution {
        std::string text;
        entity_counts counts;
    };

    [[nodiscard]] auto detect(std::string_view text) -> Result<std::vector<detection>>;

    [[nodiscard]] auto retain(std::vector<detection> detections) const
        -> std::vector<detection>;

    [[nodiscard]] auto anonymize_document(std::string_view text,
                                          replacement_generator& generator,
                                          mapping_table& table) -> Result<substitution>;

    std::shared_ptr<entity_detector> detector_;
    pipeline_config config_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace inkognito::anonymization
