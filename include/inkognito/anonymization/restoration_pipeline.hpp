/**
 * @file restoration_pipeline.hpp
 * @brief Restores original values in anonymized documents from a vault
 */

#pragma once

#include "anonymization_pipeline.hpp"
#include "vault.hpp"

#include <inkognito/core/result.hpp>
#include <inkognito/di/ilogger.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inkognito::anonymization {

/**
 * @brief A restored document
 */
struct restored_document {
    std::string id;
    std::string text;

    /// Synthetic occurrences replaced by their originals
    std::size_t replacements{0};
};

/**
 * @brief Output of a restoration batch
 */
struct restoration_result {
    std::vector<restored_document> files;

    [[nodiscard]] auto total_replacements() const noexcept -> std::size_t;
};

/**
 * @brief Substitutes synthetic values back to their originals
 *
 * Pairs are applied longest synthetic value first (ties in lexicographic
 * order), and each replaced span is excluded from later searches. A
 * synthetic value that is a substring of a longer one therefore never
 * matches inside it, and a restored original is never scanned again.
 *
 * The pipeline holds a read-only copy of the inverted mappings; the vault
 * it came from is never modified.
 *
 * @example
 * @code
 * auto pipeline = restoration_pipeline::open("out/vault.json");
 * if (pipeline.is_ok()) {
 *     auto restored = pipeline.value().restore_text(anonymized);
 * }
 * @endcode
 */
class restoration_pipeline {
public:
    /**
     * @brief Construct from synthetic -> original pairs
     */
    explicit restoration_pipeline(reverse_mappings mappings,
                                  std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Construct from a loaded vault record
     */
    explicit restoration_pipeline(const vault_record& record,
                                  std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Load a vault file and build a pipeline from it
     * @return The pipeline, or vault_not_found / vault_format_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& vault_path,
                                   std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<restoration_pipeline>;

    /**
     * @brief Restore one text
     */
    [[nodiscard]] auto restore_text(std::string_view text) const -> restored_document;

    /**
     * @brief Restore several documents, preserving input order
     */
    [[nodiscard]] auto restore_batch(const std::vector<source_document>& documents) const
        -> restoration_result;

    [[nodiscard]] auto mapping_count() const noexcept -> std::size_t;

private:
    /// (synthetic, original) in substitution order
    std::vector<std::pair<std::string, std::string>> ordered_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace inkognito::anonymization
