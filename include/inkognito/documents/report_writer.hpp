/**
 * @file report_writer.hpp
 * @brief Markdown summary reports for each command
 */

#pragma once

#include "segmenter.hpp"

#include <inkognito/anonymization/anonymization_pipeline.hpp>
#include <inkognito/anonymization/restoration_pipeline.hpp>
#include <inkognito/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace inkognito::documents {

/**
 * @brief Context shared by all reports
 */
struct report_context {
    /// ISO-8601 generation time
    std::string generated_at;

    std::filesystem::path output_directory;
};

/**
 * @brief REPORT.md: files processed, statistics, failures, vault location
 */
[[nodiscard]] auto render_anonymization_report(const report_context& context,
                                               const anonymization::batch_result& batch)
    -> std::string;

/**
 * @brief RESTORATION_REPORT.md: files restored and replacements per file
 */
[[nodiscard]] auto render_restoration_report(const report_context& context,
                                             const anonymization::restoration_result& result,
                                             const std::filesystem::path& vault_path,
                                             const std::vector<std::string>& failures = {})
    -> std::string;

/**
 * @brief SEGMENTATION_REPORT.md: one entry per segment with its heading context
 */
[[nodiscard]] auto render_segmentation_report(const report_context& context,
                                              std::string_view source_name,
                                              const segment_options& options,
                                              const std::vector<segment>& segments)
    -> std::string;

/**
 * @brief PROMPT_REPORT.md: one entry per prompt
 */
[[nodiscard]] auto render_prompt_report(const report_context& context,
                                        std::string_view source_name,
                                        const prompt_options& options,
                                        const std::vector<prompt>& prompts) -> std::string;

/**
 * @brief Write a report atomically
 * @return Success, or persistence_failure
 */
[[nodiscard]] auto write_report(const std::filesystem::path& path, std::string_view content)
    -> VoidResult;

}  // namespace inkognito::documents
