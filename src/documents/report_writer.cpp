/**
 * @file report_writer.cpp
 * @brief Implementation of the Markdown reports
 */

#include "inkognito/documents/report_writer.hpp"

#include <inkognito/compat/format.hpp>
#include <inkognito/core/file_io.hpp>

#include <algorithm>
#include <numeric>

namespace inkognito::documents {

namespace {

auto join(const std::vector<std::string>& items, std::string_view separator) -> std::string {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += item;
    }
    return joined;
}

}  // namespace

auto render_anonymization_report(const report_context& context,
                                 const anonymization::batch_result& batch) -> std::string {
    std::string report = compat::format(
        "# Anonymization Report\n"
        "\n"
        "Generated: {}\n"
        "\n"
        "## Summary\n"
        "- Files processed: {}\n"
        "- Files failed: {}\n"
        "- Output directory: {}\n"
        "- Vault location: {}\n"
        "- Date offset: {} days\n"
        "\n"
        "## Statistics\n",
        context.generated_at, batch.succeeded_count(), batch.failed_count(),
        context.output_directory.string(),
        batch.vault_path ? batch.vault_path->string() : std::string{"not saved"},
        batch.date_offset);

    if (batch.statistics.empty()) {
        report += "- No sensitive values detected\n";
    }
    for (const auto& [type, count] : batch.statistics) {
        report += compat::format("- {}: {}\n", core::to_string(type), count);
    }

    if (batch.failed_count() > 0) {
        report += "\n## Failures\n";
        for (const auto& file : batch.files) {
            if (file.failure) {
                report += compat::format("- {}: {}\n", file.id, file.failure->message);
            }
        }
    }

    report += "\n## Consistency\n";
    report += "All occurrences of the same value received the same replacement across all "
              "documents.\n";
    report += "To restore original values, run the restore command with the vault file.\n";
    return report;
}

auto render_restoration_report(const report_context& context,
                               const anonymization::restoration_result& result,
                               const std::filesystem::path& vault_path,
                               const std::vector<std::string>& failures) -> std::string {
    std::string report = compat::format(
        "# Restoration Report\n"
        "\n"
        "Generated: {}\n"
        "\n"
        "## Summary\n"
        "- Files restored: {}\n"
        "- Total replacements: {}\n"
        "- Vault used: {}\n"
        "- Output directory: {}\n"
        "\n"
        "## Details\n",
        context.generated_at, result.files.size(), result.total_replacements(),
        vault_path.string(), context.output_directory.string());

    for (const auto& file : result.files) {
        report += compat::format("- {}: {} replacements\n", file.id, file.replacements);
    }

    if (!failures.empty()) {
        report += "\n## Failures\n";
        for (const auto& failure : failures) {
            report += compat::format("- {}\n", failure);
        }
    }
    return report;
}

auto render_segmentation_report(const report_context& context,
                                std::string_view source_name,
                                const segment_options& options,
                                const std::vector<segment>& segments) -> std::string {
    std::string report = compat::format(
        "# Segmentation Report\n"
        "\n"
        "Generated: {}\n"
        "\n"
        "## Summary\n"
        "- Source file: {}\n"
        "- Total segments: {}\n"
        "- Token range: {} - {}\n"
        "- Break preferences: {}\n"
        "- Output directory: {}\n",
        context.generated_at, source_name, segments.size(), options.min_tokens,
        options.max_tokens, join(options.break_at_headings, ", "),
        context.output_directory.string());

    if (!segments.empty()) {
        auto [smallest, largest] = std::minmax_element(
            segments.begin(), segments.end(),
            [](const segment& a, const segment& b) { return a.token_count < b.token_count; });
        auto total = std::accumulate(
            segments.begin(), segments.end(), std::size_t{0},
            [](std::size_t sum, const segment& s) { return sum + s.token_count; });
        report += compat::format("- Average tokens: {}\n- Smallest: {}\n- Largest: {}\n",
                                 total / segments.size(), smallest->token_count,
                                 largest->token_count);
    }

    report += "\n## Segments Created\n";
    for (const auto& piece : segments) {
        report += compat::format("\n### Segment {}\n", piece.segment_number);
        report += compat::format("- Tokens: ~{}\n", piece.token_count);
        report += compat::format("- Lines: {}-{}\n", piece.start_line, piece.end_line);
        for (std::size_t level = 0; level < piece.headings.size(); ++level) {
            if (piece.headings[level]) {
                report += compat::format("- H{}: {}\n", level + 1, *piece.headings[level]);
            }
        }
    }
    return report;
}

auto render_prompt_report(const report_context& context,
                          std::string_view source_name,
                          const prompt_options& options,
                          const std::vector<prompt>& prompts) -> std::string {
    std::string report = compat::format(
        "# Prompt Generation Report\n"
        "\n"
        "Generated: {}\n"
        "\n"
        "## Summary\n"
        "- Source file: {}\n"
        "- Total prompts: {}\n"
        "- Split level: {}\n"
        "- Parent context: {}\n"
        "- Template used: {}\n"
        "- Output directory: {}\n"
        "\n"
        "## Prompts Created\n",
        context.generated_at, source_name, prompts.size(), options.split_level,
        options.include_parent_context ? "Included" : "Not included",
        options.prompt_template ? "Yes" : "No", context.output_directory.string());

    for (const auto& section : prompts) {
        report += compat::format("\n### Prompt {}: {}\n", section.prompt_number,
                                 section.heading);
        if (section.parent_heading) {
            report += compat::format("- Parent: {}\n", *section.parent_heading);
        }
        report += compat::format("- Level: H{}\n", section.level);
        report += compat::format("- Content length: {} characters\n", section.content.size());
    }
    return report;
}

auto write_report(const std::filesystem::path& path, std::string_view content)
    -> VoidResult {
    auto written = core::write_file_atomically(path, content);
    if (written.is_err()) {
        return inkognito_void_error(error_codes::persistence_failure,
                                    "Failed to write report: " + written.error().message,
                                    path.string());
    }
    return ok();
}

}  // namespace inkognito::documents
