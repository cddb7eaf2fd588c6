/**
 * @file restoration_pipeline.cpp
 * @brief Implementation of vault-based restoration
 */

#include "inkognito/anonymization/restoration_pipeline.hpp"
#include "inkognito/anonymization/placeholder_text.hpp"

#include <algorithm>

namespace inkognito::anonymization {

auto restoration_result::total_replacements() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& file : files) {
        total += file.replacements;
    }
    return total;
}

restoration_pipeline::restoration_pipeline(reverse_mappings mappings,
                                           std::shared_ptr<di::ILogger> logger)
    : logger_{di::or_null(std::move(logger))} {
    ordered_.reserve(mappings.size());
    for (auto& [synthetic, original] : mappings) {
        if (!synthetic.empty()) {
            ordered_.emplace_back(synthetic, std::move(original));
        }
    }

    std::sort(ordered_.begin(), ordered_.end(), [](const auto& a, const auto& b) {
        if (a.first.size() != b.first.size()) {
            return a.first.size() > b.first.size();
        }
        return a.first < b.first;
    });
}

restoration_pipeline::restoration_pipeline(const vault_record& record,
                                           std::shared_ptr<di::ILogger> logger)
    : restoration_pipeline(invert_mappings(record), std::move(logger)) {}

auto restoration_pipeline::open(const std::filesystem::path& vault_path,
                                std::shared_ptr<di::ILogger> logger)
    -> Result<restoration_pipeline> {
    auto record = load_vault(vault_path, logger);
    if (record.is_err()) {
        return Result<restoration_pipeline>(record.error());
    }
    return restoration_pipeline(record.value(), std::move(logger));
}

auto restoration_pipeline::restore_text(std::string_view text) const -> restored_document {
    placeholder_text working{std::string{text}};

    restored_document restored;
    for (std::size_t slot = 0; slot < ordered_.size(); ++slot) {
        restored.replacements += working.bind(ordered_[slot].first, slot);
    }

    restored.text = working.render(
        [this](std::size_t slot) { return ordered_[slot].second; });
    return restored;
}

auto restoration_pipeline::restore_batch(const std::vector<source_document>& documents) const
    -> restoration_result {
    restoration_result result;
    result.files.reserve(documents.size());

    for (const auto& document : documents) {
        auto restored = restore_text(document.text);
        restored.id = document.id;
        logger_->debug_fmt("Restored {} ({} replacements)", document.id,
                           restored.replacements);
        result.files.push_back(std::move(restored));
    }

    logger_->info_fmt("Restored {} documents with {} replacements", result.files.size(),
                      result.total_replacements());
    return result;
}

auto restoration_pipeline::mapping_count() const noexcept -> std::size_t {
    return ordered_.size();
}

}  // namespace inkognito::anonymization
