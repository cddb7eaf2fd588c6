/**
 * @file anonymization_pipeline.cpp
 * @brief Implementation of batch anonymization
 */

#include "inkognito/anonymization/anonymization_pipeline.hpp"
#include "inkognito/anonymization/placeholder_text.hpp"

#include <inkognito/integration/logger_adapter.hpp>

#include <algorithm>
#include <exception>
#include <map>
#include <set>

namespace inkognito::anonymization {

namespace {

/// A detected value bound to a placeholder slot (slot == index)
struct bound_value {
    core::entity_type type;
    std::string value;
    std::size_t ordinal;
    std::size_t occurrences;
};

/**
 * Phase one: bind every occurrence of each value to its own slot. Values
 * must already be distinct and ordered longest first.
 */
auto bind_detections(placeholder_text& working, const std::vector<detection>& detections)
    -> std::vector<bound_value> {
    std::vector<bound_value> bound;
    std::map<core::entity_type, std::size_t> ordinals;

    for (const auto& found : detections) {
        auto occurrences = working.bind(found.value, bound.size());
        if (occurrences == 0) {
            continue;
        }
        bound.push_back({found.type, found.value, ++ordinals[found.type], occurrences});
    }
    return bound;
}

}  // namespace

// =============================================================================
// pipeline_config
// =============================================================================

auto pipeline_config::allows(core::entity_type type) const -> bool {
    if (type == core::entity_type::unknown) {
        return true;
    }
    return std::find(entity_types.begin(), entity_types.end(), type) != entity_types.end();
}

auto pipeline_config::validate() const -> VoidResult {
    if (score_threshold < 0.0 || score_threshold > 1.0) {
        return inkognito_void_error(error_codes::invalid_argument,
                                    "Score threshold must be within [0, 1]");
    }
    if (date_shift_days < 0) {
        return inkognito_void_error(error_codes::invalid_argument,
                                    "Date-shift window must not be negative");
    }
    return ok();
}

// =============================================================================
// batch_result
// =============================================================================

void batch_result::add_failure(std::string id, error_info reason) {
    file_outcome outcome;
    outcome.id = std::move(id);
    outcome.failure = std::move(reason);
    files.push_back(std::move(outcome));
}

auto batch_result::succeeded_count() const noexcept -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(files.begin(), files.end(),
                      [](const file_outcome& f) { return f.succeeded(); }));
}

auto batch_result::failed_count() const noexcept -> std::size_t {
    return files.size() - succeeded_count();
}

auto batch_result::total_replacements() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& [type, count] : statistics) {
        total += count;
    }
    return total;
}

// =============================================================================
// anonymization_pipeline
// =============================================================================

anonymization_pipeline::anonymization_pipeline(std::shared_ptr<entity_detector> detector,
                                               pipeline_config config,
                                               std::shared_ptr<di::ILogger> logger)
    : detector_{std::move(detector)}
    , config_{std::move(config)}
    , logger_{di::or_null(std::move(logger))} {}

auto anonymization_pipeline::config() const noexcept -> const pipeline_config& {
    return config_;
}

auto anonymization_pipeline::anonymize_batch(const std::vector<source_document>& documents,
                                             const std::optional<mapping_table>& seed,
                                             std::stop_token stop) -> Result<batch_result> {
    if (!detector_) {
        return inkognito_error<batch_result>(error_codes::invalid_argument,
                                             "Pipeline has no entity detector");
    }
    auto valid = config_.validate();
    if (valid.is_err()) {
        return Result<batch_result>(valid.error());
    }

    replacement_generator generator(config_.seed, logger_);

    batch_result result;
    result.date_offset = generator.draw_date_offset(config_.date_shift_days);
    if (seed.has_value()) {
        result.mappings = *seed;
    }

    logger_->info_fmt("Anonymizing {} documents ({} seeded mappings)", documents.size(),
                      result.mappings.size());

    for (std::size_t index = 0; index < documents.size(); ++index) {
        const auto& document = documents[index];

        if (stop.stop_requested()) {
            logger_->warn_fmt("Batch cancelled with {} of {} documents processed", index,
                              documents.size());
            for (; index < documents.size(); ++index) {
                result.add_failure(documents[index].id,
                                   error_info{error_codes::batch_cancelled,
                                              "Batch cancelled before this document",
                                              "inkognito"});
            }
            break;
        }

        auto substituted = anonymize_document(document.text, generator, result.mappings);
        if (substituted.is_err()) {
            logger_->warn_fmt("Skipping {}: {}", document.id, substituted.error().message);
            result.add_failure(document.id, substituted.error());
            continue;
        }

        auto& output = substituted.value();
        for (const auto& [type, count] : output.counts) {
            result.statistics[type] += count;
        }

        file_outcome outcome;
        outcome.id = document.id;
        outcome.text = std::move(output.text);
        outcome.counts = std::move(output.counts);
        result.files.push_back(std::move(outcome));

        logger_->debug_fmt("Anonymized {}", document.id);
    }

    logger_->info_fmt("Batch complete: {} succeeded, {} failed, {} mappings",
                      result.succeeded_count(), result.failed_count(),
                      result.mappings.size());
    integration::logger_adapter::log_batch_anonymized(
        result.succeeded_count(), result.failed_count(), result.date_offset);

    return result;
}

auto anonymization_pipeline::redact_text(std::string_view text) -> Result<std::string> {
    auto detected = detect(text);
    if (detected.is_err()) {
        return Result<std::string>(detected.error());
    }

    placeholder_text working{std::string{text}};
    auto bound = bind_detections(working, retain(std::move(detected.value())));

    return working.render([&bound](std::size_t slot) {
        return make_placeholder(bound[slot].type, bound[slot].ordinal);
    });
}

auto anonymization_pipeline::detect(std::string_view text)
    -> Result<std::vector<detection>> {
    if (!detector_) {
        return inkognito_error<std::vector<detection>>(error_codes::invalid_argument,
                                                       "Pipeline has no entity detector");
    }

    try {
        auto detected = detector_->scan(text);
        if (detected.is_err()) {
            return inkognito_error<std::vector<detection>>(error_codes::detection_failure,
                                                           "Entity detection failed: " +
                                                               detected.error().message);
        }
        return detected;
    } catch (const std::exception& e) {
        return inkognito_error<std::vector<detection>>(error_codes::detection_failure,
                                                       std::string{"Entity detection failed: "} +
                                                           e.what());
    }
}

auto anonymization_pipeline::retain(std::vector<detection> detections) const
    -> std::vector<detection> {
    std::vector<detection> retained;
    std::set<std::string, std::less<>> seen;

    for (auto& found : detections) {
        if (found.value.empty() || found.confidence < config_.score_threshold ||
            !config_.allows(found.type)) {
            continue;
        }
        // A value detected twice keeps the type it was first reported with
        if (!seen.insert(found.value).second) {
            continue;
        }
        retained.push_back(std::move(found));
    }

    std::stable_sort(retained.begin(), retained.end(),
                     [](const detection& a, const detection& b) {
                         return a.value.size() > b.value.size();
                     });
    return retained;
}

auto anonymization_pipeline::anonymize_document(std::string_view text,
                                                replacement_generator& generator,
                                                mapping_table& table)
    -> Result<substitution> {
    auto detected = detect(text);
    if (detected.is_err()) {
        return Result<substitution>(detected.error());
    }

    placeholder_text working{std::string{text}};
    auto bound = bind_detections(working, retain(std::move(detected.value())));

    // Phase two: each slot is resolved once, through the session table
    std::optional<error_info> failure;
    auto rendered = working.render([&](std::size_t slot) -> std::string {
        const auto& entry = bound[slot];
        auto synthetic = generator.generate(entry.type, entry.value, table);
        if (synthetic.is_err()) {
            if (!failure) {
                failure = synthetic.error();
            }
            return entry.value;
        }
        return synthetic.value();
    });
    if (failure) {
        return Result<substitution>(*failure);
    }

    substitution output;
    output.text = std::move(rendered);
    for (const auto& entry : bound) {
        output.counts[entry.type] += entry.occurrences;
    }
    return output;
}

}  // namespace inkognito::anonymization
