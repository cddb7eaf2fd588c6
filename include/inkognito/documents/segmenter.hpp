/**
 * @file segmenter.hpp
 * @brief Splitting Markdown documents into segments and prompts
 *
 * Two strategies are provided. segment_large_document() cuts a long
 * document into pieces that fit a token budget, preferring to break at
 * high-level headings. split_into_prompts() cuts a structured document at
 * every heading of one level, producing one prompt per section.
 *
 * Headings are ATX headings ("# Title" .. "###### Title"). Lines inside
 * fenced code blocks (``` or ~~~) are never treated as headings.
 */

#pragma once

#include <inkognito/core/result.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkognito::documents {

/// Nearest heading text per level, index 0 for h1 through 5 for h6
using heading_context = std::array<std::optional<std::string>, 6>;

/**
 * @brief One token-bounded piece of a document
 */
struct segment {
    std::size_t segment_number{0};
    std::size_t total_segments{0};
    std::string content;

    /// Approximate token count (characters / 4)
    std::size_t token_count{0};

    /// 1-based, inclusive
    std::size_t start_line{0};
    std::size_t end_line{0};

    /// Headings in effect at the first line of the segment
    heading_context headings;
};

struct segment_options {
    std::size_t min_tokens{10000};
    std::size_t max_tokens{15000};

    /// Heading levels ("h1".."h6") at which a segment may close early
    std::vector<std::string> break_at_headings{"h1", "h2"};
};

/**
 * @brief One section of a document, cut at a fixed heading level
 */
struct prompt {
    std::size_t prompt_number{0};
    std::size_t total_prompts{0};
    std::string heading;

    /// Heading level, 1..6
    int level{0};

    /// Nearest enclosing heading of a higher level, when requested
    std::optional<std::string> parent_heading;

    /// Section body, or the rendered template
    std::string content;
};

struct prompt_options {
    /// Level to split at, "h1".."h6"
    std::string split_level{"h2"};

    bool include_parent_context{true};

    /// Template with {heading}, {content}, {parent} and {level} fields
    std::optional<std::string> prompt_template;
};

/**
 * @brief Approximate token count of a text
 */
[[nodiscard]] auto estimate_tokens(std::string_view text) noexcept -> std::size_t;

/**
 * @brief Parse a heading level name such as "h2"
 * @return 1..6, or nullopt
 */
[[nodiscard]] auto parse_heading_level(std::string_view name) -> std::optional<int>;

/**
 * @brief Cut a document into token-bounded segments
 *
 * Lines accumulate into the current segment. A heading of a preferred
 * level closes the segment once it holds at least min_tokens, and a line
 * that would push it past max_tokens always closes it first. A single line
 * larger than max_tokens forms a segment of its own.
 *
 * @return Segments in document order (empty for empty content), or
 *         invalid_argument for a zero budget, min_tokens > max_tokens or
 *         an unknown heading level name
 */
[[nodiscard]] auto segment_large_document(std::string_view content,
                                          const segment_options& options = {})
    -> Result<std::vector<segment>>;

/**
 * @brief Cut a document at every heading of one level
 *
 * A section runs from its heading to the next heading of the same or a
 * higher level. Leading and trailing blank lines are trimmed.
 *
 * @return Prompts in document order, no_headings_found when the level does
 *         not occur, or invalid_argument for an unknown level name
 */
[[nodiscard]] auto split_into_prompts(std::string_view content,
                                      const prompt_options& options = {})
    -> Result<std::vector<prompt>>;

/**
 * @brief "<stem>_<NNN>_of_<TTT>.md"
 */
[[nodiscard]] auto segment_file_name(std::string_view stem, const segment& piece)
    -> std::string;

/**
 * @brief Segment file content with an HTML-comment metadata header
 */
[[nodiscard]] auto render_segment_file(std::string_view source_name, const segment& piece)
    -> std::string;

/**
 * @brief Heading reduced to letters, digits, '-' and '_' (spaces become
 *        '_'), at most 50 characters
 */
[[nodiscard]] auto sanitize_heading(std::string_view heading) -> std::string;

/**
 * @brief "<stem>_<NNN>_<sanitized heading>.md"
 */
[[nodiscard]] auto prompt_file_name(std::string_view stem, const prompt& section)
    -> std::string;

/**
 * @brief Prompt file content with an HTML-comment metadata header
 */
[[nodiscard]] auto render_prompt_file(std::string_view source_name, const prompt& section)
    -> std::string;

}  // namespace inkognito::documents
