/**
 * @file segmenter.cpp
 * @brief Implementation of document segmentation and prompt splitting
 */

#include "inkognito/documents/segmenter.hpp"

#include <inkognito/compat/format.hpp>

#include <algorithm>
#include <cctype>

namespace inkognito::documents {

namespace {

struct heading_line {
    int level;
    std::string text;
};

auto split_lines(std::string_view content) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            if (start < content.size()) {
                lines.push_back(content.substr(start));
            }
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

auto join_lines(const std::vector<std::string_view>& lines, std::size_t first,
                std::size_t last) -> std::string {
    std::string joined;
    for (std::size_t i = first; i < last; ++i) {
        if (i > first) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

/// Tracks fenced code blocks while walking a document line by line
class fence_tracker {
public:
    /// @return true if the line opens, closes or lies inside a fence
    auto consume(std::string_view line) -> bool {
        auto stripped = trim(line);
        auto marker = stripped.substr(0, 3);
        if (marker == "```" || marker == "~~~") {
            if (!open_) {
                open_ = std::string{marker};
            } else if (*open_ == marker) {
                open_.reset();
            }
            return true;
        }
        return open_.has_value();
    }

private:
    std::optional<std::string> open_;
};

auto parse_heading(std::string_view line) -> std::optional<heading_line> {
    std::size_t indent = 0;
    while (indent < line.size() && indent < 3 && line[indent] == ' ') {
        ++indent;
    }
    line.remove_prefix(indent);

    int level = 0;
    while (static_cast<std::size_t>(level) < line.size() && line[level] == '#') {
        ++level;
    }
    if (level == 0 || level > 6) {
        return std::nullopt;
    }

    auto rest = line.substr(static_cast<std::size_t>(level));
    if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t' && rest.front() != '\r') {
        return std::nullopt;
    }

    rest = trim(rest);
    // Optional closing sequence: "## Title ##"
    auto closing = rest.find_last_not_of('#');
    if (closing != std::string_view::npos && closing + 1 < rest.size() &&
        (rest[closing] == ' ' || rest[closing] == '\t')) {
        rest = trim(rest.substr(0, closing));
    } else if (closing == std::string_view::npos) {
        rest = {};
    }

    return heading_line{level, std::string{rest}};
}

void update_context(heading_context& context, const heading_line& heading) {
    context[static_cast<std::size_t>(heading.level - 1)] = heading.text;
    for (auto i = static_cast<std::size_t>(heading.level); i < context.size(); ++i) {
        context[i].reset();
    }
}

auto render_template(std::string_view tmpl, const prompt& section) -> std::string {
    const std::string level = std::to_string(section.level);
    const std::string parent = section.parent_heading.value_or("");

    std::string output;
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        if (tmpl[pos] == '{') {
            auto close = tmpl.find('}', pos);
            if (close != std::string_view::npos) {
                auto key = tmpl.substr(pos + 1, close - pos - 1);
                const std::string* value = nullptr;
                if (key == "heading") value = &section.heading;
                else if (key == "content") value = &section.content;
                else if (key == "parent") value = &parent;
                else if (key == "level") value = &level;

                if (value != nullptr) {
                    output += *value;
                    pos = close + 1;
                    continue;
                }
            }
        }
        output += tmpl[pos++];
    }
    return output;
}

}  // namespace

auto estimate_tokens(std::string_view text) noexcept -> std::size_t {
    return text.size() / 4;
}

auto parse_heading_level(std::string_view name) -> std::optional<int> {
    if (name.size() == 2 && (name[0] == 'h' || name[0] == 'H') && name[1] >= '1' &&
        name[1] <= '6') {
        return name[1] - '0';
    }
    return std::nullopt;
}

auto segment_large_document(std::string_view content, const segment_options& options)
    -> Result<std::vector<segment>> {
    if (options.max_tokens == 0 || options.min_tokens > options.max_tokens) {
        return inkognito_error<std::vector<segment>>(
            error_codes::invalid_argument,
            "Token bounds must satisfy 0 <= min_tokens <= max_tokens and max_tokens > 0");
    }

    std::array<bool, 6> preferred{};
    for (const auto& name : options.break_at_headings) {
        auto level = parse_heading_level(name);
        if (!level) {
            return inkognito_error<std::vector<segment>>(error_codes::invalid_argument,
                                                         "Unknown heading level: " + name);
        }
        preferred[static_cast<std::size_t>(*level - 1)] = true;
    }

    const auto lines = split_lines(content);
    std::vector<segment> segments;

    heading_context context;
    heading_context segment_context;
    fence_tracker fences;
    std::size_t first = 0;
    std::size_t chars = 0;
    bool open = false;

    auto close_segment = [&](std::size_t last) {
        segment piece;
        piece.content = join_lines(lines, first, last);
        piece.token_count = estimate_tokens(piece.content);
        piece.start_line = first + 1;
        piece.end_line = last;
        piece.headings = segment_context;
        segments.push_back(std::move(piece));
        chars = 0;
        open = false;
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto line = lines[i];
        const auto line_chars = line.size() + 1;

        std::optional<heading_line> heading;
        if (!fences.consume(line)) {
            heading = parse_heading(line);
        }

        if (open) {
            bool at_preferred_break =
                heading && preferred[static_cast<std::size_t>(heading->level - 1)] &&
                chars / 4 >= options.min_tokens;
            bool over_budget = (chars + line_chars) / 4 > options.max_tokens;
            if (at_preferred_break || over_budget) {
                close_segment(i);
            }
        }

        if (heading) {
            update_context(context, *heading);
        }

        if (!open) {
            first = i;
            segment_context = context;
            open = true;
        }
        chars += line_chars;
    }

    if (open) {
        close_segment(lines.size());
    }

    for (std::size_t i = 0; i < segments.size(); ++i) {
        segments[i].segment_number = i + 1;
        segments[i].total_segments = segments.size();
    }
    return segments;
}

auto split_into_prompts(std::string_view content, const prompt_options& options)
    -> Result<std::vector<prompt>> {
    auto split_level = parse_heading_level(options.split_level);
    if (!split_level) {
        return inkognito_error<std::vector<prompt>>(
            error_codes::invalid_argument, "Unknown heading level: " + options.split_level);
    }

    const auto lines = split_lines(content);

    struct located_heading {
        std::size_t line;
        heading_line heading;
        std::optional<std::string> parent;
    };

    std::vector<located_heading> headings;
    heading_context context;
    fence_tracker fences;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (fences.consume(lines[i])) {
            continue;
        }
        auto heading = parse_heading(lines[i]);
        if (!heading) {
            continue;
        }

        std::optional<std::string> parent;
        for (int level = heading->level - 1; level >= 1; --level) {
            if (context[static_cast<std::size_t>(level - 1)]) {
                parent = context[static_cast<std::size_t>(level - 1)];
                break;
            }
        }
        update_context(context, *heading);
        headings.push_back({i, std::move(*heading), std::move(parent)});
    }

    std::vector<prompt> prompts;
    for (std::size_t h = 0; h < headings.size(); ++h) {
        const auto& current = headings[h];
        if (current.heading.level != *split_level) {
            continue;
        }

        std::size_t end = lines.size();
        for (std::size_t next = h + 1; next < headings.size(); ++next) {
            if (headings[next].heading.level <= *split_level) {
                end = headings[next].line;
                break;
            }
        }

        std::size_t first = current.line + 1;
        while (first < end && trim(lines[first]).empty()) {
            ++first;
        }
        while (end > first && trim(lines[end - 1]).empty()) {
            --end;
        }

        prompt section;
        section.heading = current.heading.text;
        section.level = current.heading.level;
        if (options.include_parent_context) {
            section.parent_heading = current.parent;
        }
        section.content = join_lines(lines, first, end);
        if (options.prompt_template) {
            section.content = render_template(*options.prompt_template, section);
        }
        prompts.push_back(std::move(section));
    }

    if (prompts.empty()) {
        return inkognito_error<std::vector<prompt>>(
            error_codes::no_headings_found,
            "No " + options.split_level + " headings found in document");
    }

    for (std::size_t i = 0; i < prompts.size(); ++i) {
        prompts[i].prompt_number = i + 1;
        prompts[i].total_prompts = prompts.size();
    }
    return prompts;
}

auto segment_file_name(std::string_view stem, const segment& piece) -> std::string {
    return compat::format("{}_{:03}_of_{:03}.md", stem, piece.segment_number,
                          piece.total_segments);
}

auto render_segment_file(std::string_view source_name, const segment& piece)
    -> std::string {
    return compat::format(
        "<!-- Segment {} of {} -->\n"
        "<!-- Original file: {} -->\n"
        "<!-- Tokens: ~{} -->\n"
        "<!-- Lines: {}-{} -->\n"
        "\n"
        "{}\n",
        piece.segment_number, piece.total_segments, source_name, piece.token_count,
        piece.start_line, piece.end_line, piece.content);
}

auto sanitize_heading(std::string_view heading) -> std::string {
    std::string safe;
    for (char c : heading) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == ' ' || c == '-' || c == '_') {
            safe += c;
        }
    }
    while (!safe.empty() && safe.back() == ' ') {
        safe.pop_back();
    }
    std::replace(safe.begin(), safe.end(), ' ', '_');
    if (safe.size() > 50) {
        safe.resize(50);
    }
    return safe;
}

auto prompt_file_name(std::string_view stem, const prompt& section) -> std::string {
    return compat::format("{}_{:03}_{}.md", stem, section.prompt_number,
                          sanitize_heading(section.heading));
}

auto render_prompt_file(std::string_view source_name, const prompt& section)
    -> std::string {
    auto text = compat::format(
        "<!-- Prompt {} of {} -->\n"
        "<!-- Original file: {} -->\n"
        "<!-- Heading: {} -->\n"
        "<!-- Level: H{} -->\n",
        section.prompt_number, section.total_prompts, source_name, section.heading,
        section.level);
    if (section.parent_heading) {
        text += compat::format("<!-- Parent: {} -->\n", *section.parent_heading);
    }
    text += compat::format("\n{}\n", section.content);
    return text;
}

}  // namespace inkognito::documents
