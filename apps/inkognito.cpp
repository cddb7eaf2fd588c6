/**
 * @file inkognito.cpp
 * @brief inkognito - Reversible document anonymization utility
 *
 * A command-line utility that replaces sensitive values in Markdown and
 * text documents with consistent synthetic values. The mapping is kept in a
 * vault file from which the originals can be restored later. Long documents
 * can also be segmented or split into per-section prompts.
 *
 * Usage:
 *   inkognito <command> [options]
 *
 * Examples:
 *   inkognito anonymize --dir ./contracts -o ./out
 *   inkognito restore --dir ./out/anonymized -o ./out
 *   inkognito segment book.md -o ./out --max-tokens 8000
 *   inkognito split guide.md -o ./out --level h2
 */

#include <inkognito/anonymization/anonymization_pipeline.hpp>
#include <inkognito/anonymization/pattern_detector.hpp>
#include <inkognito/anonymization/restoration_pipeline.hpp>
#include <inkognito/anonymization/vault.hpp>
#include <inkognito/anonymization/vault_store.hpp>
#include <inkognito/config/config_loader.hpp>
#include <inkognito/core/file_io.hpp>
#include <inkognito/di/ilogger.hpp>
#include <inkognito/documents/document_reader.hpp>
#include <inkognito/documents/file_discovery.hpp>
#include <inkognito/documents/report_writer.hpp>
#include <inkognito/documents/segmenter.hpp>
#include <inkognito/integration/logger_adapter.hpp>

#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace inkognito;

constexpr int kExitSuccess = 0;
constexpr int kExitInvalidArguments = 1;
constexpr int kExitProcessingError = 2;

/**
 * @brief Command line options
 */
struct options {
    std::string command;
    std::optional<fs::path> config_file;
    bool verbose{false};

    // Input selection
    std::vector<fs::path> files;
    std::optional<fs::path> directory;
    std::vector<std::string> patterns;
    std::optional<bool> recursive;
    fs::path output_dir;

    // anonymize / restore
    std::optional<std::string> entity_types;
    std::optional<double> score_threshold;
    std::optional<int> date_shift_days;
    std::optional<fs::path> vault_path;

    // segment
    std::optional<std::size_t> max_tokens;
    std::optional<std::size_t> min_tokens;
    std::optional<std::string> break_at;

    // split
    std::string split_level{"h2"};
    bool include_parent_context{true};
    std::optional<std::string> prompt_template;
};

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << "\ninkognito - Reversible Document Anonymization\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";

    std::cout << "Commands:\n";
    std::cout << "  anonymize   Replace sensitive values and write a vault\n";
    std::cout << "  restore     Restore original values using a vault\n";
    std::cout << "  segment     Split a long document into token-bounded segments\n";
    std::cout << "  split       Split a document into one prompt per heading\n";
    std::cout << "  extract     Convert PDF/DOCX to Markdown (requires an external "
                 "service)\n\n";

    std::cout << "Input Options (anonymize, restore):\n";
    std::cout << "  --files <f>...          Explicit input files\n";
    std::cout << "  --dir <dir>             Input directory\n";
    std::cout << "  --pattern <glob>        File-name pattern (repeatable)\n";
    std::cout << "  --no-recursive          Do not descend into subdirectories\n";
    std::cout << "  -o, --output-dir <dir>  Output directory (required)\n\n";

    std::cout << "Anonymization Options:\n";
    std::cout << "  --entity-types <T,...>  Entity types to replace (default: all)\n";
    std::cout << "  --threshold <x>         Minimum detection confidence (default: 0.5)\n";
    std::cout << "  --date-shift-days <n>   Date offset window in days (default: 365)\n";
    std::cout << "  --vault <path>          Vault file (default: <output>/vault.json)\n";
    std::cout << "                          An existing vault is extended\n\n";

    std::cout << "Segmentation Options (segment <file>):\n";
    std::cout << "  --max-tokens <n>        Maximum tokens per segment (default: 15000)\n";
    std::cout << "  --min-tokens <n>        Minimum tokens per segment (default: 10000)\n";
    std::cout << "  --break-at <h1,h2>      Preferred break headings\n\n";

    std::cout << "Prompt Options (split <file>):\n";
    std::cout << "  --level <hN>            Heading level to split at (default: h2)\n";
    std::cout << "  --no-parent-context     Omit the parent heading\n";
    std::cout << "  --template <text>       Template with {heading}, {content},\n";
    std::cout << "                          {parent} and {level} fields\n\n";

    std::cout << "General Options:\n";
    std::cout << "  --config <file>         JSON configuration file\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " anonymize --dir ./contracts -o ./out\n";
    std::cout << "  " << program_name << " restore --dir ./out/anonymized -o ./out\n";
    std::cout << "  " << program_name << " segment book.md -o ./out --max-tokens 8000\n";
    std::cout << "  " << program_name << " split guide.md -o ./out --level h3\n\n";

    std::cout << "Exit Codes:\n";
    std::cout << "  0  Success\n";
    std::cout << "  1  Invalid arguments\n";
    std::cout << "  2  File/processing error\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output: parsed options
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    opts.command = argv[1];
    if (opts.command == "-h" || opts.command == "--help") {
        return false;
    }

    bool collecting_files = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg != "--files" && !arg.empty() && arg[0] == '-') {
            collecting_files = false;
        }

        try {
            if (arg == "--help" || arg == "-h") {
                return false;
            } else if (arg == "--files") {
                collecting_files = true;
            } else if (arg == "--dir" && i + 1 < argc) {
                opts.directory = fs::path{argv[++i]};
            } else if (arg == "--pattern" && i + 1 < argc) {
                opts.patterns.emplace_back(argv[++i]);
            } else if (arg == "--no-recursive") {
                opts.recursive = false;
            } else if ((arg == "-o" || arg == "--output-dir") && i + 1 < argc) {
                opts.output_dir = argv[++i];
            } else if (arg == "--entity-types" && i + 1 < argc) {
                opts.entity_types = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                opts.score_threshold = std::stod(argv[++i]);
            } else if (arg == "--date-shift-days" && i + 1 < argc) {
                opts.date_shift_days = std::stoi(argv[++i]);
            } else if (arg == "--vault" && i + 1 < argc) {
                opts.vault_path = fs::path{argv[++i]};
            } else if (arg == "--max-tokens" && i + 1 < argc) {
                opts.max_tokens = std::stoul(argv[++i]);
            } else if (arg == "--min-tokens" && i + 1 < argc) {
                opts.min_tokens = std::stoul(argv[++i]);
            } else if (arg == "--break-at" && i + 1 < argc) {
                opts.break_at = argv[++i];
            } else if (arg == "--level" && i + 1 < argc) {
                opts.split_level = argv[++i];
            } else if (arg == "--no-parent-context") {
                opts.include_parent_context = false;
            } else if (arg == "--template" && i + 1 < argc) {
                opts.prompt_template = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                opts.config_file = fs::path{argv[++i]};
            } else if (arg == "-v" || arg == "--verbose") {
                opts.verbose = true;
            } else if (arg[0] == '-') {
                std::cerr << "Error: Unknown option '" << arg << "'\n";
                return false;
            } else {
                opts.files.emplace_back(arg);
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return false;
        }
    }

    // Validation
    const bool needs_output = opts.command != "extract";
    if (needs_output && opts.output_dir.empty()) {
        std::cerr << "Error: No output directory specified (-o)\n";
        return false;
    }
    if ((opts.command == "segment" || opts.command == "split") && opts.files.size() != 1) {
        std::cerr << "Error: " << opts.command << " takes exactly one input file\n";
        return false;
    }
    if ((opts.command == "anonymize" || opts.command == "restore") && opts.files.empty() &&
        !opts.directory) {
        std::cerr << "Error: No input specified (--files or --dir)\n";
        return false;
    }

    return true;
}

/**
 * @brief Apply command-line overrides on top of the loaded configuration
 * @return false if an override is invalid
 */
bool apply_overrides(const options& opts, config::app_config& cfg) {
    if (opts.entity_types) {
        auto types = config::parse_entity_type_list(*opts.entity_types);
        if (types.is_err()) {
            std::cerr << "Error: " << types.error().message << "\n";
            return false;
        }
        cfg.anonymization.entity_types = std::move(types.value());
    }
    if (opts.score_threshold) {
        cfg.anonymization.score_threshold = *opts.score_threshold;
    }
    if (opts.date_shift_days) {
        cfg.anonymization.date_shift_days = *opts.date_shift_days;
    }
    if (!opts.patterns.empty()) {
        cfg.discovery.patterns = opts.patterns;
    }
    if (opts.recursive) {
        cfg.discovery.recursive = *opts.recursive;
    }
    if (opts.max_tokens) {
        cfg.segmentation.max_tokens = *opts.max_tokens;
    }
    if (opts.min_tokens) {
        cfg.segmentation.min_tokens = *opts.min_tokens;
    }
    if (opts.break_at) {
        cfg.segmentation.break_at_headings.clear();
        std::string_view list = *opts.break_at;
        while (!list.empty()) {
            auto comma = list.find(',');
            auto item = list.substr(0, comma);
            if (!item.empty()) {
                cfg.segmentation.break_at_headings.emplace_back(item);
            }
            list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
        }
    }
    if (opts.verbose) {
        cfg.logging.level = integration::log_level::debug;
    }

    auto valid = cfg.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        return false;
    }
    return true;
}

void print_error(const error_info& error) {
    std::cerr << "Error: " << error.message << "\n";
}

auto make_report_context(const options& opts) -> documents::report_context {
    return {anonymization::current_timestamp(), opts.output_dir};
}

// =============================================================================
// Commands
// =============================================================================

int run_anonymize(const options& opts, const config::app_config& cfg,
                  const std::shared_ptr<di::ILogger>& logger) {
    auto inputs = documents::find_files(opts.files, opts.directory, cfg.discovery);
    if (inputs.is_err()) {
        print_error(inputs.error());
        return kExitProcessingError;
    }
    if (inputs.value().empty()) {
        std::cerr << "Error: No files found to anonymize\n";
        return kExitProcessingError;
    }

    const auto vault_path = opts.vault_path.value_or(opts.output_dir / "vault.json");
    auto store = anonymization::vault_store::open(vault_path, logger);
    if (store.is_err()) {
        print_error(store.error());
        return kExitProcessingError;
    }

    // Unreadable documents are reported alongside detector failures
    std::vector<anonymization::source_document> sources;
    std::vector<std::pair<std::string, error_info>> read_failures;
    for (const auto& path : inputs.value()) {
        auto text = documents::read_document(path);
        if (text.is_err()) {
            logger->warn_fmt("Skipping {}: {}", path.string(), text.error().message);
            read_failures.emplace_back(path.string(), text.error());
            continue;
        }
        sources.push_back({path.string(), std::move(text.value())});
    }

    auto detector = std::make_shared<anonymization::pattern_detector>(
        cfg.anonymization.entity_types);
    anonymization::anonymization_pipeline pipeline(detector, cfg.anonymization, logger);

    auto batch = pipeline.anonymize_batch(sources, store.value().seed());
    if (batch.is_err()) {
        print_error(batch.error());
        return kExitProcessingError;
    }
    auto& result = batch.value();
    for (auto& [id, reason] : read_failures) {
        result.add_failure(id, reason);
    }

    // Names are assigned over all inputs so inputs sharing a stem never
    // overwrite each other
    const auto output_names = documents::output_file_names(inputs.value(), ".md");
    std::map<std::string, fs::path> target_names;
    for (std::size_t i = 0; i < inputs.value().size(); ++i) {
        target_names.emplace(inputs.value()[i].string(), output_names[i]);
    }

    // Documents already written stay valid if a later write fails
    const auto anonymized_dir = opts.output_dir / "anonymized";
    for (auto& file : result.files) {
        if (!file.succeeded()) {
            continue;
        }
        auto target = anonymized_dir / target_names.at(file.id);
        auto written = core::write_file_atomically(target, *file.text);
        if (written.is_err()) {
            print_error(written.error());
            file.text.reset();
            file.failure = written.error();
            continue;
        }
        if (opts.verbose) {
            std::cout << "  " << file.id << " -> " << target.string() << "\n";
        }
    }

    // Aligns result.date_offset with the offset stored in the vault
    store.value().update(result);
    auto persisted = store.value().persist();
    if (persisted.is_err()) {
        print_error(persisted.error());
        return kExitProcessingError;
    }
    result.vault_path = vault_path;

    auto report = documents::render_anonymization_report(make_report_context(opts), result);
    auto reported = documents::write_report(opts.output_dir / "REPORT.md", report);
    if (reported.is_err()) {
        print_error(reported.error());
        return kExitProcessingError;
    }

    std::cout << "Anonymized " << result.succeeded_count() << " of " << result.files.size()
              << " files (" << result.total_replacements() << " replacements)\n";
    std::cout << "Vault: " << vault_path.string() << "\n";
    for (const auto& file : result.files) {
        if (file.failure) {
            std::cout << "  Failed: " << file.id << ": " << file.failure->message << "\n";
        }
    }

    return result.succeeded_count() > 0 ? kExitSuccess : kExitProcessingError;
}

/**
 * @brief Locate the vault for a restore run
 *
 * An explicit path wins. Otherwise vault.json is looked up in the parent of
 * the input directory, then in the input directory itself.
 */
auto locate_vault(const options& opts) -> std::optional<fs::path> {
    if (opts.vault_path) {
        return opts.vault_path;
    }

    std::optional<fs::path> base = opts.directory;
    if (!base && !opts.files.empty()) {
        base = fs::absolute(opts.files.front()).parent_path();
    }
    if (!base) {
        return std::nullopt;
    }

    std::error_code ec;
    auto absolute = fs::absolute(*base, ec);
    for (const auto& candidate : {absolute.parent_path() / "vault.json",
                                  absolute / "vault.json"}) {
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

int run_restore(const options& opts, const config::app_config& cfg,
                const std::shared_ptr<di::ILogger>& logger) {
    auto discovery = cfg.discovery;
    if (opts.patterns.empty()) {
        discovery.patterns = {"*.md"};
    }

    auto inputs = documents::find_files(opts.files, opts.directory, discovery);
    if (inputs.is_err()) {
        print_error(inputs.error());
        return kExitProcessingError;
    }
    if (inputs.value().empty()) {
        std::cerr << "Error: No anonymized files found\n";
        return kExitProcessingError;
    }

    auto vault_path = locate_vault(opts);
    if (!vault_path) {
        std::cerr << "Error: Vault file not found. Cannot restore without vault.json\n";
        return kExitProcessingError;
    }

    auto pipeline = anonymization::restoration_pipeline::open(*vault_path, logger);
    if (pipeline.is_err()) {
        print_error(pipeline.error());
        return kExitProcessingError;
    }

    std::vector<anonymization::source_document> sources;
    std::vector<std::string> failures;
    for (const auto& path : inputs.value()) {
        auto text = core::read_file(path);
        if (text.is_err()) {
            failures.push_back(path.string() + ": " + text.error().message);
            continue;
        }
        sources.push_back({path.string(), std::move(text.value())});
    }

    auto result = pipeline.value().restore_batch(sources);

    std::vector<fs::path> restored_ids;
    for (const auto& file : result.files) {
        restored_ids.emplace_back(file.id);
    }
    const auto output_names = documents::output_file_names(restored_ids);

    const auto restored_dir = opts.output_dir / "restored";
    for (std::size_t i = 0; i < result.files.size(); ++i) {
        const auto& file = result.files[i];
        auto target = restored_dir / output_names[i];
        auto written = core::write_file_atomically(target, file.text);
        if (written.is_err()) {
            print_error(written.error());
            return kExitProcessingError;
        }
    }

    integration::logger_adapter::log_documents_restored(
        vault_path->string(), result.files.size(), result.total_replacements());

    auto report = documents::render_restoration_report(make_report_context(opts), result,
                                                       *vault_path, failures);
    auto reported = documents::write_report(opts.output_dir / "RESTORATION_REPORT.md", report);
    if (reported.is_err()) {
        print_error(reported.error());
        return kExitProcessingError;
    }

    std::cout << "Restored " << result.files.size() << " files ("
              << result.total_replacements() << " replacements)\n";
    for (const auto& failure : failures) {
        std::cout << "  Failed: " << failure << "\n";
    }
    return failures.empty() ? kExitSuccess : kExitProcessingError;
}

int run_segment(const options& opts, const config::app_config& cfg) {
    const auto& input = opts.files.front();
    if (!documents::is_text_document(input)) {
        std::cerr << "Error: Only markdown or text files can be segmented\n";
        return kExitProcessingError;
    }

    auto content = core::read_file(input);
    if (content.is_err()) {
        print_error(content.error());
        return kExitProcessingError;
    }

    auto segments = documents::segment_large_document(content.value(), cfg.segmentation);
    if (segments.is_err()) {
        print_error(segments.error());
        return kExitProcessingError;
    }

    const auto source_name = input.filename().string();
    const auto stem = input.stem().string();
    const auto segments_dir = opts.output_dir / "segments";
    for (const auto& piece : segments.value()) {
        auto written = core::write_file_atomically(
            segments_dir / documents::segment_file_name(stem, piece),
            documents::render_segment_file(source_name, piece));
        if (written.is_err()) {
            print_error(written.error());
            return kExitProcessingError;
        }
    }

    auto report = documents::render_segmentation_report(
        make_report_context(opts), source_name, cfg.segmentation, segments.value());
    auto reported = documents::write_report(opts.output_dir / "SEGMENTATION_REPORT.md", report);
    if (reported.is_err()) {
        print_error(reported.error());
        return kExitProcessingError;
    }

    std::cout << "Segmented " << source_name << " into " << segments.value().size()
              << " files\n";
    return kExitSuccess;
}

int run_split(const options& opts) {
    const auto& input = opts.files.front();
    if (!documents::is_text_document(input)) {
        std::cerr << "Error: Only markdown or text files can be split into prompts\n";
        return kExitProcessingError;
    }

    auto content = core::read_file(input);
    if (content.is_err()) {
        print_error(content.error());
        return kExitProcessingError;
    }

    documents::prompt_options prompt_opts;
    prompt_opts.split_level = opts.split_level;
    prompt_opts.include_parent_context = opts.include_parent_context;
    prompt_opts.prompt_template = opts.prompt_template;

    auto prompts = documents::split_into_prompts(content.value(), prompt_opts);
    if (prompts.is_err()) {
        print_error(prompts.error());
        return kExitProcessingError;
    }

    const auto source_name = input.filename().string();
    const auto stem = input.stem().string();
    const auto prompts_dir = opts.output_dir / "prompts";
    for (const auto& section : prompts.value()) {
        auto written = core::write_file_atomically(
            prompts_dir / documents::prompt_file_name(stem, section),
            documents::render_prompt_file(source_name, section));
        if (written.is_err()) {
            print_error(written.error());
            return kExitProcessingError;
        }
    }

    auto report = documents::render_prompt_report(make_report_context(opts), source_name,
                                                  prompt_opts, prompts.value());
    auto reported = documents::write_report(opts.output_dir / "PROMPT_REPORT.md", report);
    if (reported.is_err()) {
        print_error(reported.error());
        return kExitProcessingError;
    }

    std::cout << "Created " << prompts.value().size() << " prompt files\n";
    return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return kExitInvalidArguments;
    }

    config::config_loader loader;
    auto loaded = loader.load(opts.config_file);
    if (loaded.is_err()) {
        print_error(loaded.error());
        return kExitInvalidArguments;
    }
    auto cfg = std::move(loaded.value());
    if (!apply_overrides(opts, cfg)) {
        return kExitInvalidArguments;
    }

    integration::logger_adapter::initialize(cfg.to_logger_config());
    auto logger = std::make_shared<di::LoggerService>();

    int exit_code = kExitInvalidArguments;
    if (opts.command == "anonymize") {
        exit_code = run_anonymize(opts, cfg, logger);
    } else if (opts.command == "restore") {
        exit_code = run_restore(opts, cfg, logger);
    } else if (opts.command == "segment") {
        exit_code = run_segment(opts, cfg);
    } else if (opts.command == "split") {
        exit_code = run_split(opts);
    } else if (opts.command == "extract") {
        std::cerr << "Error: Document extraction requires an external conversion "
                     "service and is not available in this build\n";
        exit_code = kExitProcessingError;
    } else {
        std::cerr << "Error: Unknown command '" << opts.command << "'\n";
        print_usage(argv[0]);
    }

    integration::logger_adapter::shutdown();
    return exit_code;
}
