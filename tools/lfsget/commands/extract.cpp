/**
 * lfsget CLI - extract command
 *
 * Unpack a local .tar.gz, expanding nested containers.
 */

#include "../common.hpp"

#include <lfsget/extractor.hpp>

#include <CLI/CLI.hpp>

#include <optional>

namespace lfsget::cli::commands {

namespace {

struct ExtractCmdOptions {
    std::string archive;
    std::string dir;
    std::optional<int> max_depth;
    std::optional<std::size_t> parallelism;
    bool no_progress = false;
};

int cmd_extract(const GlobalOptions& opts, const ExtractCmdOptions& ex_opts) {
    CommandContext ctx;
    if (!prepare_context(opts, ex_opts.archive, ctx)) {
        return exit_status(ExitCode::UsageError);
    }
    FetchConfig& config = ctx.config;

    if (ex_opts.max_depth) config.max_depth = *ex_opts.max_depth;
    if (ex_opts.parallelism) config.parallelism = *ex_opts.parallelism;
    if (ex_opts.no_progress) config.track_progress = false;

    auto errors = validate_config(config);
    if (!errors.empty()) {
        print_error("config", errors.front(), opts.json);
        return exit_status(ExitCode::UsageError);
    }

    Logger& logger = *ctx.logger;

    ExtractionJob job;
    job.container_path = ex_opts.archive;
    job.target_dir = ex_opts.dir;
    job.current_depth = BEFORE_FIRST_EXTRACTION;
    job.max_depth = config.max_depth;

    ExtractOptions options;
    options.track_progress = config.track_progress;
    options.parallelism = effective_parallelism(config.parallelism);
    if (config.track_progress) {
        options.progress = make_extract_progress(logger);
    }

    ExtractResult result = extract(job, options, logger, cancel_token());
    ctx.logger->flush();

    ExitCode code = ExitCode::Success;
    if (!result.ok) {
        code = result.error_kind == ErrorKind::Cancelled ? ExitCode::Cancelled
                                                         : ExitCode::ExtractionFailed;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["archive"] = ex_opts.archive;
        j["target"] = ex_opts.dir;
        j["entries"] = result.entries_extracted;
        j["nested"] = result.nested_extracted;
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = to_string(result.error_kind);
            nlohmann::json failures = nlohmann::json::array();
            for (const auto& f : result.failures) {
                failures.push_back({
                    {"container", f.container_path},
                    {"depth", f.depth},
                    {"error_kind", to_string(f.error_kind)},
                    {"error", f.error},
                });
            }
            j["failures"] = failures;
        }
        output_json(j);
        return exit_status(code);
    }

    if (!result.ok) {
        print_error("extract", "extract failed for " + ex_opts.archive + ": " + result.error, false,
                    result.error_kind);
        return exit_status(code);
    }

    print_success("Extracted " + std::to_string(result.entries_extracted) + " entries to " +
                      ex_opts.dir,
                  false);
    return exit_status(code);
}

} // anonymous namespace

void setup_extract(CLI::App* app, GlobalOptions& opts) {
    static ExtractCmdOptions ex_opts;

    app->add_option("archive", ex_opts.archive, "Container to unpack (.tar.gz)")->required();
    app->add_option("dir", ex_opts.dir, "Target directory")->required();
    app->add_option("--max-depth", ex_opts.max_depth, "Maximum nested container depth");
    app->add_option("--parallelism", ex_opts.parallelism, "Nested extraction workers");
    app->add_flag("--no-progress", ex_opts.no_progress, "Do not log extraction progress");

    app->callback([&opts]() {
        std::exit(cmd_extract(opts, ex_opts));
    });
}

} // namespace lfsget::cli::commands
