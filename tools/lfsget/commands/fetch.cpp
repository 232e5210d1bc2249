/**
 * lfsget CLI - fetch command
 *
 * Download, verify against the pointer, then unpack.
 */

#include "../common.hpp"

#include <lfsget/http_client.hpp>
#include <lfsget/pipeline.hpp>
#include <lfsget/pointer.hpp>

#include <CLI/CLI.hpp>

#include <optional>

namespace lfsget::cli::commands {

namespace {

struct FetchOptions {
    std::string url;
    std::string destination;
    std::string pointer_url;
    std::optional<std::string> extract_to;
    bool no_extract = false;
    std::optional<int> max_depth;
    std::optional<std::size_t> chunk_size;
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint32_t> retry_delay;
    std::optional<std::uint32_t> timeout;
    std::optional<std::size_t> parallelism;
};

nlohmann::json result_to_json(const PipelineResult& result, const PipelineOptions& options) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["stage"] = to_string(result.ok ? result.final_stage : result.failed_stage);
    j["destination"] = options.download.destination;
    j["download"] = {
        {"status", to_string(result.download.status)},
        {"attempts", result.download.attempts},
        {"bytes", result.download.bytes_on_disk},
    };
    if (result.failed_stage != PipelineStage::Downloading) {
        j["verify"] = {
            {"status", to_string(result.verification.status)},
            {"sha256", result.verification.computed_sha256},
        };
    }
    if (result.extraction_ran) {
        j["extract"] = {
            {"entries", result.extraction.entries_extracted},
            {"nested", result.extraction.nested_extracted},
        };
    }
    if (!result.ok) {
        j["error"] = result.error;
        j["error_kind"] = to_string(result.error_kind);
    }
    return j;
}

int cmd_fetch(const GlobalOptions& opts, const FetchOptions& fetch_opts) {
    CommandContext ctx;
    if (!prepare_context(opts, fetch_opts.destination, ctx)) {
        return exit_status(ExitCode::UsageError);
    }
    FetchConfig& config = ctx.config;

    if (fetch_opts.chunk_size) config.chunk_size = *fetch_opts.chunk_size;
    if (fetch_opts.max_retries) config.max_retries = *fetch_opts.max_retries;
    if (fetch_opts.retry_delay) config.retry_delay_seconds = *fetch_opts.retry_delay;
    if (fetch_opts.timeout) config.timeout_seconds = *fetch_opts.timeout;
    if (fetch_opts.extract_to) config.extract_to = *fetch_opts.extract_to;
    if (fetch_opts.max_depth) config.max_depth = *fetch_opts.max_depth;
    if (fetch_opts.parallelism) config.parallelism = *fetch_opts.parallelism;
    if (fetch_opts.no_extract) config.extract = false;

    auto errors = validate_config(config);
    if (!errors.empty()) {
        print_error("config", errors.front(), opts.json);
        return exit_status(ExitCode::UsageError);
    }

    Logger& logger = *ctx.logger;

    PipelineOptions options;
    options.download = make_download_task(config, fetch_opts.url, fetch_opts.destination);
    options.pointer_url = fetch_opts.pointer_url;
    options.pointer_timeout = std::chrono::seconds(config.pointer_timeout_seconds);
    options.extract = config.extract;
    options.extract_to = config.extract_to;
    options.max_depth = config.max_depth;
    options.extract_options.track_progress = config.track_progress;
    options.extract_options.parallelism = effective_parallelism(config.parallelism);
    if (config.track_progress) {
        options.extract_options.progress = make_extract_progress(logger);
    }

    CurlHttpClient client;
    Pipeline pipeline(client, logger, cancel_token());
    if (config.track_progress) {
        pipeline.set_download_progress(make_download_progress(logger));
    }
    pipeline.set_stage_callback([&logger](PipelineStage from, PipelineStage to) {
        logger.info("Stage {} -> {}", to_string(from), to_string(to));
    });

    PipelineResult result = pipeline.run(options);
    ctx.logger->flush();

    if (opts.json) {
        output_json(result_to_json(result, options));
        return exit_status(result.exit_code());
    }

    if (!result.ok) {
        print_error(to_string(result.failed_stage), result.error, false, result.error_kind);
        return exit_status(result.exit_code());
    }

    print_success("Fetched " + fetch_opts.destination, false);
    print_success("  SHA-256: " + result.verification.computed_sha256, false);
    if (result.extraction_ran) {
        print_success("  Extracted " + std::to_string(result.extraction.entries_extracted) +
                          " entries (" + std::to_string(result.extraction.nested_extracted) +
                          " nested containers)",
                      false);
    }
    return exit_status(ExitCode::Success);
}

} // anonymous namespace

void setup_fetch(CLI::App* app, GlobalOptions& opts) {
    static FetchOptions fetch_opts;

    app->add_option("url", fetch_opts.url, "Content URL")->required();
    app->add_option("destination", fetch_opts.destination, "Destination file")->required();
    app->add_option("--pointer-url", fetch_opts.pointer_url,
                    "Pointer URL (default: derived from the content URL)");
    app->add_option("--extract-to", fetch_opts.extract_to,
                    "Extraction directory (default: destination's directory)");
    app->add_flag("--no-extract", fetch_opts.no_extract, "Skip extraction");
    app->add_option("--max-depth", fetch_opts.max_depth, "Maximum nested container depth");
    app->add_option("--chunk-size", fetch_opts.chunk_size, "Write chunk size in bytes");
    app->add_option("--max-retries", fetch_opts.max_retries, "Retries after the first attempt");
    app->add_option("--retry-delay", fetch_opts.retry_delay, "Seconds between attempts");
    app->add_option("--timeout", fetch_opts.timeout, "Connect and read timeout in seconds");
    app->add_option("--parallelism", fetch_opts.parallelism, "Nested extraction workers");

    app->callback([&opts]() {
        std::exit(cmd_fetch(opts, fetch_opts));
    });
}

} // namespace lfsget::cli::commands
