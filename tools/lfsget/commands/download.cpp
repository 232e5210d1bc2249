/**
 * lfsget CLI - download command
 *
 * Resumable download only; no verification.
 */

#include "../common.hpp"

#include <lfsget/http_client.hpp>

#include <CLI/CLI.hpp>

#include <optional>

namespace lfsget::cli::commands {

namespace {

struct DownloadOptions {
    std::string url;
    std::string destination;
    std::optional<std::size_t> chunk_size;
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint32_t> retry_delay;
    std::optional<std::uint32_t> timeout;
};

int cmd_download(const GlobalOptions& opts, const DownloadOptions& dl_opts) {
    CommandContext ctx;
    if (!prepare_context(opts, dl_opts.destination, ctx)) {
        return exit_status(ExitCode::UsageError);
    }
    FetchConfig& config = ctx.config;

    if (dl_opts.chunk_size) config.chunk_size = *dl_opts.chunk_size;
    if (dl_opts.max_retries) config.max_retries = *dl_opts.max_retries;
    if (dl_opts.retry_delay) config.retry_delay_seconds = *dl_opts.retry_delay;
    if (dl_opts.timeout) config.timeout_seconds = *dl_opts.timeout;

    auto errors = validate_config(config);
    if (!errors.empty()) {
        print_error("config", errors.front(), opts.json);
        return exit_status(ExitCode::UsageError);
    }

    Logger& logger = *ctx.logger;
    DownloadTask task = make_download_task(config, dl_opts.url, dl_opts.destination);

    CurlHttpClient client;
    DownloadProgress progress;
    if (config.track_progress) {
        progress = make_download_progress(logger);
    }

    DownloadResult result = download(task, client, logger, cancel_token(), progress);
    ctx.logger->flush();

    ExitCode code = ExitCode::Success;
    if (!result.ok) {
        code = result.status == DownloadStatus::Cancelled ? ExitCode::Cancelled
                                                          : ExitCode::DownloadFailed;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["status"] = to_string(result.status);
        j["destination"] = dl_opts.destination;
        j["attempts"] = result.attempts;
        j["bytes"] = result.bytes_on_disk;
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = to_string(result.error_kind);
        }
        output_json(j);
        return exit_status(code);
    }

    if (!result.ok) {
        print_error("download", "download failed for " + dl_opts.url + ": " + result.error, false,
                    result.error_kind);
        return exit_status(code);
    }

    print_success("Downloaded " + dl_opts.destination + " (" +
                      std::to_string(result.bytes_on_disk) + " bytes, " +
                      std::to_string(result.attempts) + " attempt" +
                      (result.attempts == 1 ? "" : "s") + ")",
                  false);
    return exit_status(code);
}

} // anonymous namespace

void setup_download(CLI::App* app, GlobalOptions& opts) {
    static DownloadOptions dl_opts;

    app->add_option("url", dl_opts.url, "Content URL")->required();
    app->add_option("destination", dl_opts.destination, "Destination file")->required();
    app->add_option("--chunk-size", dl_opts.chunk_size, "Write chunk size in bytes");
    app->add_option("--max-retries", dl_opts.max_retries, "Retries after the first attempt");
    app->add_option("--retry-delay", dl_opts.retry_delay, "Seconds between attempts");
    app->add_option("--timeout", dl_opts.timeout, "Connect and read timeout in seconds");

    app->callback([&opts]() {
        std::exit(cmd_download(opts, dl_opts));
    });
}

} // namespace lfsget::cli::commands
