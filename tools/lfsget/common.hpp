/**
 * lfsget CLI - Common utilities and types
 */

#pragma once

#include <lfsget/cancellation.hpp>
#include <lfsget/config.hpp>
#include <lfsget/downloader.hpp>
#include <lfsget/extractor.hpp>
#include <lfsget/logger.hpp>
#include <lfsget/platform.hpp>
#include <lfsget/types.hpp>

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace lfsget::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;        // --config
    bool json = false;              // --json
    bool verbose = false;           // -v, --verbose
    bool quiet = false;             // -q, --quiet
    std::string log_dir;            // --log-dir
    bool no_log_file = false;       // --no-log-file
    bool no_log_stream = false;     // --no-log-stream
};

/**
 * Token shared by every command; SIGINT and SIGTERM trip it.
 */
inline CancellationToken& cancel_token() {
    static CancellationToken token;
    return token;
}

inline void handle_cancel_signal(int /* signum */) {
    cancel_token().cancel();
}

inline void install_signal_handlers() {
    cancel_token();  // construct before any signal can arrive
    std::signal(SIGINT, handle_cancel_signal);
    std::signal(SIGTERM, handle_cancel_signal);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& stage, const std::string& msg, bool json_mode,
                        ErrorKind kind = ErrorKind::None) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["stage"] = stage;
        j["error"] = msg;
        if (kind != ErrorKind::None) {
            j["error_kind"] = to_string(kind);
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << stage << ": " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline int exit_status(ExitCode code) {
    return static_cast<int>(code);
}

/**
 * Everything a command needs after global options are applied.
 */
struct CommandContext {
    FetchConfig config;
    std::unique_ptr<SpdlogLogger> logger;
    std::string log_file;
};

/**
 * Resolve configuration and build the logger.
 * Priority: flags > --config file > LFSGET_CONFIG file > defaults.
 * Returns false after printing the problem.
 */
inline bool prepare_context(const GlobalOptions& opts, const std::string& log_name,
                            CommandContext& ctx) {
    FetchConfig config;

    std::string config_path = opts.config_path;
    if (config_path.empty()) {
        config_path = get_env(CONFIG_ENV_VAR).value_or("");
    }

    std::vector<std::string> warnings;
    if (!config_path.empty()) {
        auto loaded = load_config_file(config_path, config);
        if (!loaded.ok) {
            print_error("config", config_path + ": " + loaded.error, opts.json);
            return false;
        }
        config = loaded.config;
        warnings = loaded.warnings;
    }

    if (opts.verbose) config.verbose = true;
    if (!opts.log_dir.empty()) config.log_dir = opts.log_dir;
    if (opts.no_log_file) config.log_to_file = false;
    if (opts.no_log_stream) config.log_to_stream = false;

    auto errors = validate_config(config);
    if (!errors.empty()) {
        print_error("config", errors.front(), opts.json);
        return false;
    }

    LoggerOptions logger_opts;
    logger_opts.name = log_name;
    logger_opts.log_to_stream = config.log_to_stream;
    logger_opts.log_to_file = config.log_to_file;
    logger_opts.log_dir = config.log_dir;
    logger_opts.debug = config.verbose;

    auto made = make_logger(logger_opts);
    if (!made.ok) {
        print_error("config", made.error, opts.json);
        return false;
    }

    ctx.config = config;
    ctx.logger = std::move(made.logger);
    ctx.log_file = made.log_file;

    if (opts.quiet && !config.verbose) {
        ctx.logger->set_level(LogLevel::Warn);
    }
    for (const auto& w : warnings) {
        ctx.logger->warn("{}: {}", config_path, w);
    }
    if (!ctx.log_file.empty()) {
        ctx.logger->debug("Logging to {}", ctx.log_file);
    }
    return true;
}

inline DownloadTask make_download_task(const FetchConfig& config, const std::string& url,
                                       const std::string& destination) {
    DownloadTask task;
    task.url = url;
    task.destination = destination;
    task.chunk_size = config.chunk_size;
    task.max_retries = config.max_retries;
    task.retry_delay = std::chrono::seconds(config.retry_delay_seconds);
    task.timeout = std::chrono::seconds(config.timeout_seconds);
    return task;
}

/**
 * Progress observers. Log a line every 5 percent, or every 10 MiB when the
 * size is unknown.
 */
inline DownloadProgress make_download_progress(Logger& logger) {
    constexpr std::uint64_t UNKNOWN_TOTAL_STEP = 10ull * 1024 * 1024;
    auto last_step = std::make_shared<std::uint64_t>(0);

    return [&logger, last_step](const TransferState& state) {
        std::uint64_t on_disk = state.bytes_on_disk();
        if (state.total_known()) {
            std::uint64_t percent = on_disk * 100 / state.expected_total;
            std::uint64_t step = percent / 5;
            if (step > *last_step) {
                *last_step = step;
                logger.info("Downloaded {} of {} bytes ({}%)", on_disk, state.expected_total, percent);
            }
        } else {
            std::uint64_t step = on_disk / UNKNOWN_TOTAL_STEP;
            if (step > *last_step) {
                *last_step = step;
                logger.info("Downloaded {} bytes", on_disk);
            }
        }
    };
}

inline ExtractProgressCallback make_extract_progress(Logger& logger) {
    auto last_step = std::make_shared<std::uint64_t>(0);

    return [&logger, last_step](const ExtractProgress& progress) {
        if (progress.total == 0) return;
        std::uint64_t percent = progress.processed * 100 / progress.total;
        std::uint64_t step = percent / 5;
        if (step > *last_step) {
            *last_step = step;
            logger.info("Extracted {} of {} entries ({}%)", progress.processed, progress.total,
                        percent);
        }
    };
}

inline std::size_t effective_parallelism(std::size_t configured) {
    if (configured > 0) return configured;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

} // namespace lfsget::cli
