/**
 * lfsget CLI - Entry Point
 *
 * Resumable, integrity-checked fetcher for large pointer-tracked files.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace lfsget::cli::commands {
    void setup_fetch(CLI::App* app, GlobalOptions& opts);
    void setup_download(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
    void setup_extract(CLI::App* app, GlobalOptions& opts);
    void setup_mkdir(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace lfsget::cli;

    CLI::App app{"lfsget - resumable download, verify and unpack"};
    app.set_version_flag("-V,--version", LFSGET_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "JSON config file (default: $LFSGET_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");
    app.add_option("--log-dir", opts.log_dir, "Directory for log files");
    app.add_flag("--no-log-file", opts.no_log_file, "Do not write a log file");
    app.add_flag("--no-log-stream", opts.no_log_stream, "Do not log to stderr");

    // Commands
    auto* fetch_cmd = app.add_subcommand("fetch", "Download, verify and unpack");
    commands::setup_fetch(fetch_cmd, opts);

    auto* download_cmd = app.add_subcommand("download", "Resumable download only");
    commands::setup_download(download_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check a file against its pointer");
    commands::setup_verify(verify_cmd, opts);

    auto* extract_cmd = app.add_subcommand("extract", "Unpack a container and its nested containers");
    commands::setup_extract(extract_cmd, opts);

    auto* mkdir_cmd = app.add_subcommand("mkdir", "Ensure a directory exists");
    commands::setup_mkdir(mkdir_cmd, opts);

    install_signal_handlers();

    // Subcommand callbacks exit with their own status; parse errors map to 1
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? 0 : static_cast<int>(lfsget::ExitCode::UsageError);
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
