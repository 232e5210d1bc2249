/**
 * lfsget CLI - mkdir command
 *
 * Ensure a directory (or a file's parent directory) exists.
 */

#include "../common.hpp"

#include <CLI/CLI.hpp>

namespace lfsget::cli::commands {

namespace {

struct MkdirOptions {
    std::string path;
    bool is_directory = false;
};

int cmd_mkdir(const GlobalOptions& opts, const MkdirOptions& mk_opts) {
    // Directory creation must not depend on a log directory existing
    Logger& logger = null_logger();

    auto result = ensure_directory(mk_opts.path, mk_opts.is_directory, logger);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["directory"] = result.directory;
        j["created"] = result.created;
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = to_string(ErrorKind::FilesystemError);
        }
        output_json(j);
        return exit_status(result.ok ? ExitCode::Success : ExitCode::UsageError);
    }

    if (!result.ok) {
        print_error("mkdir", result.error, false, ErrorKind::FilesystemError);
        return exit_status(ExitCode::UsageError);
    }

    if (!opts.quiet) {
        print_success((result.created ? "Created " : "Exists ") + result.directory, false);
    }
    return exit_status(ExitCode::Success);
}

} // anonymous namespace

void setup_mkdir(CLI::App* app, GlobalOptions& opts) {
    static MkdirOptions mk_opts;

    app->add_option("path", mk_opts.path, "File or directory path")->required();
    app->add_flag("--dir", mk_opts.is_directory,
                  "Treat path as a directory (default: ensure its parent)");

    app->callback([&opts]() {
        std::exit(cmd_mkdir(opts, mk_opts));
    });
}

} // namespace lfsget::cli::commands
