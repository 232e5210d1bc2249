/**
 * lfsget CLI - verify command
 *
 * Compare a local file's SHA-256 with the digest in its pointer.
 */

#include "../common.hpp"

#include <lfsget/http_client.hpp>
#include <lfsget/pointer.hpp>
#include <lfsget/verifier.hpp>

#include <CLI/CLI.hpp>

#include <optional>

namespace lfsget::cli::commands {

namespace {

struct VerifyOptions {
    std::string file;
    std::string url;
    bool from_content_url = false;
    std::optional<std::uint32_t> pointer_timeout;
};

int cmd_verify(const GlobalOptions& opts, const VerifyOptions& verify_opts) {
    CommandContext ctx;
    if (!prepare_context(opts, verify_opts.file, ctx)) {
        return exit_status(ExitCode::UsageError);
    }
    if (verify_opts.pointer_timeout) {
        ctx.config.pointer_timeout_seconds = *verify_opts.pointer_timeout;
    }
    auto errors = validate_config(ctx.config);
    if (!errors.empty()) {
        print_error("config", errors.front(), opts.json);
        return exit_status(ExitCode::UsageError);
    }

    std::string pointer_url = verify_opts.from_content_url ? derive_pointer_url(verify_opts.url)
                                                           : verify_opts.url;

    CurlHttpClient client;
    VerifyResult result = verify(verify_opts.file, pointer_url, client, *ctx.logger, cancel_token(),
                                 std::chrono::seconds(ctx.config.pointer_timeout_seconds));
    ctx.logger->flush();

    ExitCode code = ExitCode::Success;
    if (result.status == VerifyStatus::Cancelled) {
        code = ExitCode::Cancelled;
    } else if (!result.matches()) {
        code = ExitCode::IntegrityFailed;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.matches();
        j["status"] = to_string(result.status);
        j["file"] = verify_opts.file;
        j["pointer_url"] = pointer_url;
        j["sha256"] = result.computed_sha256;
        j["expected_sha256"] = result.expected_sha256 ? nlohmann::json(*result.expected_sha256)
                                                      : nlohmann::json(nullptr);
        j["size"] = result.actual_size;
        if (!result.matches()) {
            j["error"] = result.error;
            j["error_kind"] = to_string(result.error_kind);
        }
        output_json(j);
        return exit_status(code);
    }

    if (!result.matches()) {
        print_error("verify", "verify failed for " + verify_opts.file + ": " + result.error, false,
                    result.error_kind);
        return exit_status(code);
    }

    print_success("OK " + result.computed_sha256 + "  " + verify_opts.file, false);
    return exit_status(code);
}

} // anonymous namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static VerifyOptions verify_opts;

    app->add_option("file", verify_opts.file, "Local file to hash")->required();
    app->add_option("url", verify_opts.url, "Pointer URL")->required();
    app->add_flag("--from-content-url", verify_opts.from_content_url,
                  "Treat url as the content URL and derive the pointer URL from it");
    app->add_option("--pointer-timeout", verify_opts.pointer_timeout,
                    "Pointer fetch timeout in seconds");

    app->callback([&opts]() {
        std::exit(cmd_verify(opts, verify_opts));
    });
}

} // namespace lfsget::cli::commands
