#include "lfsget/logger.hpp"
#include "lfsget/platform.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lfsget {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
    }
    return spdlog::level::info;
}

constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S - %l - %v";

} // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        default: return "unknown";
    }
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger& null_logger() {
    static NullLogger logger;
    return logger;
}

// ============================================================================
// SpdlogLogger
// ============================================================================

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void SpdlogLogger::log(LogLevel level, const std::string& message) {
    if (!logger_) return;
    logger_->log(to_spdlog(level), message);
}

bool SpdlogLogger::should_log(LogLevel level) const {
    return logger_ && logger_->should_log(to_spdlog(level));
}

void SpdlogLogger::set_level(LogLevel level) {
    if (logger_) logger_->set_level(to_spdlog(level));
}

void SpdlogLogger::flush() {
    if (logger_) logger_->flush();
}

// ============================================================================
// Construction
// ============================================================================

std::string make_log_file_path(const std::string& log_dir, const std::string& name) {
    // The name may be a destination path; keep only its file name
    std::string base = get_filename(name);
    if (base.empty()) base = "lfsget";
    return join_path(log_dir, base + "-" + get_file_timestamp() + ".log");
}

LoggerResult make_logger(const LoggerOptions& options) {
    LoggerResult result;

    if (!options.log_to_stream && !options.log_to_file) {
        result.error = "logger needs at least one of stream logging and file logging";
        return result;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (options.log_to_stream) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (options.log_to_file) {
        auto dir = ensure_directory(options.log_dir, true, null_logger());
        if (!dir.ok) {
            result.error = dir.error;
            return result;
        }

        result.log_file = make_log_file_path(options.log_dir, options.name);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(result.log_file));
        } catch (const spdlog::spdlog_ex& e) {
            result.error = std::string("failed to open log file: ") + e.what();
            return result;
        }
    }

    auto native = std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());
    native->set_pattern(LOG_PATTERN);
    native->set_level(options.debug ? spdlog::level::debug : spdlog::level::info);
    native->flush_on(spdlog::level::warn);

    result.logger = std::make_unique<SpdlogLogger>(std::move(native));
    result.ok = true;
    return result;
}

} // namespace lfsget
