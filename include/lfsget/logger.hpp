#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace spdlog {
class logger;
}

namespace lfsget {

// ============================================================================
// Logging Capability
// ============================================================================
//
// Components never reach for a global logger. The caller builds one Logger and
// passes it by reference into every operation; NullLogger is the default.

enum class LogLevel { Debug = 0, Info, Warn, Error };

const char* to_string(LogLevel level);

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<LogLevel> parse_log_level(const std::string& s);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    // Lets callers skip formatting for suppressed levels
    virtual bool should_log(LogLevel /*level*/) const { return true; }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Error, format, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    void write(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (!should_log(level)) return;
        log(level, fmt::format(format, std::forward<Args>(args)...));
    }
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
    bool should_log(LogLevel) const override { return false; }
};

// Shared no-op instance used for defaulted Logger& parameters
Logger& null_logger();

// Adapts an spdlog logger to the Logger interface
class SpdlogLogger : public Logger {
public:
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    void log(LogLevel level, const std::string& message) override;
    bool should_log(LogLevel level) const override;

    void set_level(LogLevel level);
    void flush();

private:
    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Logger Construction
// ============================================================================

struct LoggerOptions {
    std::string name = "lfsget";    // also the log file name prefix
    bool log_to_stream = true;       // colored stderr sink
    bool log_to_file = true;         // <log_dir>/<name>-<timestamp>.log
    std::string log_dir = "logs";
    bool debug = false;
};

struct LoggerResult {
    bool ok = false;
    std::string error;
    std::unique_ptr<SpdlogLogger> logger;
    std::string log_file;            // empty when file logging is off
};

// Fails when neither sink is requested or the log file cannot be opened
LoggerResult make_logger(const LoggerOptions& options);

// Log file name for a logger prefix, e.g. "logs/model.tar.gz-2024-04-01T10-00-00.log"
std::string make_log_file_path(const std::string& log_dir, const std::string& name);

} // namespace lfsget
