#include "lfsget/platform.hpp"
#include "lfsget/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <random>
#include <system_error>

namespace lfsget {

namespace fs = std::filesystem;

EnsureDirectoryResult ensure_directory(const std::string& path, bool is_directory,
                                       Logger& logger) {
    EnsureDirectoryResult result;

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        result.error = "cannot resolve path '" + path + "': " + ec.message();
        logger.error("Error while creating directory for '{}': {}", path, ec.message());
        return result;
    }

    fs::path directory = is_directory ? absolute : absolute.parent_path();
    result.directory = directory.lexically_normal().string();
    if (result.directory.empty()) {
        // Bare file name: the working directory always exists
        result.ok = true;
        return result;
    }

    if (fs::is_directory(directory, ec)) {
        logger.debug("Directory already exists: {}", result.directory);
        result.ok = true;
        return result;
    }

    logger.debug("Creating directory: {}", result.directory);
    bool created = fs::create_directories(directory, ec);
    if (ec) {
        // Another worker may have won the race; that is still success
        std::error_code probe;
        if (fs::is_directory(directory, probe)) {
            result.ok = true;
            return result;
        }
        result.error = "failed to create directory '" + result.directory + "': " + ec.message();
        logger.error("Error while creating directory '{}': {}", result.directory, ec.message());
        return result;
    }

    result.created = created;
    result.ok = true;
    if (created) {
        logger.debug("Created directory: {}", result.directory);
    }
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec) return path;
    return p.lexically_normal().string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<std::uint64_t>(size);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_file_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    // No colons: the result ends up in file names
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // Variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace lfsget
