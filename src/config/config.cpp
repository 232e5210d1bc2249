#include "lfsget/config.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace lfsget {

namespace {

const char* const KNOWN_KEYS[] = {
    "chunk_size", "max_retries", "retry_delay_seconds", "timeout_seconds",
    "pointer_timeout_seconds", "extract", "extract_to", "max_depth", "parallelism",
    "track_progress", "log_dir", "log_to_stream", "log_to_file", "verbose",
};

bool is_known_key(const std::string& key) {
    return std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) != std::end(KNOWN_KEYS);
}

// Each reader leaves `out` untouched when the key is absent and sets `error`
// when it is present with the wrong type or range.

bool read_bool(const nlohmann::json& j, const char* key, bool& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) {
        error = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

bool read_string(const nlohmann::json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

template <typename T>
bool read_unsigned(const nlohmann::json& j, const char* key, T& out, std::string& error) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<std::int64_t>() < 0)) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    auto value = v.get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool read_int(const nlohmann::json& j, const char* key, int& out, std::string& error) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    auto value = v.get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace

ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path,
                               const FetchConfig& base) {
    ConfigParseResult result;
    result.config = base;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!is_known_key(it.key())) {
                result.warnings.push_back("unknown config key: " + it.key());
            }
        }

        FetchConfig& c = result.config;
        std::string error;
        bool ok = read_unsigned(j, "chunk_size", c.chunk_size, error) &&
                  read_unsigned(j, "max_retries", c.max_retries, error) &&
                  read_unsigned(j, "retry_delay_seconds", c.retry_delay_seconds, error) &&
                  read_unsigned(j, "timeout_seconds", c.timeout_seconds, error) &&
                  read_unsigned(j, "pointer_timeout_seconds", c.pointer_timeout_seconds, error) &&
                  read_bool(j, "extract", c.extract, error) &&
                  read_string(j, "extract_to", c.extract_to, error) &&
                  read_int(j, "max_depth", c.max_depth, error) &&
                  read_unsigned(j, "parallelism", c.parallelism, error) &&
                  read_bool(j, "track_progress", c.track_progress, error) &&
                  read_string(j, "log_dir", c.log_dir, error) &&
                  read_bool(j, "log_to_stream", c.log_to_stream, error) &&
                  read_bool(j, "log_to_file", c.log_to_file, error) &&
                  read_bool(j, "verbose", c.verbose, error);
        if (!ok) {
            result.error = error;
            return result;
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config_file(const std::string& path, const FetchConfig& base) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.config = base;
        result.error = "cannot open config file: " + path;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path, base);
}

std::vector<std::string> validate_config(const FetchConfig& config) {
    std::vector<std::string> errors;

    if (config.chunk_size == 0) {
        errors.push_back("chunk_size must be greater than 0");
    }
    if (config.timeout_seconds == 0) {
        errors.push_back("timeout_seconds must be greater than 0");
    }
    if (config.pointer_timeout_seconds == 0) {
        errors.push_back("pointer_timeout_seconds must be greater than 0");
    }
    if (config.max_depth < 0) {
        errors.push_back("max_depth must be 0 or greater");
    }
    if (!config.log_to_stream && !config.log_to_file) {
        errors.push_back("at least one of log_to_stream and log_to_file must be enabled");
    }
    if (config.log_to_file && config.log_dir.empty()) {
        errors.push_back("log_dir must not be empty when log_to_file is enabled");
    }

    return errors;
}

} // namespace lfsget
