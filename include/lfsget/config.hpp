#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lfsget {

// ============================================================================
// Runtime Configuration
// ============================================================================
//
// Precedence: built-in defaults < config file < command-line flags.
// The config file is a JSON object; every key is optional.

constexpr const char* CONFIG_ENV_VAR = "LFSGET_CONFIG";

struct FetchConfig {
    // download
    std::size_t chunk_size = 1024;
    std::uint32_t max_retries = 15;
    std::uint32_t retry_delay_seconds = 60;
    std::uint32_t timeout_seconds = 60;

    // verify
    std::uint32_t pointer_timeout_seconds = 10;

    // extract
    bool extract = true;
    std::string extract_to;          // empty: destination's directory
    int max_depth = 1;
    std::size_t parallelism = 0;     // 0: hardware concurrency
    bool track_progress = true;

    // logging
    std::string log_dir = "logs";
    bool log_to_stream = true;
    bool log_to_file = true;
    bool verbose = false;

    std::string source_path;         // file the values came from, for messages
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    FetchConfig config;
    std::vector<std::string> warnings;   // unknown keys
};

// Parse JSON text on top of `base`. Wrong value types and out-of-range numbers
// are errors; unknown keys are warnings.
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path,
                               const FetchConfig& base = FetchConfig{});

ConfigParseResult load_config_file(const std::string& path,
                                   const FetchConfig& base = FetchConfig{});

// Check cross-field constraints (chunk_size > 0, max_depth >= 0, ...)
std::vector<std::string> validate_config(const FetchConfig& config);

} // namespace lfsget
