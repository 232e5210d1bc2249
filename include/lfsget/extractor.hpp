#pragma once

#include "lfsget/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace lfsget {

class CancellationToken;
class Logger;

// ============================================================================
// Recursive Archive Extraction
// ============================================================================

// Depth of a job that has not been entered yet. Each extraction adds one on
// entry, so the requested container is extracted at depth 0.
constexpr int BEFORE_FIRST_EXTRACTION = -1;
constexpr int DEFAULT_MAX_DEPTH = 1;

struct ExtractionJob {
    std::string container_path;
    std::string target_dir;
    int current_depth = BEFORE_FIRST_EXTRACTION;
    int max_depth = DEFAULT_MAX_DEPTH;
};

struct ExtractProgress {
    std::uint64_t processed = 0;    // entries written so far, all levels
    std::uint64_t total = 0;        // entries known so far, grows as nested containers open
};

// Observer only. May be called from several worker threads, never concurrently.
using ExtractProgressCallback = std::function<void(const ExtractProgress&)>;

struct ExtractOptions {
    bool track_progress = false;
    std::size_t parallelism = 0;    // workers for the whole extraction, 0 = hardware
    ExtractProgressCallback progress;
};

struct ExtractFailure {
    std::string container_path;
    int depth = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

struct ExtractResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;     // kind of the first failure
    std::string error;
    std::uint64_t entries_extracted = 0;        // all levels
    std::uint32_t nested_extracted = 0;         // nested containers fully expanded
    std::vector<ExtractFailure> failures;       // every failure, in discovery order
};

// Extract job.container_path into job.target_dir, then every nested container
// found there into a sibling directory named after it, down to job.max_depth.
// Nested containers are removed once expanded; the requested one is kept.
ExtractResult extract(const ExtractionJob& job,
                      const ExtractOptions& options,
                      Logger& logger,
                      const CancellationToken& cancel);

} // namespace lfsget
