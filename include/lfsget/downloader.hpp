#pragma once

#include "lfsget/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace lfsget {

class CancellationToken;
class HttpClient;
class Logger;

// ============================================================================
// Resumable Download
// ============================================================================

constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024;
constexpr std::uint32_t DEFAULT_MAX_RETRIES = 15;
constexpr std::chrono::seconds DEFAULT_RETRY_DELAY{60};
constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{60};

struct DownloadTask {
    std::string url;
    std::string destination;
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    // Retries after the initial attempt: total attempts = max_retries + 1
    std::uint32_t max_retries = DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_delay = DEFAULT_RETRY_DELAY;
    std::chrono::seconds timeout = DEFAULT_REQUEST_TIMEOUT;
};

struct TransferState {
    std::uint64_t bytes_on_disk_at_start = 0;   // resume offset of this attempt
    std::uint64_t bytes_transferred = 0;        // appended during this attempt
    std::uint64_t expected_total = 0;           // full file size, 0 when unknown

    std::uint64_t bytes_on_disk() const { return bytes_on_disk_at_start + bytes_transferred; }
    bool total_known() const { return expected_total > 0; }
};

// Observer only: called after every chunk written. Must not throw.
using DownloadProgress = std::function<void(const TransferState&)>;

enum class DownloadStatus {
    Completed,          // body received to the end
    AlreadyComplete,    // server answered 416 for the resume offset
    RetriesExhausted,
    FilesystemError,
    Cancelled
};

const char* to_string(DownloadStatus status);

struct DownloadResult {
    bool ok = false;
    DownloadStatus status = DownloadStatus::RetriesExhausted;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;                  // last error seen
    std::uint32_t attempts = 0;         // requests issued
    std::uint64_t bytes_on_disk = 0;    // final destination size
};

// Stream task.url into task.destination, appending to any bytes already
// there. Transport errors are retried up to task.max_retries times with
// task.retry_delay between attempts. Never throws.
DownloadResult download(const DownloadTask& task,
                        HttpClient& client,
                        Logger& logger,
                        const CancellationToken& cancel,
                        const DownloadProgress& progress = nullptr);

} // namespace lfsget
