#include "lfsget/downloader.hpp"
#include "lfsget/cancellation.hpp"
#include "lfsget/http_client.hpp"
#include "lfsget/logger.hpp"
#include "lfsget/platform.hpp"

#include <algorithm>
#include <fstream>
#include <optional>

namespace lfsget {

namespace {

constexpr long HTTP_OK = 200;
constexpr long HTTP_PARTIAL_CONTENT = 206;
constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;

struct AttemptOutcome {
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

// One GET against the current on-disk size. Everything received is appended;
// nothing already on disk is touched.
AttemptOutcome run_attempt(const DownloadTask& task,
                           HttpClient& client,
                           Logger& logger,
                           const CancellationToken& cancel,
                           const DownloadProgress& progress) {
    AttemptOutcome outcome;

    std::optional<std::uint64_t> existing = file_size(task.destination);
    const bool resuming = existing.has_value();

    TransferState state;
    state.bytes_on_disk_at_start = existing.value_or(0);

    StreamRequest request;
    request.url = task.url;
    request.timeout = task.timeout;
    request.buffer_size = task.chunk_size;
    request.cancel = &cancel;
    if (resuming) {
        request.range_start = state.bytes_on_disk_at_start;
        logger.info("Resuming download of '{}' from byte {}", task.destination,
                    state.bytes_on_disk_at_start);
    }

    const std::size_t chunk_size = std::max<std::size_t>(task.chunk_size, 1);
    std::ofstream file;
    std::uint64_t skip = 0;
    bool write_failed = false;
    bool cancelled = false;

    auto on_head = [&](const ResponseHead& head) {
        if (head.http_status == HTTP_OK && state.bytes_on_disk_at_start > 0) {
            // Range ignored: the body restarts at byte 0. Drop the prefix we
            // already hold so the file stays byte-exact.
            skip = state.bytes_on_disk_at_start;
            logger.warn("Server ignored range request; discarding first {} bytes of response",
                        skip);
        }

        if (head.content_length) {
            state.expected_total = (head.http_status == HTTP_PARTIAL_CONTENT)
                ? state.bytes_on_disk_at_start + *head.content_length
                : *head.content_length;
        } else {
            logger.debug("No Content-Length for '{}'; progress will report bytes only", task.url);
        }

        if (head.http_status >= 200 && head.http_status < 300) {
            file.open(task.destination, std::ios::binary | std::ios::app);
            if (!file) {
                write_failed = true;
            }
        }
    };

    auto on_chunk = [&](const char* data, std::size_t size) {
        if (cancel.is_cancelled()) {
            cancelled = true;
            return false;
        }
        if (write_failed) {
            return false;
        }
        if (size == 0) {
            logger.warn("Empty chunk");
            return true;
        }

        if (skip > 0) {
            std::size_t dropped = static_cast<std::size_t>(std::min<std::uint64_t>(skip, size));
            skip -= dropped;
            data += dropped;
            size -= dropped;
        }

        while (size > 0) {
            std::size_t n = std::min(size, chunk_size);
            file.write(data, static_cast<std::streamsize>(n));
            if (!file) {
                write_failed = true;
                return false;
            }
            data += n;
            size -= n;
            state.bytes_transferred += n;
            if (progress) {
                progress(state);
            }
        }
        return true;
    };

    StreamResult response = client.stream(request, on_head, on_chunk);

    if (file.is_open()) {
        file.close();
        if (file.fail()) {
            write_failed = true;
        }
    }

    if (write_failed) {
        outcome.kind = ErrorKind::FilesystemError;
        outcome.error = "failed to write '" + task.destination + "'";
        return outcome;
    }

    if (cancelled || cancel.is_cancelled()) {
        outcome.kind = ErrorKind::Cancelled;
        outcome.error = "download cancelled";
        return outcome;
    }

    if (response.http_status == HTTP_RANGE_NOT_SATISFIABLE && resuming) {
        outcome.kind = ErrorKind::RangeAlreadySatisfied;
        return outcome;
    }

    if (!response.ok) {
        outcome.kind = ErrorKind::TransportError;
        outcome.error = response.error.empty() ? "transfer failed" : response.error;
        return outcome;
    }

    if (response.http_status < 200 || response.http_status >= 300) {
        outcome.kind = ErrorKind::TransportError;
        outcome.error = "HTTP " + std::to_string(response.http_status);
        return outcome;
    }

    if (state.total_known() && state.bytes_on_disk() < state.expected_total) {
        outcome.kind = ErrorKind::TransportError;
        outcome.error = "connection closed at byte " + std::to_string(state.bytes_on_disk()) +
                        " of " + std::to_string(state.expected_total);
        return outcome;
    }

    return outcome;
}

} // namespace

const char* to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Completed: return "completed";
        case DownloadStatus::AlreadyComplete: return "already_complete";
        case DownloadStatus::RetriesExhausted: return "retries_exhausted";
        case DownloadStatus::FilesystemError: return "filesystem_error";
        case DownloadStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

DownloadResult download(const DownloadTask& task,
                        HttpClient& client,
                        Logger& logger,
                        const CancellationToken& cancel,
                        const DownloadProgress& progress) {
    DownloadResult result;

    auto dir = ensure_directory(task.destination, false, logger);
    if (!dir.ok) {
        result.status = DownloadStatus::FilesystemError;
        result.error_kind = ErrorKind::FilesystemError;
        result.error = dir.error;
        return result;
    }

    logger.info("Downloading '{}' to '{}'", task.url, task.destination);

    std::uint32_t retry_count = 0;
    while (true) {
        if (cancel.is_cancelled()) {
            result.status = DownloadStatus::Cancelled;
            result.error_kind = ErrorKind::Cancelled;
            result.error = "download cancelled";
            break;
        }

        AttemptOutcome outcome = run_attempt(task, client, logger, cancel, progress);
        ++result.attempts;

        if (outcome.kind == ErrorKind::None) {
            logger.info("Download complete!");
            result.ok = true;
            result.status = DownloadStatus::Completed;
            break;
        }

        if (outcome.kind == ErrorKind::RangeAlreadySatisfied) {
            logger.info("Range not satisfiable: '{}' is already complete", task.destination);
            result.ok = true;
            result.status = DownloadStatus::AlreadyComplete;
            break;
        }

        result.error_kind = outcome.kind;
        result.error = outcome.error;

        if (outcome.kind == ErrorKind::Cancelled) {
            logger.warn("Download of '{}' cancelled; partial file kept for resume", task.destination);
            result.status = DownloadStatus::Cancelled;
            break;
        }
        if (!is_retryable(outcome.kind)) {
            logger.error("Error occurred: {}", outcome.error);
            result.status = DownloadStatus::FilesystemError;
            break;
        }

        logger.error("Error occurred: {}", outcome.error);

        if (retry_count >= task.max_retries) {
            logger.warn("Max retries ({}) reached. Download terminated.", task.max_retries);
            result.status = DownloadStatus::RetriesExhausted;
            break;
        }

        ++retry_count;
        logger.warn("retry_count: {}, max_retries: {}.", retry_count, task.max_retries);
        logger.warn("Retrying download in {} ms...", task.retry_delay.count());

        if (!cancel.sleep_for(task.retry_delay)) {
            result.status = DownloadStatus::Cancelled;
            result.error_kind = ErrorKind::Cancelled;
            result.error = "download cancelled";
            break;
        }
    }

    result.bytes_on_disk = file_size(task.destination).value_or(0);
    return result;
}

} // namespace lfsget
