#pragma once

#include <cstdint>
#include <string>

namespace lfsget {

// ============================================================================
// Error Taxonomy
// ============================================================================
//
// Every component reports failures through a result struct carrying one of
// these kinds. Only TransportError is retried, and only inside the downloader.

enum class ErrorKind {
    None,
    TransportError,          // network, timeout, unexpected HTTP status (retryable)
    RangeAlreadySatisfied,   // HTTP 416 on a resume request: success sentinel
    IntegrityMismatch,       // computed hash != expected, or expected hash absent
    PointerFetchError,       // pointer descriptor unreachable
    ArchiveCorrupt,
    RecursionLimitExceeded,
    UnsafeEntry,             // archive entry escapes the target or is a link/device
    FilesystemError,
    NotFound,
    Cancelled,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::TransportError: return "transport_error";
        case ErrorKind::RangeAlreadySatisfied: return "range_already_satisfied";
        case ErrorKind::IntegrityMismatch: return "integrity_mismatch";
        case ErrorKind::PointerFetchError: return "pointer_fetch_error";
        case ErrorKind::ArchiveCorrupt: return "archive_corrupt";
        case ErrorKind::RecursionLimitExceeded: return "recursion_limit_exceeded";
        case ErrorKind::UnsafeEntry: return "unsafe_entry";
        case ErrorKind::FilesystemError: return "filesystem_error";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::TransportError;
}

// ============================================================================
// Pipeline Stages
// ============================================================================

enum class PipelineStage {
    Idle,
    Downloading,
    Verifying,
    Extracting,
    Done,
    Failed
};

inline const char* to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Idle: return "idle";
        case PipelineStage::Downloading: return "download";
        case PipelineStage::Verifying: return "verify";
        case PipelineStage::Extracting: return "extract";
        case PipelineStage::Done: return "done";
        case PipelineStage::Failed: return "failed";
        default: return "unknown";
    }
}

// ============================================================================
// Process Exit Codes
// ============================================================================

enum class ExitCode : int {
    Success = 0,
    UsageError = 1,
    DownloadFailed = 2,
    IntegrityFailed = 3,
    ExtractionFailed = 4,
    Cancelled = 130
};

} // namespace lfsget
