#pragma once

#include "lfsget/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lfsget {

class CancellationToken;
class HttpClient;
class Logger;

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
    std::uint64_t bytes_hashed = 0;
};

HashResult compute_sha256(const std::vector<std::uint8_t>& data);

// Streams the file in fixed-size blocks; memory use is independent of size
HashResult compute_sha256_file(const std::string& file_path,
                               const CancellationToken& cancel);

// ============================================================================
// Checksum Verification
// ============================================================================

constexpr std::chrono::seconds DEFAULT_POINTER_TIMEOUT{10};

enum class VerifyStatus {
    Match,
    Mismatch,
    MissingExpectedHash,    // pointer had no "oid sha256:" line
    FileError,              // local file unreadable
    PointerFetchError,      // pointer unreachable, timed out or non-2xx
    Cancelled
};

const char* to_string(VerifyStatus status);

struct VerifyResult {
    VerifyStatus status = VerifyStatus::FileError;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::string computed_sha256;
    std::optional<std::string> expected_sha256;
    std::optional<std::uint64_t> expected_size;
    std::uint64_t actual_size = 0;

    bool matches() const { return status == VerifyStatus::Match; }
};

// Exact comparison of lowercase digests. An absent expected hash never matches.
bool digests_match(const std::string& computed, const std::optional<std::string>& expected);

// Hash file_path, fetch the pointer at pointer_url and compare. No retries.
VerifyResult verify(const std::string& file_path,
                    const std::string& pointer_url,
                    HttpClient& client,
                    Logger& logger,
                    const CancellationToken& cancel,
                    std::chrono::seconds pointer_timeout = DEFAULT_POINTER_TIMEOUT);

} // namespace lfsget
