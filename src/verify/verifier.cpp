#include "lfsget/verifier.hpp"
#include "lfsget/cancellation.hpp"
#include "lfsget/http_client.hpp"
#include "lfsget/logger.hpp"
#include "lfsget/pointer.hpp"

#include <fstream>

#include <openssl/evp.h>

namespace lfsget {

namespace {

constexpr std::size_t HASH_BLOCK_SIZE = 8192;

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool init_sha256(EvpMdCtx& ctx, HashResult& result) {
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return false;
    }
    return true;
}

bool finish_sha256(EvpMdCtx& ctx, HashResult& result) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return false;
    }
    result.hex_digest = bytes_to_hex(hash, hash_len);
    return true;
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!init_sha256(ctx, result)) return result;

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }
    result.bytes_hashed = data.size();

    if (!finish_sha256(ctx, result)) return result;
    result.ok = true;
    return result;
}

HashResult compute_sha256_file(const std::string& file_path, const CancellationToken& cancel) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!init_sha256(ctx, result)) return result;

    char buffer[HASH_BLOCK_SIZE];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (cancel.is_cancelled()) {
            result.error = "hashing cancelled";
            return result;
        }
        auto n = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer, n) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
        result.bytes_hashed += n;
    }

    if (file.bad()) {
        result.error = "read error: " + file_path;
        return result;
    }

    if (!finish_sha256(ctx, result)) return result;
    result.ok = true;
    return result;
}

const char* to_string(VerifyStatus status) {
    switch (status) {
        case VerifyStatus::Match: return "match";
        case VerifyStatus::Mismatch: return "mismatch";
        case VerifyStatus::MissingExpectedHash: return "missing_expected_hash";
        case VerifyStatus::FileError: return "file_error";
        case VerifyStatus::PointerFetchError: return "pointer_fetch_error";
        case VerifyStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

bool digests_match(const std::string& computed, const std::optional<std::string>& expected) {
    if (!expected || computed.empty()) return false;
    return computed == *expected;
}

VerifyResult verify(const std::string& file_path,
                    const std::string& pointer_url,
                    HttpClient& client,
                    Logger& logger,
                    const CancellationToken& cancel,
                    std::chrono::seconds pointer_timeout) {
    VerifyResult result;

    // CURLOPT_TIMEOUT 0 would mean no limit at all
    if (pointer_timeout.count() <= 0) {
        result.status = VerifyStatus::PointerFetchError;
        result.error_kind = ErrorKind::PointerFetchError;
        result.error = "pointer timeout must be greater than 0";
        logger.error("{}", result.error);
        return result;
    }

    logger.info("Computing SHA-256 of '{}'", file_path);
    HashResult hash = compute_sha256_file(file_path, cancel);
    if (cancel.is_cancelled()) {
        result.status = VerifyStatus::Cancelled;
        result.error_kind = ErrorKind::Cancelled;
        result.error = "verification cancelled";
        return result;
    }
    if (!hash.ok) {
        result.status = VerifyStatus::FileError;
        result.error_kind = ErrorKind::FilesystemError;
        result.error = hash.error;
        logger.error("Cannot hash '{}': {}", file_path, hash.error);
        return result;
    }
    result.computed_sha256 = hash.hex_digest;
    result.actual_size = hash.bytes_hashed;
    logger.debug("Computed SHA-256: {}", result.computed_sha256);

    logger.info("Fetching pointer from {}", pointer_url);
    FetchResult fetched = client.fetch(pointer_url, pointer_timeout);
    if (!fetched.ok) {
        result.status = VerifyStatus::PointerFetchError;
        result.error_kind = ErrorKind::PointerFetchError;
        result.error = fetched.timed_out ? "timed out fetching pointer: " + fetched.error
                                         : "failed to fetch pointer: " + fetched.error;
        logger.error("{}", result.error);
        return result;
    }

    PointerDescriptor pointer = parse_pointer(fetched.data);
    result.expected_sha256 = pointer.sha256;
    result.expected_size = pointer.size;

    if (!pointer.sha256) {
        result.status = VerifyStatus::MissingExpectedHash;
        result.error_kind = ErrorKind::IntegrityMismatch;
        result.error = pointer.error;
        logger.error("Pointer at {} has no expected hash: {}", pointer_url, pointer.error);
        return result;
    }
    logger.debug("Expected SHA-256: {}", *pointer.sha256);

    if (pointer.size && *pointer.size != result.actual_size) {
        logger.warn("Pointer declares {} bytes but '{}' holds {}", *pointer.size, file_path,
                    result.actual_size);
    }

    if (digests_match(result.computed_sha256, result.expected_sha256)) {
        result.status = VerifyStatus::Match;
        logger.info("SHA-256 checksum verified successfully.");
    } else {
        result.status = VerifyStatus::Mismatch;
        result.error_kind = ErrorKind::IntegrityMismatch;
        result.error = "SHA-256 mismatch: expected " + *result.expected_sha256 + ", got " +
                       result.computed_sha256;
        logger.error("SHA-256 checksum verification failed.");
    }
    return result;
}

} // namespace lfsget
