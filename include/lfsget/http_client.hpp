#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lfsget {

class CancellationToken;

// ============================================================================
// HTTP Transport
// ============================================================================
//
// The downloader and verifier talk to the network only through HttpClient.
// CurlHttpClient is the production implementation; tests substitute an
// in-memory fake.

struct StreamRequest {
    std::string url;
    std::optional<std::uint64_t> range_start;   // sends "Range: bytes=<n>-"
    std::chrono::seconds timeout{60};           // connect and read-stall timeout
    std::size_t buffer_size = 16384;            // preferred receive buffer
    const CancellationToken* cancel = nullptr;  // aborts the transfer, even while stalled
};

struct ResponseHead {
    long http_status = 0;
    std::optional<std::uint64_t> content_length;   // absent when not sent
};

// Called once with the status line and length before any body bytes.
using HeadCallback = std::function<void(const ResponseHead&)>;

// Called for each body chunk of a 2xx response. Return false to abort the
// transfer (cancellation, disk failure).
using ChunkCallback = std::function<bool(const char* data, std::size_t size)>;

struct StreamResult {
    bool ok = false;             // transfer ran to completion at transport level
    bool aborted = false;        // a callback returned false
    bool timed_out = false;
    long http_status = 0;
    std::string error;
};

struct FetchResult {
    bool ok = false;
    bool timed_out = false;
    std::string error;
    std::vector<std::uint8_t> data;
    long http_status = 0;
    std::string content_type;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Stream a GET response. Bodies of non-2xx responses are not delivered to
    // on_chunk; the status is reported in the result.
    virtual StreamResult stream(const StreamRequest& request,
                                const HeadCallback& on_head,
                                const ChunkCallback& on_chunk) = 0;

    // Fetch a small resource fully into memory. Non-2xx is a failure.
    virtual FetchResult fetch(const std::string& url, std::chrono::seconds timeout) = 0;
};

// libcurl-backed client. Follows redirects and verifies TLS certificates.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    explicit CurlHttpClient(std::string user_agent);

    StreamResult stream(const StreamRequest& request,
                        const HeadCallback& on_head,
                        const ChunkCallback& on_chunk) override;

    FetchResult fetch(const std::string& url, std::chrono::seconds timeout) override;

private:
    std::string user_agent_;
};

} // namespace lfsget
