#include "lfsget/http_client.hpp"
#include "lfsget/cancellation.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace lfsget {

// ============================================================================
// libcurl plumbing
// ============================================================================

namespace {

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

constexpr long MIN_BUFFER_SIZE = 1024;
constexpr long MAX_BUFFER_SIZE = 512 * 1024;

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

std::string describe_curl_error(CURLcode code, const char* error_buffer) {
    return std::string("HTTP request failed: ") +
           (error_buffer[0] ? error_buffer : curl_easy_strerror(code));
}

void set_common_options(CURL* curl, const std::string& url, const std::string& user_agent,
                        char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    // Follow redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // TLS verification
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Worker threads may run transfers; keep curl away from SIGALRM
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
}

// ----------------------------------------------------------------------------
// Streaming
// ----------------------------------------------------------------------------

struct StreamContext {
    CURL* curl = nullptr;
    const CancellationToken* cancel = nullptr;
    const HeadCallback* on_head = nullptr;
    const ChunkCallback* on_chunk = nullptr;
    bool head_sent = false;
    bool deliver_body = false;
    bool aborted = false;
};

void deliver_head(StreamContext& ctx) {
    if (ctx.head_sent) return;
    ctx.head_sent = true;

    ResponseHead head;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &head.http_status);

    curl_off_t length = -1;
    if (curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
        length > 0) {
        head.content_length = static_cast<std::uint64_t>(length);
    }

    ctx.deliver_body = is_success_status(head.http_status);
    if (*ctx.on_head) {
        (*ctx.on_head)(head);
    }
}

size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t total = size * nmemb;

    deliver_head(*ctx);

    // Error pages are drained, never handed to the receiver
    if (!ctx->deliver_body) {
        return total;
    }

    if (*ctx->on_chunk && !(*ctx->on_chunk)(ptr, total)) {
        ctx->aborted = true;
        return 0;  // short count makes curl stop with CURLE_WRITE_ERROR
    }
    return total;
}

// Polled by curl about once a second even when no data arrives
int stream_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->cancel && ctx->cancel->is_cancelled()) {
        ctx->aborted = true;
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Buffered fetch
// ----------------------------------------------------------------------------

// Callback for libcurl to write received data
size_t buffer_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

} // namespace

// ============================================================================
// CurlHttpClient
// ============================================================================

CurlHttpClient::CurlHttpClient() : CurlHttpClient("lfsget/1.0") {}

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    get_curl_init();
}

StreamResult CurlHttpClient::stream(const StreamRequest& request,
                                    const HeadCallback& on_head,
                                    const ChunkCallback& on_chunk) {
    StreamResult result;

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    set_common_options(curl.get(), request.url, user_agent_, error_buffer);

    StreamContext ctx;
    ctx.curl = curl.get();
    ctx.on_head = &on_head;
    ctx.on_chunk = &on_chunk;
    ctx.cancel = request.cancel;

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    if (request.cancel) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, stream_progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    long buffer_size = std::clamp(static_cast<long>(request.buffer_size), MIN_BUFFER_SIZE, MAX_BUFFER_SIZE);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, buffer_size);

    std::string range;
    if (request.range_start) {
        range = std::to_string(*request.range_start) + "-";
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    // The timeout bounds connecting and any stall while reading, not the
    // whole transfer: a multi-gigabyte body may take far longer than it.
    long timeout = static_cast<long>(request.timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, timeout);

    CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    if (ctx.aborted) {
        result.aborted = true;
        result.error = "transfer aborted by receiver";
        return result;
    }

    if (res != CURLE_OK) {
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        result.error = describe_curl_error(res, error_buffer);
        return result;
    }

    // Empty bodies never reach the write callback
    deliver_head(ctx);

    result.ok = true;
    return result;
}

FetchResult CurlHttpClient::fetch(const std::string& url, std::chrono::seconds timeout) {
    FetchResult result;

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::vector<uint8_t> buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    set_common_options(curl.get(), url, user_agent_, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, buffer_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        result.error = describe_curl_error(res, error_buffer);
        return result;
    }

    // Get response info
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    char* content_type = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        result.content_type = content_type;
    }

    // Check HTTP status
    if (!is_success_status(result.http_status)) {
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

} // namespace lfsget
