#pragma once
#include "cancellation.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace shellhost {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string url;
    std::string method = "POST";
    std::vector<Header> headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;       // 0 when no response was received
    std::string status_text;    // reason phrase from the status line
    std::string body;           // only filled for non-2xx responses when streaming
    bool cancelled = false;     // the cancellation token stopped the transfer
    bool no_body = false;       // success status but no response body stream
    std::string error;          // transport error, empty on success

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Raw-chunk streaming callback: receives raw bytes from a 2xx response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Called once when the headers of a 2xx response that will carry a body have
// arrived, before any chunk.
using ResponseCallback = std::function<void(long status)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Perform the request and deliver a successful response body in chunks.
    // A non-2xx body is collected into HttpResponse::body instead. The
    // transfer stops promptly once `cancel` is set.
    virtual HttpResponse stream(const HttpRequest& request,
                                const ResponseCallback& on_response,
                                const RawChunkCallback& on_chunk,
                                const CancellationToken& cancel,
                                long timeout_seconds = 300) = 0;
};

// libcurl implementation
class CurlHttpClient : public HttpClient {
public:
    HttpResponse stream(const HttpRequest& request,
                        const ResponseCallback& on_response,
                        const RawChunkCallback& on_chunk,
                        const CancellationToken& cancel,
                        long timeout_seconds = 300) override;
};

} // namespace shellhost
