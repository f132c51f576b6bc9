#include "http.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <string>

namespace shellhost {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

namespace {

struct StreamContext {
    CURL* curl = nullptr;
    const ResponseCallback* on_response = nullptr;
    const RawChunkCallback* callback = nullptr;
    const CancellationToken* cancel = nullptr;
    HttpResponse* response = nullptr;
    bool status_checked = false;
    bool saw_body = false;
    bool aborted = false;
    bool head = false;
    bool response_fired = false;
};

// Called by curl ~once per second and on every transfer tick; return
// non-zero to abort.
int progress_cb(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<StreamContext*>(clientp);
    return ctx->cancel->cancelled() ? 1 : 0;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* ctx = static_cast<StreamContext*>(userdata);
    std::string line(buffer, total);
    // "HTTP/1.1 404 Not Found": keep the reason phrase of the last status line
    if (starts_with(line, "HTTP/")) {
        auto first = line.find(' ');
        auto second = first == std::string::npos ? first : line.find(' ', first + 1);
        ctx->response->status_text =
            second == std::string::npos ? std::string() : trim(line.substr(second + 1));
    } else if (line == "\r\n" || line == "\n") {
        // End of one header block; interim 1xx blocks are skipped
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (!ctx->response_fired && status >= 200 && status < 300 && status != 204 &&
            !ctx->head && !ctx->cancel->cancelled()) {
            ctx->response_fired = true;
            (*ctx->on_response)(status);
        }
    }
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->aborted || ctx->cancel->cancelled()) return 0;

    if (!ctx->status_checked) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->response->status_code);
        ctx->status_checked = true;
    }
    if (!ctx->response->ok()) {
        ctx->response->body.append(ptr, total);
        return total;
    }

    ctx->saw_body = true;
    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle ──────────────────────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

} // namespace

HttpResponse CurlHttpClient::stream(const HttpRequest& request,
                                    const ResponseCallback& on_response,
                                    const RawChunkCallback& on_chunk,
                                    const CancellationToken& cancel,
                                    long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "Failed to initialise HTTP transfer";
        return response;
    }

    StreamContext ctx;
    ctx.curl = req.curl;
    ctx.on_response = &on_response;
    ctx.callback = &on_chunk;
    ctx.head = request.method == "HEAD";
    ctx.cancel = &cancel;
    ctx.response = &response;

    req.hlist = build_headers(request.headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "GET") {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
    } else {
        if (request.method != "POST")
            curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty() || request.method == "POST") {
            curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
        }
    }

    curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (cancel.cancelled()) {
        response.cancelled = true;
        return response;
    }
    if (res != CURLE_OK && !ctx.aborted) {
        response.error = curl_easy_strerror(res);
        return response;
    }
    // Statuses that never carry a body stream
    if (response.ok() && !ctx.saw_body &&
        (response.status_code == 204 || request.method == "HEAD")) {
        response.no_body = true;
    }
    return response;
}

} // namespace shellhost
