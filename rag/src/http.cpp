#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>
#include <exception>
#include <mutex>

namespace {

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw UpstreamError("curl_easy_init failed", false); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

struct Transfer {
    CURL* curl{nullptr};
    std::string buf;
    const HttpBodySink* sink{nullptr};
    std::exception_ptr sink_error;
    const CancellationToken* token{nullptr};
    size_t max_bytes{0}; // 0: unbounded
    bool too_large{false};
};

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* t = static_cast<Transfer*>(userp);
    if (t->sink && *t->sink) {
        long status = 0;
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &status);
        if (http_status_ok(status)) {
            try {
                (*t->sink)(static_cast<const char*>(contents), total);
            } catch (...) {
                t->sink_error = std::current_exception();
                return 0;
            }
            return total;
        }
    }
    if (t->max_bytes && t->buf.size() + total > t->max_bytes) {
        t->too_large = true;
        return 0;
    }
    t->buf.append(static_cast<char*>(contents), total);
    return total;
}

int progress_cb(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userp);
    return (t->token && t->token->cancelled()) ? 1 : 0;
}

bool curl_code_transient(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

void global_init_once() {
    static std::once_flag once;
    std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}

bool http_status_ok(long status) {
    return status >= 200 && status < 300;
}

bool http_status_transient(long status) {
    return status == 408 || status == 425 || status == 429 || status >= 500;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, const CallOptions& opts) {
    return http_post_json(url, json_body, opts, HttpBodySink{});
}

// Runs a prepared transfer and maps curl failures onto the upstream error types.
static HttpResponse perform(CurlHandle& c, Transfer& t, const std::string& url, const CallOptions& opts) {
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, opts.timeout_ms);

    CURLcode code = curl_easy_perform(c.h);
    if (t.sink_error) std::rethrow_exception(t.sink_error);
    if (code == CURLE_ABORTED_BY_CALLBACK && opts.token.cancelled()) {
        throw CancelledError("request cancelled: " + url);
    }
    if (t.too_large) {
        throw UpstreamError("response from " + url + " exceeds " + std::to_string(t.max_bytes) + " bytes", false);
    }
    if (code != CURLE_OK) {
        throw UpstreamError(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code),
                            curl_code_transient(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    char* type = nullptr;
    if (curl_easy_getinfo(c.h, CURLINFO_CONTENT_TYPE, &type) == CURLE_OK && type) resp.content_type = type;
    resp.body = std::move(t.buf);
    return resp;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, const CallOptions& opts,
                            const HttpBodySink& sink) {
    global_init_once();
    if (opts.token.cancelled()) throw CancelledError("request cancelled before start: " + url);

    CurlHandle c;
    HeaderList headers;
    headers.list = curl_slist_append(headers.list, "Content-Type: application/json");

    Transfer t;
    t.curl = c.h;
    t.sink = &sink;
    t.token = &opts.token;

    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    return perform(c, t, url, opts);
}

HttpResponse http_get(const std::string& url, const CallOptions& opts, size_t max_bytes) {
    global_init_once();
    if (opts.token.cancelled()) throw CancelledError("request cancelled before start: " + url);

    CurlHandle c;
    Transfer t;
    t.curl = c.h;
    t.token = &opts.token;
    t.max_bytes = max_bytes;

    curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(c.h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(c.h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    return perform(c, t, url, opts);
}
