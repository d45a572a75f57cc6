#pragma once
#include "cancel.hpp"
#include <functional>
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
    std::string content_type;
};

// Receives response body bytes as they arrive (2xx responses only).
using HttpBodySink = std::function<void(const char* data, size_t len)>;

// Throws UpstreamError on transport failure (transient for timeouts and connection
// problems) and CancelledError when opts.token is cancelled mid-transfer.
// Non-2xx responses are returned, not thrown.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, const CallOptions& opts);
HttpResponse http_post_json(const std::string& url, const std::string& json_body, const CallOptions& opts,
                            const HttpBodySink& sink);

// Follows redirects (http and https only). A body over max_bytes (0: unbounded)
// fails with a terminal UpstreamError.
HttpResponse http_get(const std::string& url, const CallOptions& opts, size_t max_bytes);

bool http_status_ok(long status);
bool http_status_transient(long status);
