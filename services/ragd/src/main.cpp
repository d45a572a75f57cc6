#include <algorithm>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <iostream>
#include <map>
#include <mutex>
#include <pthread.h>
#include <string>
#include <thread>
#include <microhttpd.h>
#include "api.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rag.hpp"

#if MHD_VERSION >= 0x00097002
using mhd_result = enum MHD_Result;
#else
using mhd_result = int;
#endif

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    bool too_large{false};
    CancellationToken token;
};

// Event frames handed from the query thread to MHD's content reader.
struct EventStream {
    std::mutex mtx;
    std::condition_variable cv;
    std::string pending;
    bool finished{false};
    CancellationToken token;
    std::thread producer;
};

struct ServerContext {
    RagService* svc;
    std::size_t max_body;
};

static mhd_result send_response(struct MHD_Connection* conn, const ApiResponse& r) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(r.body.size(), (void*)r.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, r.content_type.c_str());
    mhd_result ret = MHD_queue_response(conn, (unsigned int)r.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static ssize_t read_events(void* cls, uint64_t /*pos*/, char* buf, size_t max) {
    auto* es = static_cast<EventStream*>(cls);
    std::unique_lock<std::mutex> lock(es->mtx);
    es->cv.wait(lock, [es]{ return !es->pending.empty() || es->finished; });
    if (es->pending.empty()) return MHD_CONTENT_READER_END_OF_STREAM;
    size_t n = std::min(max, es->pending.size());
    std::memcpy(buf, es->pending.data(), n);
    es->pending.erase(0, n);
    return (ssize_t)n;
}

// Runs when MHD drops the response, after the last frame or when the client went away.
static void free_events(void* cls) {
    auto* es = static_cast<EventStream*>(cls);
    es->token.cancel();
    if (es->producer.joinable()) es->producer.join();
    delete es;
}

static mhd_result send_event_stream(struct MHD_Connection* conn, RagService& svc, QueryRequest req) {
    auto* es = new EventStream;
    req.token = es->token;
    es->producer = std::thread([es, &svc, req]() mutable {
        run_query_stream(svc, std::move(req), [es](const std::string& frame) {
            std::lock_guard<std::mutex> lock(es->mtx);
            es->pending += frame;
            es->cv.notify_all();
        });
        std::lock_guard<std::mutex> lock(es->mtx);
        es->finished = true;
        es->cv.notify_all();
    });
    struct MHD_Response* resp = MHD_create_response_from_callback(MHD_SIZE_UNKNOWN, 4096, &read_events, es,
                                                                  &free_events);
    if (!resp) {
        free_events(es);
        return MHD_NO;
    }
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "text/event-stream");
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CACHE_CONTROL, "no-cache");
    mhd_result ret = MHD_queue_response(conn, MHD_HTTP_OK, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> mhd_result {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static mhd_result handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                          const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* ctx = static_cast<ServerContext*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo;
        ci->method = method;
        ci->url = url;
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        if (!ci->too_large) {
            if (ci->body.size() + *upload_data_size > ctx->max_body) {
                ci->too_large = true;
                ci->body.clear();
            } else {
                ci->body.append(upload_data, *upload_data_size);
            }
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    if (ci->too_large) {
        return send_response(connection, error_response(ErrorKind::validation,
            "request body exceeds " + std::to_string(ctx->max_body) + " bytes"));
    }
    if (ci->method == "POST" && ci->url == "/query/stream") {
        QueryRequest q;
        try {
            q = parse_query_request(ci->body);
        } catch (const RagError& e) {
            return send_response(connection, error_response(e.kind(), e.what()));
        }
        return send_event_stream(connection, *ctx->svc, std::move(q));
    }
    ApiRequest req{ci->method, ci->url, parse_query(connection), std::move(ci->body), ci->token};
    return send_response(connection, handle_request(*ctx->svc, req));
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode toe) {
    auto* ci = static_cast<ConnInfo*>(*con_cls);
    if (ci && toe != MHD_REQUEST_TERMINATED_COMPLETED_OK) ci->token.cancel();
    delete ci;
    *con_cls = nullptr;
}

int main(int argc, char** argv) {
    ServiceConfig cfg;
    try {
        cfg = load_config_from_env();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc) cfg.port = std::stoi(argv[++i]);
            else if (a == "--store" && i + 1 < argc) cfg.store_dir = argv[++i];
            else {
                std::cerr << "ragd usage: ragd [--port N] [--store <dir>]\n";
                return 2;
            }
        }
        validate_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
    set_log_level(cfg.log_level);

    // Signals are taken by sigwait below; every thread started from here inherits the mask.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    RagService svc(cfg);
    try {
        svc.init();
    } catch (const std::exception& e) {
        log_error("ragd", std::string("cannot start: ") + e.what());
        return 1;
    }

    // Raw uploads carry the document itself; leave room for the JSON endpoints too.
    ServerContext ctx{&svc, cfg.max_file_bytes + 64 * 1024};
    log_info("ragd", "Starting HTTP server on port " + std::to_string(cfg.port) + "...");
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)cfg.port,
                                            nullptr, nullptr, &handler, &ctx,
                                            MHD_OPTION_THREAD_POOL_SIZE, (unsigned int)4,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        log_error("ragd", "Failed to start HTTP server");
        return 1;
    }
    int sig = 0;
    sigwait(&stop_signals, &sig);

    log_info("ragd", std::string("stopping on ") + (sig == SIGINT ? "SIGINT" : "SIGTERM"));
    MHD_stop_daemon(d);
    try {
        svc.shutdown();
    } catch (const std::exception& e) {
        log_error("ragd", std::string("shutdown failed: ") + e.what());
        return 1;
    }
    return 0;
}
