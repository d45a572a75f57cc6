#include "api.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const std::size_t kMaxPageSize = 500;

static int parse_int_param(const std::map<std::string, std::string>& q, const std::string& key, int def) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return def;
    try {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        if (used != it->second.size()) throw std::invalid_argument(key);
        return v;
    } catch (const std::logic_error&) {
        throw ValidationError(key + " must be an integer");
    }
}

static std::optional<int> optional_int_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_integer()) throw ValidationError(std::string(key) + " must be an integer");
    return j[key].get<int>();
}

static json parse_object(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("request body is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw ValidationError("request body must be a JSON object");
    return j;
}

QueryRequest parse_query_request(const std::string& body) {
    json j = parse_object(body);
    QueryRequest req;
    if (!j.contains("question") || !j["question"].is_string()) throw InvalidQueryError("question is required");
    req.question = j["question"].get<std::string>();
    if (req.question.empty()) throw InvalidQueryError("question must not be empty");
    req.k = optional_int_field(j, "k");
    if (req.k && (*req.k < 1 || *req.k > kMaxTopK)) {
        throw InvalidQueryError("k must be between 1 and " + std::to_string(kMaxTopK));
    }
    req.context_budget = optional_int_field(j, "context_budget");
    if (req.context_budget && (*req.context_budget < 1 || *req.context_budget > kMaxContextBudget)) {
        throw InvalidQueryError("context_budget must be between 1 and " + std::to_string(kMaxContextBudget));
    }
    if (j.contains("session_id") && !j["session_id"].is_null()) {
        if (!j["session_id"].is_string()) throw ValidationError("session_id must be a string");
        auto sid = j["session_id"].get<std::string>();
        if (!sid.empty()) req.session_id = sid;
    }
    return req;
}

IngestRequest parse_ingest_request(const std::map<std::string, std::string>& query, std::string body) {
    IngestRequest req;
    auto fn = query.find("filename");
    if (fn != query.end()) req.filename = fn->second;
    auto fmt = query.find("format");
    if (fmt != query.end()) req.format = fmt->second;
    if (req.filename.empty() && req.format.empty()) throw ValidationError("filename or format is required");
    if (query.count("chunk_size")) {
        int v = parse_int_param(query, "chunk_size", 0);
        if (v < 1 || v > kMaxChunkSize) {
            throw InvalidChunkConfigError("chunk_size must be between 1 and " + std::to_string(kMaxChunkSize));
        }
        req.chunk_size = v;
    }
    if (query.count("chunk_overlap")) {
        int v = parse_int_param(query, "chunk_overlap", 0);
        if (v < 0 || v > kMaxChunkOverlap) {
            throw InvalidChunkConfigError("chunk_overlap must be between 0 and " + std::to_string(kMaxChunkOverlap));
        }
        req.chunk_overlap = v;
    }
    req.bytes = std::move(body);
    return req;
}

PageRequest parse_page_request(const std::map<std::string, std::string>& query) {
    PageRequest p;
    int limit = parse_int_param(query, "limit", 50);
    int offset = parse_int_param(query, "offset", 0);
    if (limit < 1 || (std::size_t)limit > kMaxPageSize) {
        throw ValidationError("limit must be between 1 and " + std::to_string(kMaxPageSize));
    }
    if (offset < 0) throw ValidationError("offset must not be negative");
    p.limit = (std::size_t)limit;
    p.offset = (std::size_t)offset;
    return p;
}

FeedbackRequest parse_feedback_request(const std::string& body) {
    json j = parse_object(body);
    FeedbackRequest req;
    if (!j.contains("answer_id") || !j["answer_id"].is_string()) throw ValidationError("answer_id is required");
    req.answer_id = j["answer_id"].get<std::string>();
    if (req.answer_id.empty()) throw ValidationError("answer_id is required");
    auto rating = optional_int_field(j, "rating");
    if (!rating) throw ValidationError("rating is required");
    if (*rating < 1 || *rating > 5) throw ValidationError("rating must be between 1 and 5");
    req.rating = *rating;
    if (j.contains("comment") && !j["comment"].is_null()) {
        if (!j["comment"].is_string()) throw ValidationError("comment must be a string");
        req.comment = j["comment"].get<std::string>();
    }
    return req;
}

UrlQaRequest parse_url_qa_request(const std::string& body) {
    json j = parse_object(body);
    UrlQaRequest req;
    if (!j.contains("documents") || !j["documents"].is_string()) {
        throw ValidationError("documents must be the URL of one document");
    }
    req.url = j["documents"].get<std::string>();
    if (!j.contains("questions") || !j["questions"].is_array() || j["questions"].empty()) {
        throw ValidationError("questions must be a non-empty array");
    }
    for (const auto& q : j["questions"]) {
        if (!q.is_string()) throw ValidationError("each question must be a string");
        req.questions.push_back(q.get<std::string>());
    }
    return req;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::validation: return 400;
        case ErrorKind::not_found: return 404;
        case ErrorKind::upstream: return 502;
        case ErrorKind::internal: return 500;
    }
    return 500;
}

ApiResponse error_response(ErrorKind kind, const std::string& message) {
    json out = {{"error", error_kind_name(kind)}, {"message", message}};
    return ApiResponse{http_status_for(kind), out.dump()};
}

static json document_json(const Document& d) {
    json j = {
        {"id", d.id},
        {"filename", d.filename},
        {"format", d.format},
        {"encoding", d.encoding},
        {"uploaded_at", d.uploaded_at},
        {"size", d.size},
        {"status", status_name(d.status)},
        {"chunk_count", d.chunk_count},
        {"chunk_size", d.chunk_size},
        {"chunk_overlap", d.chunk_overlap}
    };
    if (!d.error.empty()) j["error"] = d.error;
    return j;
}

static json citation_json(const Citation& c) {
    json j = {
        {"marker", c.marker},
        {"document_id", c.document_id},
        {"chunk_id", c.chunk_id},
        {"filename", c.filename},
        {"excerpt", c.excerpt},
        {"score", c.score}
    };
    if (c.page > 0) j["page"] = c.page;
    return j;
}

static json message_json(const Message& m) {
    return json{{"role", m.role}, {"text", m.text}, {"timestamp", m.timestamp}};
}

static json query_result_json(const QueryResult& res) {
    json sources = json::array();
    for (const auto& c : res.sources) sources.push_back(citation_json(c));
    json out = {
        {"answer", res.answer},
        {"sources", sources},
        {"confidence", res.confidence},
        {"answer_id", res.answer_id},
        {"found", res.found},
        {"processing_ms", res.processing_ms}
    };
    if (!res.session_id.empty()) out["session_id"] = res.session_id;
    return out;
}

static ApiResponse ok(const json& j, int status = 200) {
    return ApiResponse{status, j.dump()};
}

// "/documents/<id>" and "/documents/<id>/<tail>"; returns false for other shapes.
static bool split_resource(const std::string& path, const std::string& prefix, std::string& id, std::string& tail) {
    if (path.rfind(prefix, 0) != 0) return false;
    std::string rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    id = rest.substr(0, slash);
    tail = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
    return !id.empty();
}

static ApiResponse route(RagService& svc, const ApiRequest& req) {
    const std::string& m = req.method;
    const std::string& path = req.path;
    std::string id, tail;

    if (m == "POST" && path == "/documents") {
        auto receipt = svc.ingest(parse_ingest_request(req.query, req.body));
        return ok({{"document_id", receipt.document_id}, {"status", status_name(receipt.status)},
                   {"queued", receipt.queued}}, 202);
    }
    if (m == "GET" && path == "/documents") {
        auto p = parse_page_request(req.query);
        auto page = svc.list_documents(p.limit, p.offset);
        json items = json::array();
        for (const auto& d : page.items) items.push_back(document_json(d));
        return ok({{"documents", items}, {"total", page.total}, {"limit", p.limit}, {"offset", p.offset}});
    }
    if (split_resource(path, "/documents/", id, tail)) {
        if (m == "GET" && tail.empty()) {
            auto detail = svc.document(id);
            json chunks = json::array();
            for (const auto& c : detail.chunks) {
                json cj = {{"chunk_id", c.chunk_id}, {"sequence_index", c.sequence_index},
                           {"start", c.start}, {"end", c.end}, {"text", c.text}};
                if (c.page > 0) cj["page"] = c.page;
                chunks.push_back(cj);
            }
            json out = document_json(detail.document);
            out["chunks"] = chunks;
            return ok(out);
        }
        if (m == "GET" && tail == "status") {
            return ok({{"document_id", id}, {"status", status_name(svc.status(id))}});
        }
        if (m == "DELETE" && tail.empty()) {
            if (!svc.remove(id)) throw DocumentNotFoundError(id);
            return ok({{"ok", true}, {"document_id", id}});
        }
    }
    if (m == "POST" && path == "/query") {
        auto q = parse_query_request(req.body);
        q.token = req.token;
        return ok(query_result_json(svc.query(q)));
    }
    if (m == "POST" && path == "/feedback") {
        auto f = parse_feedback_request(req.body);
        auto feedback_id = svc.submit_feedback(f);
        return ok({{"feedback_id", feedback_id}, {"answer_id", f.answer_id}, {"rating", f.rating}}, 201);
    }
    if (m == "GET" && path == "/feedback") {
        auto it = req.query.find("answer_id");
        if (it == req.query.end() || it->second.empty()) throw ValidationError("answer_id is required");
        json arr = json::array();
        for (const auto& f : svc.feedback(it->second)) {
            json fj = {{"feedback_id", f.id}, {"rating", f.rating}, {"created", f.created}};
            if (!f.comment.empty()) fj["comment"] = f.comment;
            arr.push_back(fj);
        }
        return ok({{"answer_id", it->second}, {"feedback", arr}});
    }
    if (m == "POST" && path == "/run") {
        auto r = parse_url_qa_request(req.body);
        auto result = svc.ask_url(r.url, r.questions, req.token);
        json answers = json::array();
        for (const auto& a : result.answers) {
            json aj = {{"question", a.question}};
            if (a.error.empty()) {
                aj.update(query_result_json(a.result));
            } else {
                aj["error"] = a.error;
            }
            answers.push_back(aj);
        }
        return ok({{"document_id", result.document_id}, {"filename", result.filename}, {"answers", answers}});
    }
    if (m == "GET" && path == "/health") {
        auto s = svc.stats();
        bool up = svc.running();
        return ok({{"status", up ? "healthy" : "stopped"}, {"documents", s.document_count},
                   {"index_size", s.index_size}}, up ? 200 : 503);
    }
    if (m == "GET" && path == "/sessions") {
        json arr = json::array();
        for (const auto& s : svc.list_sessions()) {
            arr.push_back({{"session_id", s.id}, {"message_count", s.message_count},
                           {"created", s.created}, {"last_activity", s.last_activity}});
        }
        return ok({{"sessions", arr}});
    }
    if (split_resource(path, "/sessions/", id, tail)) {
        if (m == "GET" && tail == "history") {
            auto p = parse_page_request(req.query);
            json arr = json::array();
            for (const auto& msg : svc.session_history(id, p.limit, p.offset)) arr.push_back(message_json(msg));
            return ok({{"session_id", id}, {"messages", arr}});
        }
        if (m == "DELETE" && tail.empty()) {
            if (!svc.delete_session(id)) throw SessionNotFoundError(id);
            return ok({{"ok", true}, {"session_id", id}});
        }
    }
    if (m == "GET" && path == "/stats") {
        auto s = svc.stats();
        return ok({
            {"document_count", s.document_count},
            {"ready_document_count", s.ready_document_count},
            {"chunk_count", s.chunk_count},
            {"index_size", s.index_size},
            {"dimension", s.dimension},
            {"session_count", s.session_count},
            {"total_queries", s.total_queries},
            {"average_query_ms", s.average_query_ms}
        });
    }
    return ApiResponse{404, json({{"error", "not_found"}, {"message", "no route for " + m + " " + path}}).dump()};
}

ApiResponse handle_request(RagService& svc, const ApiRequest& req) {
    try {
        return route(svc, req);
    } catch (const RagError& e) {
        if (e.kind() == ErrorKind::internal) log_error("ragd", req.method + " " + req.path + ": " + e.what());
        return error_response(e.kind(), e.what());
    } catch (const std::exception& e) {
        log_error("ragd", req.method + " " + req.path + ": " + e.what());
        return error_response(ErrorKind::internal, e.what());
    }
}

std::string sse_frame(const std::string& data) {
    return "data: " + data + "\n\n";
}

void run_query_stream(RagService& svc, QueryRequest req, const SseWriter& write) {
    auto send = [&](const json& event) {
        write(sse_frame(event.dump(-1, ' ', false, json::error_handler_t::replace)));
    };
    try {
        send({{"type", "start"}, {"question", req.question}});
        req.on_fragment = [&](const std::string& text) { send({{"type", "fragment"}, {"text", text}}); };
        json done = query_result_json(svc.query(req));
        done["type"] = "complete";
        send(done);
    } catch (const RagError& e) {
        if (e.kind() == ErrorKind::internal) log_error("ragd", std::string("query stream: ") + e.what());
        try {
            send({{"type", "error"}, {"error", error_kind_name(e.kind())}, {"message", e.what()}});
        } catch (const std::exception& w) {
            log_warn("ragd", std::string("query stream closed: ") + w.what());
            return;
        }
    } catch (const std::exception& e) {
        log_error("ragd", std::string("query stream: ") + e.what());
        try {
            send({{"type", "error"}, {"error", error_kind_name(ErrorKind::internal)}, {"message", e.what()}});
        } catch (const std::exception& w) {
            log_warn("ragd", std::string("query stream closed: ") + w.what());
            return;
        }
    }
    try {
        write(sse_frame("[DONE]"));
    } catch (const std::exception& e) {
        log_warn("ragd", std::string("query stream closed: ") + e.what());
    }
}
