#pragma once
#include "rag.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
    CancellationToken token; // cancelled when the client goes away
};

struct ApiResponse {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

struct PageRequest {
    std::size_t limit{50};
    std::size_t offset{0};
};

// Boundary parsing. Each throws ValidationError (or InvalidQueryError /
// InvalidChunkConfigError) before anything reaches the service.
QueryRequest parse_query_request(const std::string& body);
IngestRequest parse_ingest_request(const std::map<std::string, std::string>& query, std::string body);
PageRequest parse_page_request(const std::map<std::string, std::string>& query);
FeedbackRequest parse_feedback_request(const std::string& body);

struct UrlQaRequest {
    std::string url;
    std::vector<std::string> questions;
};
UrlQaRequest parse_url_qa_request(const std::string& body);

int http_status_for(ErrorKind kind);
ApiResponse error_response(ErrorKind kind, const std::string& message);

// Routes one request onto the service. Never throws.
ApiResponse handle_request(RagService& svc, const ApiRequest& req);

// Receives each server-sent event frame in order.
using SseWriter = std::function<void(const std::string& frame)>;

// One "data: <json>\n\n" frame.
std::string sse_frame(const std::string& data);

// Answers one query as a stream of events: start, fragment*, then complete or error,
// followed by [DONE]. Never throws; a failure after start becomes an error event.
void run_query_stream(RagService& svc, QueryRequest req, const SseWriter& write);
