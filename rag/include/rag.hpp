#pragma once
#include "answer.hpp"
#include "cancel.hpp"
#include "config.hpp"
#include "document.hpp"
#include "embedding.hpp"
#include "generation.hpp"
#include "ingest_queue.hpp"
#include "retrieval.hpp"
#include "session_store.hpp"
#include "store.hpp"
#include "vector_index.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Request-level limits checked before anything reaches the pipeline.
constexpr std::size_t kMaxQuestionChars = 1000;
constexpr int kMaxTopK = 20;
constexpr int kMaxContextBudget = 100000;
constexpr int kMaxChunkSize = 5000;
constexpr int kMaxChunkOverlap = 1000;
constexpr std::size_t kMaxFeedbackCommentChars = 1000;

struct IngestRequest {
    std::string bytes;
    std::string filename;
    std::string format; // empty: from the filename extension
    std::optional<int> chunk_size;
    std::optional<int> chunk_overlap;
};

struct IngestReceipt {
    std::string document_id;
    ProcessingStatus status{ProcessingStatus::pending};
    bool queued{false}; // false when an existing document was returned
};

struct QueryRequest {
    std::string question;
    std::optional<int> k;
    std::optional<int> context_budget;
    std::optional<std::string> session_id;
    bool stateless{false}; // no session is read or written
    CancellationToken token;
    // When set, answer text is forwarded as it is generated; the not-found reply arrives as one fragment.
    FragmentSink on_fragment;
};

struct QueryResult {
    std::string answer;
    std::vector<Citation> sources;
    double confidence{0.0};
    std::string session_id;
    std::string answer_id;
    bool found{false};
    int64_t processing_ms{0};
};

struct FeedbackRequest {
    std::string answer_id;
    int rating{0};
    std::optional<std::string> comment;
};

struct FetchedDocument {
    std::string bytes;
    std::string content_type;
};

// Downloads a document for ask_url(). Throws UpstreamError.
using UrlFetcher = std::function<FetchedDocument(const std::string& url, const CallOptions& opts)>;

struct UrlAnswer {
    std::string question;
    QueryResult result;
    std::string error; // set when this question failed
};

struct UrlQaResult {
    std::string document_id;
    std::string filename;
    std::vector<UrlAnswer> answers; // in question order
};

struct DocumentDetail {
    Document document;
    std::vector<ChunkMeta> chunks;
};

struct DocumentPage {
    std::vector<Document> items; // newest first
    std::size_t total{0};
};

struct Stats {
    std::size_t document_count{0};
    std::size_t ready_document_count{0};
    std::size_t chunk_count{0};
    std::size_t index_size{0};
    int dimension{0};
    std::size_t session_count{0};
    uint64_t total_queries{0};
    double average_query_ms{0.0};
};

// Owns the index, the document registry, sessions and the ingestion workers.
// init() loads persisted state and starts workers; shutdown() cancels outstanding
// work, joins the workers and persists. Both ingestion and queries may run concurrently.
class RagService {
public:
    RagService(ServiceConfig cfg, std::shared_ptr<EmbeddingBackend> embedder,
               std::shared_ptr<GenerationBackend> generator);
    // Talks to Ollama for both embedding and generation.
    explicit RagService(ServiceConfig cfg);
    ~RagService();
    RagService(const RagService&) = delete;
    RagService& operator=(const RagService&) = delete;

    void init();
    void shutdown();
    bool running() const { return running_.load(); }

    // Returns immediately; the document moves pending -> processing -> ready|failed.
    IngestReceipt ingest(IngestRequest req);
    // Blocks until every queued ingestion has finished.
    void wait_for_ingestion();

    ProcessingStatus status(const std::string& document_id) const;
    DocumentDetail document(const std::string& document_id) const;
    DocumentPage list_documents(std::size_t limit, std::size_t offset) const;
    // False when the id is unknown.
    bool remove(const std::string& document_id);

    QueryResult query(const QueryRequest& req);

    // Records a 1..5 rating for an answer returned by query(). Returns the feedback id.
    std::string submit_feedback(const FeedbackRequest& req);
    std::vector<FeedbackRecord> feedback(const std::string& answer_id) const;

    // Downloads the document, ingests it, waits for it and answers every question
    // without a session. A failed question is reported in its slot; the rest still run.
    UrlQaResult ask_url(const std::string& url, const std::vector<std::string>& questions,
                        const CancellationToken& token = CancellationToken());
    void set_url_fetcher(UrlFetcher fetcher) { fetcher_ = std::move(fetcher); }

    Stats stats() const;

    std::vector<Message> session_history(const std::string& session_id, std::size_t limit, std::size_t offset) const;
    std::vector<SessionSummary> list_sessions() const;
    bool delete_session(const std::string& session_id);


private:
    void require_running() const;
    void worker_loop();
    void run_job(const IngestJob& job);
    void mark_failed(const std::string& document_id, const std::string& error);
    void persist();
    void persist_committed(const std::string& what);
    std::string filename_of(const std::string& document_id) const;
    Document wait_for_document(const std::string& document_id, const CancellationToken& token);
    void record_answer(const QueryRequest& req, const QueryResult& res);

    ServiceConfig cfg_;
    std::shared_ptr<EmbeddingBackend> embedder_;
    std::shared_ptr<GenerationBackend> generator_;
    VectorIndex index_;
    EmbeddingGateway gateway_;
    RetrievalEngine retrieval_;
    AnswerSynthesizer answerer_;
    SessionStore sessions_;
    IngestQueue queue_;
    std::unique_ptr<MetadataStore> registry_;

    mutable std::mutex docs_mtx_;
    std::unordered_map<std::string, Document> docs_;
    std::condition_variable docs_cv_; // a document reached ready or failed, or was removed
    std::mutex commit_mtx_; // orders index commits, removals and persists

    UrlFetcher fetcher_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> total_queries_{0};
    std::atomic<uint64_t> total_query_ms_{0};
};
