#include "../include/rag.hpp"
#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include "../include/extractor.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

static const char* kNotFoundAnswer =
    "I could not find relevant information in the indexed documents to answer this question.";

static std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

static bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

RagService::RagService(ServiceConfig cfg, std::shared_ptr<EmbeddingBackend> embedder,
                       std::shared_ptr<GenerationBackend> generator)
    : cfg_(std::move(cfg)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      index_(cfg_.embed.dimension),
      gateway_(embedder_, cfg_.embed.dimension, cfg_.embed.batch_size, RetryPolicy(cfg_.retry), cfg_.embed.timeout_ms),
      retrieval_(gateway_, index_, cfg_.retrieval),
      answerer_(generator_, RetryPolicy(cfg_.retry), cfg_.llm.timeout_ms),
      sessions_(cfg_.session.max_messages) {
    validate_config(cfg_);
    if (!embedder_ || !generator_) throw ValidationError("embedding and generation backends are required");
    fetcher_ = [max = cfg_.max_file_bytes](const std::string& url, const CallOptions& opts) {
        auto r = http_get(url, opts, max);
        if (!http_status_ok(r.status)) {
            throw UpstreamError("download of " + url + " failed: status " + std::to_string(r.status),
                                http_status_transient(r.status), r.status);
        }
        return FetchedDocument{std::move(r.body), std::move(r.content_type)};
    };
}

RagService::RagService(ServiceConfig cfg)
    : RagService(cfg, std::make_shared<OllamaEmbeddingBackend>(cfg.embed),
                 std::make_shared<OllamaGenerationBackend>(cfg.llm)) {}

RagService::~RagService() {
    if (!running_) return;
    try {
        shutdown();
    } catch (const std::exception& e) {
        log_error("service", std::string("shutdown failed: ") + e.what());
    }
}

void RagService::require_running() const {
    if (!running_) throw StoreError("service is not running");
}

void RagService::init() {
    if (running_) return;
    std::filesystem::path dir(cfg_.store_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw StoreError("cannot create store directory " + dir.string() + ": " + ec.message());

    registry_ = std::make_unique<MetadataStore>((dir / "metadata.db").string());
    auto report = index_.load(dir);
    if (report.loaded) {
        log_info("index", "loaded " + std::to_string(report.entries) + " entries from " + dir.string());
    } else {
        log_warn("index", "starting with an empty index: " + report.reason);
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(docs_mtx_);
        docs_.clear();
        for (auto& d : registry_->load_documents()) {
            if (d.status == ProcessingStatus::pending || d.status == ProcessingStatus::processing) {
                d.status = ProcessingStatus::failed;
                d.error = "interrupted";
                registry_->upsert_document(d);
            } else if (d.status == ProcessingStatus::ready && d.chunk_count > 0 && !index_.contains_document(d.id)) {
                d.status = ProcessingStatus::failed;
                d.error = "index entries missing; re-ingest the document";
                registry_->upsert_document(d);
                log_warn("index", "document " + d.id + " has no index entries");
            }
            docs_.emplace(d.id, d);
        }
        std::vector<std::string> orphans;
        for (const auto& c : index_.document_ids()) {
            if (!docs_.count(c)) orphans.push_back(c);
        }
        for (const auto& id : orphans) {
            index_.delete_by_document(id);
            changed = true;
        }
    }
    if (changed) index_.persist(dir);

    running_ = true;
    int n = std::max(1, cfg_.ingest_workers);
    for (int i = 0; i < n; ++i) workers_.emplace_back([this]{ worker_loop(); });
    log_info("service", "ready: " + std::to_string(docs_.size()) + " documents, " +
                        std::to_string(index_.size()) + " chunks, " + std::to_string(n) + " ingest workers, history " +
                        history_mode_name(cfg_.retrieval.history_mode));
}

void RagService::shutdown() {
    if (!running_.exchange(false)) return;
    docs_cv_.notify_all();
    auto dropped = queue_.close();
    for (const auto& job : dropped) mark_failed(job.document_id, "interrupted by shutdown");
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    persist();
    registry_.reset();
    log_info("service", "stopped");
}

IngestReceipt RagService::ingest(IngestRequest req) {
    require_running();
    if (req.bytes.size() > cfg_.max_file_bytes) {
        throw ValidationError("document is " + std::to_string(req.bytes.size()) + " bytes; the limit is " +
                              std::to_string(cfg_.max_file_bytes));
    }
    DocumentFormat format = resolve_format(req.format, req.filename);
    int chunk_size = req.chunk_size.value_or(cfg_.chunk.chunk_size);
    int overlap = req.chunk_overlap.value_or(cfg_.chunk.overlap);
    validate_chunk_config(chunk_size, overlap);

    IngestReceipt receipt;
    receipt.document_id = sha256_hex(req.bytes);

    std::lock_guard<std::mutex> lock(docs_mtx_);
    auto it = docs_.find(receipt.document_id);
    if (it != docs_.end() && it->second.status != ProcessingStatus::failed) {
        receipt.status = it->second.status;
        return receipt;
    }

    Document doc;
    doc.id = receipt.document_id;
    doc.filename = req.filename.empty() ? receipt.document_id : req.filename;
    doc.format = format_name(format);
    doc.uploaded_at = unix_millis();
    doc.size = (int64_t)req.bytes.size();
    doc.chunk_size = chunk_size;
    doc.chunk_overlap = overlap;

    IngestJob job;
    job.document_id = doc.id;
    job.filename = doc.filename;
    job.format = format;
    job.bytes = std::make_shared<const std::string>(std::move(req.bytes));
    job.chunk_size = chunk_size;
    job.chunk_overlap = overlap;
    if (!queue_.enqueue(job)) {
        throw ValidationError("document " + doc.id + " is still being processed; retry later");
    }
    registry_->upsert_document(doc);
    docs_[doc.id] = doc;
    receipt.status = ProcessingStatus::pending;
    receipt.queued = true;
    log_info("ingest", "queued " + doc.filename + " (" + doc.id.substr(0, 12) + ", " + doc.format + ", " +
                       std::to_string(doc.size) + " bytes)");
    return receipt;
}

void RagService::wait_for_ingestion() {
    queue_.wait_idle();
}

void RagService::worker_loop() {
    while (auto job = queue_.dequeue()) {
        run_job(*job);
    }
}

void RagService::run_job(const IngestJob& job) {
    const auto started = std::chrono::steady_clock::now();
    try {
        {
            std::lock_guard<std::mutex> lock(docs_mtx_);
            auto it = docs_.find(job.document_id);
            if (it == docs_.end() || job.token.cancelled()) {
                queue_.complete(job.document_id);
                return;
            }
            it->second.status = ProcessingStatus::processing;
            it->second.error.clear();
            registry_->upsert_document(it->second);
        }

        auto extracted = extract_text(*job.bytes, job.format);
        auto chunks = chunk_text(extracted, job.chunk_size, job.chunk_overlap);
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& c : chunks) texts.push_back(c.text);
        auto vectors = gateway_.embed(texts, job.token);

        std::vector<IndexEntry> entries;
        entries.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            IndexEntry e;
            e.meta.document_id = job.document_id;
            e.meta.sequence_index = chunks[i].sequence_index;
            e.meta.chunk_id = make_chunk_id(job.document_id, chunks[i].sequence_index);
            e.meta.text = std::move(chunks[i].text);
            e.meta.start = (int64_t)chunks[i].start;
            e.meta.end = (int64_t)chunks[i].end;
            e.meta.page = chunks[i].page;
            e.vector = std::move(vectors[i]);
            entries.push_back(std::move(e));
        }

        std::lock_guard<std::mutex> commit(commit_mtx_);
        {
            std::lock_guard<std::mutex> lock(docs_mtx_);
            auto it = docs_.find(job.document_id);
            if (it == docs_.end() || job.token.cancelled()) {
                queue_.complete(job.document_id);
                log_info("ingest", "dropped " + job.filename + ": removed while processing");
                return;
            }
            index_.replace_document(job.document_id, std::move(entries));
            it->second.status = ProcessingStatus::ready;
            it->second.encoding = extracted.encoding;
            it->second.chunk_count = (int)chunks.size();
            registry_->upsert_document(it->second);
            queue_.complete(job.document_id);
        }
        docs_cv_.notify_all();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        log_info("ingest", "ready " + job.filename + ": " + std::to_string(chunks.size()) + " chunks in " +
                           std::to_string(ms.count()) + "ms");
    } catch (const std::exception& e) {
        std::string reason = e.what();
        if (job.token.cancelled() && !running_) reason = "interrupted by shutdown";
        log_error("ingest", "failed " + job.filename + ": " + reason);
        mark_failed(job.document_id, reason);
        return;
    }
    persist_committed("after adding " + job.document_id);
}

// The commit already happened; a failed write leaves the on-disk index stale until the next persist.
void RagService::persist_committed(const std::string& what) {
    if (!cfg_.persist_on_write) return;
    try {
        std::lock_guard<std::mutex> lock(commit_mtx_);
        index_.persist(cfg_.store_dir);
    } catch (const std::exception& e) {
        log_warn("index", "persist failed " + what + ": " + e.what());
    }
}

void RagService::mark_failed(const std::string& document_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(docs_mtx_);
    auto it = docs_.find(document_id);
    if (it != docs_.end() && it->second.status != ProcessingStatus::ready) {
        it->second.status = ProcessingStatus::failed;
        it->second.error = error;
        try {
            registry_->upsert_document(it->second);
        } catch (const std::exception& e) {
            log_error("registry", "cannot record failure of " + document_id + ": " + e.what());
        }
    }
    queue_.complete(document_id);
    docs_cv_.notify_all();
}

void RagService::persist() {
    std::lock_guard<std::mutex> lock(commit_mtx_);
    index_.persist(cfg_.store_dir);
}

ProcessingStatus RagService::status(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(docs_mtx_);
    auto it = docs_.find(document_id);
    if (it == docs_.end()) throw DocumentNotFoundError(document_id);
    return it->second.status;
}

DocumentDetail RagService::document(const std::string& document_id) const {
    DocumentDetail out;
    {
        std::lock_guard<std::mutex> lock(docs_mtx_);
        auto it = docs_.find(document_id);
        if (it == docs_.end()) throw DocumentNotFoundError(document_id);
        out.document = it->second;
    }
    out.chunks = index_.document_chunks(document_id);
    return out;
}

DocumentPage RagService::list_documents(std::size_t limit, std::size_t offset) const {
    DocumentPage page;
    std::vector<Document> all;
    {
        std::lock_guard<std::mutex> lock(docs_mtx_);
        all.reserve(docs_.size());
        for (const auto& kv : docs_) all.push_back(kv.second);
    }
    std::sort(all.begin(), all.end(), [](const Document& a, const Document& b){
        if (a.uploaded_at != b.uploaded_at) return a.uploaded_at > b.uploaded_at;
        return a.id < b.id;
    });
    page.total = all.size();
    if (offset < all.size()) {
        auto begin = all.begin() + (std::ptrdiff_t)offset;
        auto end = begin + (std::ptrdiff_t)std::min(limit, all.size() - offset);
        page.items.assign(begin, end);
    }
    return page;
}

bool RagService::remove(const std::string& document_id) {
    require_running();
    {
        std::lock_guard<std::mutex> commit(commit_mtx_);
        {
            std::lock_guard<std::mutex> lock(docs_mtx_);
            if (!docs_.count(document_id)) return false;
            if (queue_.cancel(document_id)) log_info("ingest", "cancelled ingestion of " + document_id);
            registry_->delete_document(document_id);
            docs_.erase(document_id);
        }
        std::size_t removed = index_.delete_by_document(document_id);
        log_info("index", "removed " + document_id + " (" + std::to_string(removed) + " chunks)");
    }
    docs_cv_.notify_all();
    persist_committed("after removing " + document_id);
    return true;
}

std::string RagService::filename_of(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(docs_mtx_);
    auto it = docs_.find(document_id);
    return it == docs_.end() ? std::string() : it->second.filename;
}

QueryResult RagService::query(const QueryRequest& req) {
    require_running();
    const auto started = std::chrono::steady_clock::now();
    if (blank(req.question)) throw InvalidQueryError("question must not be empty");
    if (utf8_length(req.question) > kMaxQuestionChars) {
        throw InvalidQueryError("question exceeds " + std::to_string(kMaxQuestionChars) + " characters");
    }
    int k = req.k.value_or(cfg_.retrieval.top_k);
    if (k < 1 || k > kMaxTopK) throw InvalidQueryError("k must be between 1 and " + std::to_string(kMaxTopK));
    int budget = req.context_budget.value_or(cfg_.retrieval.context_budget);
    if (budget < 1 || budget > kMaxContextBudget) {
        throw InvalidQueryError("context_budget must be between 1 and " + std::to_string(kMaxContextBudget));
    }

    QueryResult res;
    res.answer_id = gen_id();
    std::vector<Message> history;
    if (!req.stateless) {
        std::size_t expired = sessions_.expire_idle(unix_millis() - (int64_t)cfg_.session.idle_timeout_sec * 1000);
        if (expired) log_debug("session", "expired " + std::to_string(expired) + " idle sessions");

        Session session = sessions_.get_or_create(req.session_id);
        std::size_t n = std::min(session.messages.size(), history_messages(cfg_.retrieval.history_turns));
        history.assign(session.messages.end() - (std::ptrdiff_t)n, session.messages.end());
        res.session_id = session.id;
    }

    if (req.token.cancelled()) throw CancelledError("query cancelled before retrieval");
    auto retrieved = retrieval_.retrieve(req.question, k, history, req.token);
    AssembledContext ctx;
    if (retrieved.found()) {
        ctx = RetrievalEngine::assemble_context(retrieved.candidates, (std::size_t)budget,
                                                [this](const std::string& id){ return filename_of(id); });
    }
    if (ctx.used.empty()) {
        res.answer = kNotFoundAnswer;
        res.found = false;
        res.confidence = 0.0;
        if (req.on_fragment) req.on_fragment(res.answer);
    } else {
        if (req.token.cancelled()) throw CancelledError("query cancelled before generation");
        auto ans = answerer_.answer(req.question, ctx, history, req.token, req.on_fragment);
        res.answer = std::move(ans.text);
        res.sources = std::move(ans.sources);
        res.confidence = ans.confidence;
        res.found = true;
    }

    if (!req.stateless) {
        sessions_.get_or_create(res.session_id);
        sessions_.append(res.session_id, "user", req.question);
        sessions_.append(res.session_id, "assistant", res.answer);
    }
    record_answer(req, res);

    res.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    total_queries_ += 1;
    total_query_ms_ += (uint64_t)res.processing_ms;
    log_info("query", std::string(res.found ? "answered" : "no context") + " in " +
                      std::to_string(res.processing_ms) + "ms (" + std::to_string(res.sources.size()) + " sources)");
    return res;
}

// Feedback on an unrecorded answer is rejected as unknown; the answer itself still goes out.
void RagService::record_answer(const QueryRequest& req, const QueryResult& res) {
    AnswerRecord rec;
    rec.id = res.answer_id;
    rec.session_id = res.session_id;
    rec.question = req.question;
    rec.answer = res.answer;
    rec.created = unix_millis();
    try {
        registry_->insert_answer(rec);
    } catch (const std::exception& e) {
        log_warn("registry", "cannot record answer " + res.answer_id + ": " + e.what());
    }
}

std::string RagService::submit_feedback(const FeedbackRequest& req) {
    require_running();
    if (blank(req.answer_id)) throw ValidationError("answer_id is required");
    if (req.rating < 1 || req.rating > 5) throw ValidationError("rating must be between 1 and 5");
    if (req.comment && utf8_length(*req.comment) > kMaxFeedbackCommentChars) {
        throw ValidationError("comment exceeds " + std::to_string(kMaxFeedbackCommentChars) + " characters");
    }
    if (!registry_->answer_exists(req.answer_id)) throw AnswerNotFoundError(req.answer_id);

    FeedbackRecord rec;
    rec.id = gen_id();
    rec.answer_id = req.answer_id;
    rec.rating = req.rating;
    rec.comment = req.comment.value_or("");
    rec.created = unix_millis();
    registry_->insert_feedback(rec);
    log_info("feedback", "answer " + req.answer_id + " rated " + std::to_string(req.rating) +
                         (rec.comment.empty() ? "" : " with comment"));
    return rec.id;
}

std::vector<FeedbackRecord> RagService::feedback(const std::string& answer_id) const {
    require_running();
    if (!registry_->answer_exists(answer_id)) throw AnswerNotFoundError(answer_id);
    return registry_->feedback_for(answer_id);
}

Document RagService::wait_for_document(const std::string& document_id, const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(docs_mtx_);
    for (;;) {
        auto it = docs_.find(document_id);
        if (it == docs_.end()) throw DocumentNotFoundError(document_id);
        if (it->second.status == ProcessingStatus::ready || it->second.status == ProcessingStatus::failed) {
            return it->second;
        }
        if (token.cancelled()) throw CancelledError("cancelled while waiting for " + document_id);
        if (!running_) throw StoreError("service is not running");
        docs_cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
}

// Last path segment of the URL, without query or fragment.
static std::string url_filename(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    auto last = path.find_last_of('/');
    return last == std::string::npos ? path : path.substr(last + 1);
}

// Extension first, then the Content-Type, then the leading bytes.
static std::string download_format(const std::string& filename, const FetchedDocument& doc) {
    try {
        return format_name(resolve_format("", filename));
    } catch (const UnsupportedFormatError&) {
    }
    std::string type = to_lower(doc.content_type.substr(0, doc.content_type.find(';')));
    while (!type.empty() && type.back() == ' ') type.pop_back();
    if (!type.empty()) {
        try {
            return format_name(resolve_format(type, filename));
        } catch (const UnsupportedFormatError&) {
        }
    }
    if (doc.bytes.compare(0, 5, "%PDF-") == 0) return "pdf";
    if (doc.bytes.compare(0, 4, "PK\x03\x04") == 0) return "docx";
    throw UnsupportedFormatError("cannot determine the format of the document at " + filename);
}

UrlQaResult RagService::ask_url(const std::string& url, const std::vector<std::string>& questions,
                                const CancellationToken& token) {
    require_running();
    std::string lower = to_lower(url);
    if (lower.rfind("http://", 0) != 0 && lower.rfind("https://", 0) != 0) {
        throw ValidationError("documents must be an http or https URL");
    }
    if (questions.empty()) throw ValidationError("questions must not be empty");
    if ((int)questions.size() > cfg_.max_url_questions) {
        throw ValidationError("at most " + std::to_string(cfg_.max_url_questions) + " questions per request");
    }

    CallOptions opts;
    opts.timeout_ms = cfg_.fetch_timeout_ms;
    opts.token = token;
    FetchedDocument fetched = fetcher_(url, opts);
    log_info("url", "downloaded " + std::to_string(fetched.bytes.size()) + " bytes from " + url);

    UrlQaResult out;
    out.filename = url_filename(url);
    IngestRequest ingest_req;
    ingest_req.format = download_format(out.filename, fetched);
    if (out.filename.empty()) out.filename = "document." + ingest_req.format;
    ingest_req.filename = out.filename;
    ingest_req.bytes = std::move(fetched.bytes);
    out.document_id = ingest(std::move(ingest_req)).document_id;

    Document doc = wait_for_document(out.document_id, token);
    if (doc.status == ProcessingStatus::failed) {
        throw DocumentProcessingError("document from " + url + " could not be processed: " + doc.error);
    }

    for (const auto& q : questions) {
        UrlAnswer a;
        a.question = q;
        QueryRequest req;
        req.question = q;
        req.stateless = true;
        req.token = token;
        try {
            a.result = query(req);
        } catch (const RagError& e) {
            if (token.cancelled()) throw;
            a.error = e.what();
            log_warn("url", "question failed: " + a.error);
        }
        out.answers.push_back(std::move(a));
    }
    return out;
}

Stats RagService::stats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(docs_mtx_);
        s.document_count = docs_.size();
        for (const auto& kv : docs_) {
            if (kv.second.status == ProcessingStatus::ready) {
                ++s.ready_document_count;
                s.chunk_count += (std::size_t)kv.second.chunk_count;
            }
        }
    }
    s.index_size = index_.size();
    s.dimension = index_.dimension();
    s.session_count = sessions_.count();
    s.total_queries = total_queries_.load();
    s.average_query_ms = s.total_queries ? (double)total_query_ms_.load() / (double)s.total_queries : 0.0;
    return s;
}

std::vector<Message> RagService::session_history(const std::string& session_id, std::size_t limit,
                                                 std::size_t offset) const {
    return sessions_.history(session_id, limit, offset);
}

std::vector<SessionSummary> RagService::list_sessions() const {
    return sessions_.list();
}

bool RagService::delete_session(const std::string& session_id) {
    return sessions_.remove(session_id);
}
