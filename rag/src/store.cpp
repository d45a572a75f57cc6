#include "../include/store.hpp"
#include "../include/errors.hpp"
#include <sqlite3.h>

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, idx)) : std::string();
}

MetadataStore::MetadataStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) { sqlite3_close(db_); db_ = nullptr; }
        throw StoreError("Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

MetadataStore::~MetadataStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void MetadataStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA busy_timeout=5000;");
    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  position INTEGER PRIMARY KEY,\n"
         "  document_id TEXT NOT NULL,\n"
         "  chunk_id TEXT NOT NULL,\n"
         "  sequence_index INTEGER NOT NULL,\n"
         "  text TEXT NOT NULL,\n"
         "  start_offset INTEGER NOT NULL,\n"
         "  end_offset INTEGER NOT NULL,\n"
         "  page INTEGER NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);");
    exec("CREATE TABLE IF NOT EXISTS documents (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  filename TEXT,\n"
         "  format TEXT,\n"
         "  encoding TEXT,\n"
         "  uploaded_at INTEGER,\n"
         "  size INTEGER,\n"
         "  status TEXT,\n"
         "  error TEXT,\n"
         "  chunk_count INTEGER,\n"
         "  chunk_size INTEGER,\n"
         "  chunk_overlap INTEGER\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS answers (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  session_id TEXT,\n"
         "  question TEXT NOT NULL,\n"
         "  answer TEXT NOT NULL,\n"
         "  created INTEGER NOT NULL\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS feedback (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  answer_id TEXT NOT NULL REFERENCES answers(id),\n"
         "  rating INTEGER NOT NULL CHECK (rating BETWEEN 1 AND 5),\n"
         "  comment TEXT,\n"
         "  created INTEGER NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_feedback_answer ON feedback(answer_id);");
}

void MetadataStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

void MetadataStore::prepare_statements() {
    auto prepare = [&](const char* sql, sqlite3_stmt** st) {
        if (sqlite3_prepare_v2(db_, sql, -1, st, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    };
    prepare("INSERT INTO chunks \n"
            "(position, document_id, chunk_id, sequence_index, text, start_offset, end_offset, page) \n"
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);", &insert_chunk_stmt_);
    prepare("SELECT position, document_id, chunk_id, sequence_index, text, start_offset, end_offset, page \n"
            "FROM chunks ORDER BY position;", &all_chunks_stmt_);
    prepare("INSERT OR REPLACE INTO documents \n"
            "(id, filename, format, encoding, uploaded_at, size, status, error, chunk_count, chunk_size, chunk_overlap) \n"
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", &upsert_doc_stmt_);
    prepare("DELETE FROM documents WHERE id = ?;", &delete_doc_stmt_);
    prepare("SELECT id, filename, format, encoding, uploaded_at, size, status, error, chunk_count, chunk_size, \n"
            "chunk_overlap FROM documents ORDER BY uploaded_at, id;", &all_docs_stmt_);
    prepare("INSERT INTO answers (id, session_id, question, answer, created) VALUES (?, ?, ?, ?, ?);",
            &insert_answer_stmt_);
    prepare("SELECT 1 FROM answers WHERE id = ?;", &answer_exists_stmt_);
    prepare("INSERT INTO feedback (id, answer_id, rating, comment, created) VALUES (?, ?, ?, ?, ?);",
            &insert_feedback_stmt_);
    prepare("SELECT id, answer_id, rating, comment, created FROM feedback \n"
            "WHERE answer_id = ? ORDER BY created, rowid;", &feedback_for_stmt_);
}

void MetadataStore::close_statements() {
    for (sqlite3_stmt** st : {&insert_chunk_stmt_, &all_chunks_stmt_, &upsert_doc_stmt_, &delete_doc_stmt_,
                              &all_docs_stmt_, &insert_answer_stmt_, &answer_exists_stmt_, &insert_feedback_stmt_,
                              &feedback_for_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

void MetadataStore::replace_chunks(const std::vector<ChunkRecord>& rows) {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("BEGIN IMMEDIATE;");
    try {
        exec("DELETE FROM chunks;");
        for (const auto& r : rows) {
            sqlite3_reset(insert_chunk_stmt_);
            sqlite3_clear_bindings(insert_chunk_stmt_);
            sqlite3_bind_int64(insert_chunk_stmt_, 1, r.position);
            bind_text(insert_chunk_stmt_, 2, r.meta.document_id);
            bind_text(insert_chunk_stmt_, 3, r.meta.chunk_id);
            sqlite3_bind_int(insert_chunk_stmt_, 4, r.meta.sequence_index);
            bind_text(insert_chunk_stmt_, 5, r.meta.text);
            sqlite3_bind_int64(insert_chunk_stmt_, 6, r.meta.start);
            sqlite3_bind_int64(insert_chunk_stmt_, 7, r.meta.end);
            sqlite3_bind_int(insert_chunk_stmt_, 8, r.meta.page);
            if (sqlite3_step(insert_chunk_stmt_) != SQLITE_DONE) {
                throw StoreError(std::string("insert chunk failed: ") + sqlite3_errmsg(db_));
            }
        }
        sqlite3_reset(insert_chunk_stmt_);
        exec("COMMIT;");
    } catch (...) {
        sqlite3_reset(insert_chunk_stmt_);
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::vector<ChunkRecord> MetadataStore::load_chunks() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ChunkRecord> out;
    sqlite3_reset(all_chunks_stmt_);
    int rc;
    while ((rc = sqlite3_step(all_chunks_stmt_)) == SQLITE_ROW) {
        ChunkRecord r;
        r.position = sqlite3_column_int64(all_chunks_stmt_, 0);
        r.meta.document_id = column_text(all_chunks_stmt_, 1);
        r.meta.chunk_id = column_text(all_chunks_stmt_, 2);
        r.meta.sequence_index = sqlite3_column_int(all_chunks_stmt_, 3);
        r.meta.text = column_text(all_chunks_stmt_, 4);
        r.meta.start = sqlite3_column_int64(all_chunks_stmt_, 5);
        r.meta.end = sqlite3_column_int64(all_chunks_stmt_, 6);
        r.meta.page = sqlite3_column_int(all_chunks_stmt_, 7);
        out.push_back(std::move(r));
    }
    sqlite3_reset(all_chunks_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("select chunks failed: ") + sqlite3_errmsg(db_));
    return out;
}

void MetadataStore::upsert_document(const Document& d) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(upsert_doc_stmt_);
    sqlite3_clear_bindings(upsert_doc_stmt_);
    bind_text(upsert_doc_stmt_, 1, d.id);
    bind_text(upsert_doc_stmt_, 2, d.filename);
    bind_text(upsert_doc_stmt_, 3, d.format);
    bind_text(upsert_doc_stmt_, 4, d.encoding);
    sqlite3_bind_int64(upsert_doc_stmt_, 5, d.uploaded_at);
    sqlite3_bind_int64(upsert_doc_stmt_, 6, d.size);
    bind_text(upsert_doc_stmt_, 7, status_name(d.status));
    bind_text(upsert_doc_stmt_, 8, d.error);
    sqlite3_bind_int(upsert_doc_stmt_, 9, d.chunk_count);
    sqlite3_bind_int(upsert_doc_stmt_, 10, d.chunk_size);
    sqlite3_bind_int(upsert_doc_stmt_, 11, d.chunk_overlap);
    int rc = sqlite3_step(upsert_doc_stmt_);
    sqlite3_reset(upsert_doc_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("upsert document failed: ") + sqlite3_errmsg(db_));
}

void MetadataStore::delete_document(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(delete_doc_stmt_);
    bind_text(delete_doc_stmt_, 1, id);
    int rc = sqlite3_step(delete_doc_stmt_);
    sqlite3_reset(delete_doc_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("delete document failed: ") + sqlite3_errmsg(db_));
}

std::vector<Document> MetadataStore::load_documents() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Document> out;
    sqlite3_reset(all_docs_stmt_);
    int rc;
    while ((rc = sqlite3_step(all_docs_stmt_)) == SQLITE_ROW) {
        Document d;
        d.id = column_text(all_docs_stmt_, 0);
        d.filename = column_text(all_docs_stmt_, 1);
        d.format = column_text(all_docs_stmt_, 2);
        d.encoding = column_text(all_docs_stmt_, 3);
        d.uploaded_at = sqlite3_column_int64(all_docs_stmt_, 4);
        d.size = sqlite3_column_int64(all_docs_stmt_, 5);
        d.status = parse_status(column_text(all_docs_stmt_, 6));
        d.error = column_text(all_docs_stmt_, 7);
        d.chunk_count = sqlite3_column_int(all_docs_stmt_, 8);
        d.chunk_size = sqlite3_column_int(all_docs_stmt_, 9);
        d.chunk_overlap = sqlite3_column_int(all_docs_stmt_, 10);
        out.push_back(std::move(d));
    }
    sqlite3_reset(all_docs_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("select documents failed: ") + sqlite3_errmsg(db_));
    return out;
}

void MetadataStore::insert_answer(const AnswerRecord& a) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_answer_stmt_);
    sqlite3_clear_bindings(insert_answer_stmt_);
    bind_text(insert_answer_stmt_, 1, a.id);
    bind_text(insert_answer_stmt_, 2, a.session_id);
    bind_text(insert_answer_stmt_, 3, a.question);
    bind_text(insert_answer_stmt_, 4, a.answer);
    sqlite3_bind_int64(insert_answer_stmt_, 5, a.created);
    int rc = sqlite3_step(insert_answer_stmt_);
    sqlite3_reset(insert_answer_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("insert answer failed: ") + sqlite3_errmsg(db_));
}

bool MetadataStore::answer_exists(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(answer_exists_stmt_);
    bind_text(answer_exists_stmt_, 1, id);
    int rc = sqlite3_step(answer_exists_stmt_);
    sqlite3_reset(answer_exists_stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw StoreError(std::string("select answer failed: ") + sqlite3_errmsg(db_));
    }
    return rc == SQLITE_ROW;
}

void MetadataStore::insert_feedback(const FeedbackRecord& f) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_feedback_stmt_);
    sqlite3_clear_bindings(insert_feedback_stmt_);
    bind_text(insert_feedback_stmt_, 1, f.id);
    bind_text(insert_feedback_stmt_, 2, f.answer_id);
    sqlite3_bind_int(insert_feedback_stmt_, 3, f.rating);
    if (f.comment.empty()) sqlite3_bind_null(insert_feedback_stmt_, 4);
    else bind_text(insert_feedback_stmt_, 4, f.comment);
    sqlite3_bind_int64(insert_feedback_stmt_, 5, f.created);
    int rc = sqlite3_step(insert_feedback_stmt_);
    sqlite3_reset(insert_feedback_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("insert feedback failed: ") + sqlite3_errmsg(db_));
}

std::vector<FeedbackRecord> MetadataStore::feedback_for(const std::string& answer_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<FeedbackRecord> out;
    sqlite3_reset(feedback_for_stmt_);
    bind_text(feedback_for_stmt_, 1, answer_id);
    int rc;
    while ((rc = sqlite3_step(feedback_for_stmt_)) == SQLITE_ROW) {
        FeedbackRecord f;
        f.id = column_text(feedback_for_stmt_, 0);
        f.answer_id = column_text(feedback_for_stmt_, 1);
        f.rating = sqlite3_column_int(feedback_for_stmt_, 2);
        f.comment = column_text(feedback_for_stmt_, 3);
        f.created = sqlite3_column_int64(feedback_for_stmt_, 4);
        out.push_back(std::move(f));
    }
    sqlite3_reset(feedback_for_stmt_);
    if (rc != SQLITE_DONE) throw StoreError(std::string("select feedback failed: ") + sqlite3_errmsg(db_));
    return out;
}
