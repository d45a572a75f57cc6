#pragma once
#include "document.hpp"
#include <mutex>
#include <string>
#include <vector>

struct ChunkRecord {
    int64_t position{0}; // row in index.bin
    ChunkMeta meta;
};

// An answer handed out by query(), kept so feedback can refer to it.
struct AnswerRecord {
    std::string id;
    std::string session_id; // empty for stateless queries
    std::string question;
    std::string answer;
    int64_t created{0};
};

struct FeedbackRecord {
    std::string id;
    std::string answer_id;
    int rating{0}; // 1..5
    std::string comment;
    int64_t created{0};
};

// SQLite file holding the index's per-position chunk metadata and the document registry.
class MetadataStore {
public:
    explicit MetadataStore(const std::string& db_path);
    ~MetadataStore();
    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // Replaces every chunk row in one transaction.
    void replace_chunks(const std::vector<ChunkRecord>& rows);
    std::vector<ChunkRecord> load_chunks();

    void upsert_document(const Document& doc);
    void delete_document(const std::string& id);
    std::vector<Document> load_documents();

    void insert_answer(const AnswerRecord& a);
    bool answer_exists(const std::string& id);
    void insert_feedback(const FeedbackRecord& f);
    // Oldest first.
    std::vector<FeedbackRecord> feedback_for(const std::string& answer_id);

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_chunk_stmt_ {nullptr};
    struct sqlite3_stmt* all_chunks_stmt_ {nullptr};
    struct sqlite3_stmt* upsert_doc_stmt_ {nullptr};
    struct sqlite3_stmt* delete_doc_stmt_ {nullptr};
    struct sqlite3_stmt* all_docs_stmt_ {nullptr};
    struct sqlite3_stmt* insert_answer_stmt_ {nullptr};
    struct sqlite3_stmt* answer_exists_stmt_ {nullptr};
    struct sqlite3_stmt* insert_feedback_stmt_ {nullptr};
    struct sqlite3_stmt* feedback_for_stmt_ {nullptr};
};
