#pragma once
#include "document.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

struct IndexEntry {
    ChunkMeta meta;
    std::vector<float> vector;
};

struct SearchResult {
    ChunkMeta meta;
    float score{0.0f};
    int rank{0}; // 1-based
};

struct LoadReport {
    bool loaded{false};
    std::size_t entries{0};
    std::string reason; // set when the index fell back to empty
};

// Exact nearest-neighbour index over chunk embeddings.
//
// Scores are cosine similarity: higher is closer. search() orders by descending score
// and breaks ties by ascending (document_id, sequence_index). A threshold keeps
// results with score >= threshold.
//
// search() takes a shared lock; insert, delete, persist and load take it exclusively,
// so a search never observes a half-applied mutation.
class VectorIndex {
public:
    static constexpr int kFormatVersion = 1;

    explicit VectorIndex(int dimension);

    int dimension() const { return dimension_; }

    // Throws DimensionMismatchError, or ValidationError for a duplicate chunk id.
    void insert(const ChunkMeta& meta, std::vector<float> vector);
    // All entries are validated before any is added.
    void insert_batch(std::vector<IndexEntry> entries);
    // Drops the document's current entries and adds the new ones in one step.
    void replace_document(const std::string& document_id, std::vector<IndexEntry> entries);

    // Throws InvalidQueryError for k <= 0 and DimensionMismatchError for a bad query.
    std::vector<SearchResult> search(const std::vector<float>& query, int k,
                                     std::optional<float> score_threshold = std::nullopt) const;

    // Returns the number of removed entries.
    std::size_t delete_by_document(const std::string& document_id);

    bool contains_document(const std::string& document_id) const;
    std::vector<ChunkMeta> document_chunks(const std::string& document_id) const;
    std::vector<std::string> document_ids() const;
    std::size_t size() const;
    std::size_t document_count() const;

    // Writes index.bin, metadata.db (chunks table) and manifest.json under dir.
    void persist(const std::filesystem::path& dir) const;
    // Replaces the contents from dir. A missing or unreadable store leaves the index
    // empty and reports why instead of throwing.
    LoadReport load(const std::filesystem::path& dir);

private:
    void validate(const IndexEntry& e) const;
    void validate_batch(const std::vector<IndexEntry>& entries, const std::string& replacing) const;

    int dimension_;
    mutable std::shared_mutex mtx_;
    std::vector<IndexEntry> entries_;
    std::unordered_set<std::string> chunk_ids_;
};
