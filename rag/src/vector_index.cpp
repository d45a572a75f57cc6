#include "../include/vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/store.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <mutex>
#include <unordered_set>

using json = nlohmann::json;

static const char kMagic[8] = {'R', 'A', 'G', 'V', 'I', 'D', 'X', '1'};
static const size_t kHeaderBytes = 8 + 4 + 8;

static void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((char)((v >> (8 * i)) & 0xFF));
}

static void put_u64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back((char)((v >> (8 * i)) & 0xFF));
}

static uint64_t get_le(const std::string& in, size_t off, int bytes) {
    uint64_t v = 0;
    for (int i = 0; i < bytes; ++i) v |= (uint64_t)(unsigned char)in[off + i] << (8 * i);
    return v;
}

// Ranking order: higher score first, then (document_id, sequence_index) ascending.
static bool ranks_before(const SearchResult& a, const SearchResult& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.meta.document_id != b.meta.document_id) return a.meta.document_id < b.meta.document_id;
    return a.meta.sequence_index < b.meta.sequence_index;
}

VectorIndex::VectorIndex(int dimension) : dimension_(dimension) {
    if (dimension <= 0) throw ValidationError("index dimension must be positive");
}

void VectorIndex::validate(const IndexEntry& e) const {
    if ((int)e.vector.size() != dimension_) throw DimensionMismatchError((size_t)dimension_, e.vector.size());
    for (float v : e.vector) {
        if (!std::isfinite(v)) throw ValidationError("vector for " + e.meta.chunk_id + " has a non-finite component");
    }
    if (e.meta.document_id.empty() || e.meta.chunk_id.empty()) {
        throw ValidationError("index entries need a document id and a chunk id");
    }
}

void VectorIndex::validate_batch(const std::vector<IndexEntry>& entries, const std::string& replacing) const {
    std::unordered_set<std::string> seen;
    for (const auto& e : entries) {
        validate(e);
        if (!seen.insert(e.meta.chunk_id).second) throw ValidationError("duplicate chunk id " + e.meta.chunk_id);
        bool replaced = !replacing.empty() && e.meta.document_id == replacing;
        if (!replaced && chunk_ids_.count(e.meta.chunk_id)) {
            throw ValidationError("chunk already indexed: " + e.meta.chunk_id);
        }
    }
}

void VectorIndex::insert(const ChunkMeta& meta, std::vector<float> vector) {
    std::vector<IndexEntry> one;
    one.push_back(IndexEntry{meta, std::move(vector)});
    insert_batch(std::move(one));
}

void VectorIndex::insert_batch(std::vector<IndexEntry> entries) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    validate_batch(entries, "");
    entries_.reserve(entries_.size() + entries.size());
    for (auto& e : entries) {
        chunk_ids_.insert(e.meta.chunk_id);
        entries_.push_back(std::move(e));
    }
}

void VectorIndex::replace_document(const std::string& document_id, std::vector<IndexEntry> entries) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    for (const auto& e : entries) {
        if (e.meta.document_id != document_id) {
            throw ValidationError("entry " + e.meta.chunk_id + " does not belong to document " + document_id);
        }
    }
    validate_batch(entries, document_id);

    // Build the new state aside so a failure leaves the index untouched.
    std::vector<IndexEntry> next;
    next.reserve(entries_.size() + entries.size());
    for (const auto& e : entries_) {
        if (e.meta.document_id != document_id) next.push_back(e);
    }
    std::unordered_set<std::string> ids;
    for (const auto& e : next) ids.insert(e.meta.chunk_id);
    for (auto& e : entries) {
        ids.insert(e.meta.chunk_id);
        next.push_back(std::move(e));
    }
    entries_.swap(next);
    chunk_ids_.swap(ids);
}

std::vector<SearchResult> VectorIndex::search(const std::vector<float>& query, int k,
                                              std::optional<float> score_threshold) const {
    if (k <= 0) throw InvalidQueryError("k must be positive, got " + std::to_string(k));
    if ((int)query.size() != dimension_) throw DimensionMismatchError((size_t)dimension_, query.size());

    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<SearchResult> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        float score = cosine_similarity(e.vector, query);
        if (score_threshold && score < *score_threshold) continue;
        SearchResult r;
        r.meta = e.meta;
        r.score = score;
        out.push_back(std::move(r));
    }
    lock.unlock();

    size_t keep = std::min(out.size(), (size_t)k);
    std::partial_sort(out.begin(), out.begin() + keep, out.end(), ranks_before);
    out.resize(keep);
    for (size_t i = 0; i < out.size(); ++i) out[i].rank = (int)i + 1;
    return out;
}

size_t VectorIndex::delete_by_document(const std::string& document_id) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    std::vector<IndexEntry> next;
    next.reserve(entries_.size());
    std::unordered_set<std::string> ids;
    for (const auto& e : entries_) {
        if (e.meta.document_id == document_id) continue;
        ids.insert(e.meta.chunk_id);
        next.push_back(e);
    }
    size_t removed = entries_.size() - next.size();
    entries_.swap(next);
    chunk_ids_.swap(ids);
    return removed;
}

bool VectorIndex::contains_document(const std::string& document_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const IndexEntry& e){ return e.meta.document_id == document_id; });
}

std::vector<ChunkMeta> VectorIndex::document_chunks(const std::string& document_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<ChunkMeta> out;
    for (const auto& e : entries_) {
        if (e.meta.document_id == document_id) out.push_back(e.meta);
    }
    std::sort(out.begin(), out.end(), [](const ChunkMeta& a, const ChunkMeta& b){
        return a.sequence_index < b.sequence_index;
    });
    return out;
}

std::vector<std::string> VectorIndex::document_ids() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& e : entries_) {
        if (seen.insert(e.meta.document_id).second) out.push_back(e.meta.document_id);
    }
    return out;
}

size_t VectorIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return entries_.size();
}

size_t VectorIndex::document_count() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::unordered_set<std::string> docs;
    for (const auto& e : entries_) docs.insert(e.meta.document_id);
    return docs.size();
}

void VectorIndex::persist(const std::filesystem::path& dir) const {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw StoreError("cannot create " + dir.string() + ": " + ec.message());

    std::string bin;
    bin.reserve(kHeaderBytes + entries_.size() * (size_t)dimension_ * 4);
    bin.append(kMagic, sizeof(kMagic));
    put_u32(bin, (uint32_t)dimension_);
    put_u64(bin, (uint64_t)entries_.size());
    std::vector<ChunkRecord> rows;
    rows.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        for (float v : entries_[i].vector) {
            uint32_t bits;
            std::memcpy(&bits, &v, sizeof(bits));
            put_u32(bin, bits);
        }
        rows.push_back(ChunkRecord{(int64_t)i, entries_[i].meta});
    }

    // Manifest last; load() rejects any file that disagrees with it.
    write_file_atomic(dir / "index.bin", bin);
    MetadataStore store((dir / "metadata.db").string());
    store.replace_chunks(rows);
    json manifest = {
        {"format_version", kFormatVersion},
        {"dimension", dimension_},
        {"metric", "cosine"},
        {"count", entries_.size()},
        {"index_sha256", sha256_hex(bin)}
    };
    write_file_atomic(dir / "manifest.json", manifest.dump(2));
}

LoadReport VectorIndex::load(const std::filesystem::path& dir) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    entries_.clear();
    chunk_ids_.clear();

    LoadReport report;
    if (!std::filesystem::exists(dir / "manifest.json")) {
        report.reason = "no persisted index in " + dir.string();
        return report;
    }
    try {
        auto manifest = json::parse(read_binary_file(dir / "manifest.json"));
        int version = manifest.at("format_version").get<int>();
        if (version != kFormatVersion) throw StoreError("unsupported index format version " + std::to_string(version));
        int dim = manifest.at("dimension").get<int>();
        if (dim != dimension_) {
            throw StoreError("persisted dimension " + std::to_string(dim) + " does not match configured " +
                             std::to_string(dimension_));
        }
        if (manifest.at("metric").get<std::string>() != "cosine") throw StoreError("unsupported metric");
        uint64_t count = manifest.at("count").get<uint64_t>();

        std::string bin = read_binary_file(dir / "index.bin");
        if (sha256_hex(bin) != manifest.at("index_sha256").get<std::string>()) {
            throw StoreError("index.bin checksum mismatch");
        }
        if (bin.size() < kHeaderBytes || std::memcmp(bin.data(), kMagic, sizeof(kMagic)) != 0) {
            throw StoreError("index.bin has a bad header");
        }
        if ((int)get_le(bin, 8, 4) != dimension_ || get_le(bin, 12, 8) != count) {
            throw StoreError("index.bin header disagrees with manifest");
        }
        if (bin.size() != kHeaderBytes + count * (uint64_t)dimension_ * 4) {
            throw StoreError("index.bin has the wrong size");
        }

        MetadataStore store((dir / "metadata.db").string());
        auto rows = store.load_chunks();
        if (rows.size() != count) throw StoreError("metadata rows do not match vector count");

        std::vector<IndexEntry> loaded;
        loaded.reserve(rows.size());
        std::unordered_set<std::string> ids;
        size_t off = kHeaderBytes;
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i].position != (int64_t)i) throw StoreError("metadata positions are not contiguous");
            IndexEntry e;
            e.meta = std::move(rows[i].meta);
            e.vector.resize((size_t)dimension_);
            for (int d = 0; d < dimension_; ++d, off += 4) {
                uint32_t bits = (uint32_t)get_le(bin, off, 4);
                std::memcpy(&e.vector[(size_t)d], &bits, sizeof(bits));
            }
            validate(e);
            if (!ids.insert(e.meta.chunk_id).second) throw StoreError("duplicate chunk id " + e.meta.chunk_id);
            loaded.push_back(std::move(e));
        }
        entries_.swap(loaded);
        chunk_ids_.swap(ids);
        report.loaded = true;
        report.entries = entries_.size();
    } catch (const std::exception& e) {
        entries_.clear();
        chunk_ids_.clear();
        report.loaded = false;
        report.entries = 0;
        report.reason = e.what();
    }
    return report;
}
