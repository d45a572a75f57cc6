#pragma once
#include <cstdint>
#include <string>

enum class ProcessingStatus { pending, processing, ready, failed };

const char* status_name(ProcessingStatus s);
ProcessingStatus parse_status(const std::string& s);

struct Document {
    std::string id;       // SHA-256 of the uploaded bytes
    std::string filename;
    std::string format;
    std::string encoding;
    int64_t uploaded_at{0}; // unix millis
    int64_t size{0};
    ProcessingStatus status{ProcessingStatus::pending};
    std::string error;
    int chunk_count{0};
    int chunk_size{0};
    int chunk_overlap{0};
};

// Index-side description of one chunk; the text is kept for citation display.
struct ChunkMeta {
    std::string document_id;
    std::string chunk_id; // "<document_id>:<sequence_index>"
    int sequence_index{0};
    std::string text;
    int64_t start{0};
    int64_t end{0};
    int page{0};
};

std::string make_chunk_id(const std::string& document_id, int sequence_index);
