#pragma once
#include "extractor.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct ChunkCandidate {
    int sequence_index{0};
    std::string text;
    std::size_t start{0}; // byte range [start, end) in the extracted text
    std::size_t end{0};
    int page{0};
    int overlap{0};
};

// Throws InvalidChunkConfigError unless chunk_size >= 1 and 0 <= overlap < chunk_size.
void validate_chunk_config(int chunk_size, int overlap);

// Fixed character windows of chunk_size bytes advancing by chunk_size - overlap.
// Boundaries never split a UTF-8 sequence. The last window may be short and is kept;
// empty text yields no chunks. Deterministic for a given (text, chunk_size, overlap).
std::vector<ChunkCandidate> chunk_text(const std::string& text, int chunk_size, int overlap);
std::vector<ChunkCandidate> chunk_text(const ExtractedText& doc, int chunk_size, int overlap);
