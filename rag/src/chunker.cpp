#include "../include/chunker.hpp"
#include "../include/encoding.hpp"
#include "../include/errors.hpp"

void validate_chunk_config(int chunk_size, int overlap) {
    if (chunk_size < 1) {
        throw InvalidChunkConfigError("chunk size must be positive, got " + std::to_string(chunk_size));
    }
    if (overlap < 0 || overlap >= chunk_size) {
        throw InvalidChunkConfigError("chunk overlap must satisfy 0 <= overlap < chunk size, got overlap " +
                                      std::to_string(overlap) + " for size " + std::to_string(chunk_size));
    }
}

std::vector<ChunkCandidate> chunk_text(const std::string& text, int chunk_size, int overlap) {
    validate_chunk_config(chunk_size, overlap);
    std::vector<ChunkCandidate> out;
    const size_t n = text.size();
    const size_t size = (size_t)chunk_size;
    const size_t step = (size_t)(chunk_size - overlap);

    size_t start = 0;
    while (start < n) {
        size_t end = start + size >= n ? n : utf8_floor(text, start + size);
        if (end <= start) end = utf8_ceil(text, start + 1); // window narrower than one code point

        ChunkCandidate c;
        c.sequence_index = (int)out.size();
        c.start = start;
        c.end = end;
        c.text = text.substr(start, end - start);
        c.overlap = overlap;
        out.push_back(std::move(c));
        if (end == n) break;

        size_t next = utf8_floor(text, start + step);
        if (next <= start) next = utf8_ceil(text, start + 1);
        start = next;
    }
    return out;
}

std::vector<ChunkCandidate> chunk_text(const ExtractedText& doc, int chunk_size, int overlap) {
    auto chunks = chunk_text(doc.text, chunk_size, overlap);
    for (auto& c : chunks) c.page = page_at(doc.pages, c.start);
    return chunks;
}
