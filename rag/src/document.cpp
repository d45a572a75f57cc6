#include "../include/document.hpp"
#include "../include/errors.hpp"

const char* status_name(ProcessingStatus s) {
    switch (s) {
        case ProcessingStatus::pending: return "pending";
        case ProcessingStatus::processing: return "processing";
        case ProcessingStatus::ready: return "ready";
        case ProcessingStatus::failed: return "failed";
    }
    return "failed";
}

ProcessingStatus parse_status(const std::string& s) {
    if (s == "pending") return ProcessingStatus::pending;
    if (s == "processing") return ProcessingStatus::processing;
    if (s == "ready") return ProcessingStatus::ready;
    if (s == "failed") return ProcessingStatus::failed;
    throw StoreError("unknown processing status: " + s);
}

std::string make_chunk_id(const std::string& document_id, int sequence_index) {
    return document_id + ":" + std::to_string(sequence_index);
}
