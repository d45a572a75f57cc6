#pragma once
#include <stdexcept>
#include <string>

// User-visible failure categories. Transport layers map these to status codes.
enum class ErrorKind {
    validation,
    not_found,
    upstream,
    internal
};

const char* error_kind_name(ErrorKind kind);

class RagError : public std::runtime_error {
public:
    RagError(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// --- validation -------------------------------------------------------------

class ValidationError : public RagError {
public:
    explicit ValidationError(const std::string& what) : RagError(ErrorKind::validation, what) {}
};

class UnsupportedFormatError : public RagError {
public:
    explicit UnsupportedFormatError(const std::string& what) : RagError(ErrorKind::validation, what) {}
};

class CorruptDocumentError : public RagError {
public:
    explicit CorruptDocumentError(const std::string& what) : RagError(ErrorKind::validation, what) {}
};

// A downloaded document that could not be turned into searchable chunks.
class DocumentProcessingError : public RagError {
public:
    explicit DocumentProcessingError(const std::string& what) : RagError(ErrorKind::validation, what) {}
};

class InvalidChunkConfigError : public RagError {
public:
    explicit InvalidChunkConfigError(const std::string& what) : RagError(ErrorKind::validation, what) {}
};

class DimensionMismatchError : public RagError {
public:
    DimensionMismatchError(std::size_t expected, std::size_t actual)
        : RagError(ErrorKind::validation,
                   "vector dimension mismatch: expected " + std::to_string(expected) +
                   ", got " + std::to_string(actual)) {}
};

class InvalidQueryError : public RagError {
public:
    explicit InvalidQueryError(const std::string& what) : RagError(ErrorKind::validation, what) {}
};

// --- not found --------------------------------------------------------------

class DocumentNotFoundError : public RagError {
public:
    explicit DocumentNotFoundError(const std::string& id)
        : RagError(ErrorKind::not_found, "document not found: " + id) {}
};

class SessionNotFoundError : public RagError {
public:
    explicit SessionNotFoundError(const std::string& id)
        : RagError(ErrorKind::not_found, "session not found: " + id) {}
};

class AnswerNotFoundError : public RagError {
public:
    explicit AnswerNotFoundError(const std::string& id)
        : RagError(ErrorKind::not_found, "answer not found: " + id) {}
};

// --- upstream ---------------------------------------------------------------

// A failed remote call. transient() tells the retry policy whether trying again can help.
class UpstreamError : public RagError {
public:
    UpstreamError(const std::string& what, bool transient, long status = 0)
        : RagError(ErrorKind::upstream, what), transient_(transient), status_(status) {}
    bool transient() const { return transient_; }
    long status() const { return status_; }

private:
    bool transient_;
    long status_;
};

class CancelledError : public UpstreamError {
public:
    explicit CancelledError(const std::string& what) : UpstreamError(what, false) {}
};

class EmbeddingError : public UpstreamError {
public:
    EmbeddingError(const std::string& what, bool transient) : UpstreamError("embedding failed: " + what, transient) {}
};

class AnswerGenerationError : public UpstreamError {
public:
    AnswerGenerationError(const std::string& what, bool transient)
        : UpstreamError("answer generation failed: " + what, transient) {}
};

class RetrievalError : public UpstreamError {
public:
    RetrievalError(const std::string& what, bool transient) : UpstreamError("retrieval failed: " + what, transient) {}
};

// --- internal ---------------------------------------------------------------

class StoreError : public RagError {
public:
    explicit StoreError(const std::string& what) : RagError(ErrorKind::internal, what) {}
};
