#pragma once
#include "cancel.hpp"
#include "config.hpp"
#include "retry.hpp"
#include <memory>
#include <string>
#include <vector>

// The external embedding capability: one vector per input text, same order.
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts, const CallOptions& opts) = 0;
};

// Ollama /api/embed.
class OllamaEmbeddingBackend : public EmbeddingBackend {
public:
    explicit OllamaEmbeddingBackend(EmbedConfig cfg);
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts, const CallOptions& opts) override;

private:
    EmbedConfig cfg_;
};

// The "embeddings" rows of an /api/embed reply. Throws a terminal UpstreamError when malformed.
std::vector<std::vector<float>> parse_embed_response(const std::string& body);

// Batching, retry and shape validation around an EmbeddingBackend.
// A call either returns every vector or throws EmbeddingError.
class EmbeddingGateway {
public:
    EmbeddingGateway(std::shared_ptr<EmbeddingBackend> backend, int dimension, int batch_size,
                     RetryPolicy retry, long timeout_ms);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts, const CancellationToken& token) const;
    std::vector<float> embed_one(const std::string& text, const CancellationToken& token) const;

    int dimension() const { return dimension_; }

private:
    std::shared_ptr<EmbeddingBackend> backend_;
    int dimension_;
    int batch_size_;
    RetryPolicy retry_;
    long timeout_ms_;
};
