#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

OllamaEmbeddingBackend::OllamaEmbeddingBackend(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::vector<std::vector<float>> OllamaEmbeddingBackend::embed(const std::vector<std::string>& texts,
                                                              const CallOptions& opts) {
    json body = {
        {"model", cfg_.embed_model},
        {"input", texts}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/embed", body.dump(), opts);
    if (!http_status_ok(r.status)) {
        throw UpstreamError("embedding request failed: status " + std::to_string(r.status) + ": " + r.body.substr(0, 200),
                            http_status_transient(r.status), r.status);
    }
    return parse_embed_response(r.body);
}

std::vector<std::vector<float>> parse_embed_response(const std::string& body) {
    std::vector<std::vector<float>> out;
    try {
        auto data = json::parse(body);
        for (auto& row : data.at("embeddings")) {
            std::vector<float> vec;
            vec.reserve(row.size());
            for (auto& v : row) vec.push_back(v.get<float>());
            out.push_back(std::move(vec));
        }
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("malformed embedding response: ") + e.what(), false);
    }
    return out;
}

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<EmbeddingBackend> backend, int dimension, int batch_size,
                                   RetryPolicy retry, long timeout_ms)
    : backend_(std::move(backend)), dimension_(dimension), batch_size_(std::max(1, batch_size)),
      retry_(std::move(retry)), timeout_ms_(timeout_ms) {}

std::vector<std::vector<float>> EmbeddingGateway::embed(const std::vector<std::string>& texts,
                                                        const CancellationToken& token) const {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    const auto until = retry_.deadline(); // one budget for every batch
    for (size_t i = 0; i < texts.size(); i += (size_t)batch_size_) {
        size_t end = std::min(texts.size(), i + (size_t)batch_size_);
        std::vector<std::string> batch(texts.begin() + i, texts.begin() + end);
        std::vector<std::vector<float>> vecs;
        try {
            vecs = retry_.run("embed", token, until, [&](long remaining_ms) {
                CallOptions opts;
                opts.timeout_ms = std::min(timeout_ms_, remaining_ms);
                opts.token = token;
                return backend_->embed(batch, opts);
            });
        } catch (const UpstreamError& e) {
            throw EmbeddingError(e.what(), e.transient());
        } catch (const std::exception& e) {
            throw EmbeddingError(e.what(), false);
        }

        if (vecs.size() != batch.size()) {
            throw EmbeddingError("expected " + std::to_string(batch.size()) + " vectors, got " +
                                 std::to_string(vecs.size()), false);
        }
        for (auto& v : vecs) {
            if ((int)v.size() != dimension_) {
                throw EmbeddingError("vector dimension mismatch: expected " + std::to_string(dimension_) +
                                     ", got " + std::to_string(v.size()), false);
            }
            out.push_back(std::move(v));
        }
    }
    log_debug("embed", "embedded " + std::to_string(texts.size()) + " texts");
    return out;
}

std::vector<float> EmbeddingGateway::embed_one(const std::string& text, const CancellationToken& token) const {
    auto vecs = embed(std::vector<std::string>{text}, token);
    return std::move(vecs.front());
}
