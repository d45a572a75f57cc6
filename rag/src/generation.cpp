#include "../include/generation.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaGenerationBackend::OllamaGenerationBackend(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

bool emit_chat_message(const std::string& line, const FragmentSink& sink) {
    json data;
    try {
        data = json::parse(line);
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("malformed chat response: ") + e.what(), false);
    }
    if (data.contains("error")) {
        throw UpstreamError("chat error: " + data["error"].dump(), false);
    }
    if (data.contains("message") && data["message"].contains("content")) {
        auto content = data["message"]["content"].get<std::string>();
        if (!content.empty()) sink(content);
    }
    return data.value("done", false);
}

void NdjsonAssembler::feed(const char* data, size_t len) {
    pending_.append(data, len);
    size_t pos;
    while ((pos = pending_.find('\n')) != std::string::npos) {
        std::string line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        take_line(line);
    }
}

void NdjsonAssembler::finish() {
    std::string tail;
    tail.swap(pending_);
    take_line(tail);
    if (!done_) throw UpstreamError("chat stream ended before completion", true);
}

void NdjsonAssembler::take_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) return;
    if (emit_chat_message(line, sink_)) done_ = true;
}

void OllamaGenerationBackend::generate(const Prompt& prompt, const FragmentSink& sink, const CallOptions& opts) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", cfg_.stream},
        {"options", {{"temperature", cfg_.temperature}, {"num_predict", cfg_.max_tokens}}},
        {"messages", json::array({
            json{{"role","system"},{"content",prompt.system}},
            json{{"role","user"},{"content",prompt.user}}
        })}
    };

    if (!cfg_.stream) {
        auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), opts);
        if (!http_status_ok(r.status)) {
            throw UpstreamError("chat failed: status " + std::to_string(r.status) + ": " + r.body.substr(0, 200),
                                http_status_transient(r.status), r.status);
        }
        emit_chat_message(r.body, sink);
        return;
    }

    NdjsonAssembler stream(sink);
    auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), opts,
                            [&](const char* data, size_t len){ stream.feed(data, len); });
    if (!http_status_ok(r.status)) {
        throw UpstreamError("chat failed: status " + std::to_string(r.status) + ": " + r.body.substr(0, 200),
                            http_status_transient(r.status), r.status);
    }
    stream.finish();
}
