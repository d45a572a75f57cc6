#pragma once
#include "cancel.hpp"
#include "config.hpp"
#include <functional>
#include <string>
#include <utility>

struct Prompt {
    std::string system;
    std::string user;
};

// Receives generated text in order; a non-streaming backend calls it once.
using FragmentSink = std::function<void(const std::string& fragment)>;

// The external generation capability.
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;
    virtual void generate(const Prompt& prompt, const FragmentSink& sink, const CallOptions& opts) = 0;
};

// Parses one /api/chat reply object and forwards its message content.
// Returns true when the object marks the reply done.
bool emit_chat_message(const std::string& line, const FragmentSink& sink);

// Reassembles an NDJSON chat stream whose network chunks do not align with lines.
class NdjsonAssembler {
public:
    explicit NdjsonAssembler(FragmentSink sink) : sink_(std::move(sink)) {}

    void feed(const char* data, size_t len);
    // Handles a final line without a newline. Throws a transient UpstreamError when
    // the stream never reported done.
    void finish();
    bool done() const { return done_; }

private:
    void take_line(const std::string& line);

    FragmentSink sink_;
    std::string pending_;
    bool done_{false};
};

// Ollama /api/chat, either one JSON body or an NDJSON stream of partial messages.
class OllamaGenerationBackend : public GenerationBackend {
public:
    explicit OllamaGenerationBackend(LlmConfig cfg);
    void generate(const Prompt& prompt, const FragmentSink& sink, const CallOptions& opts) override;

private:
    LlmConfig cfg_;
};
