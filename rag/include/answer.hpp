#pragma once
#include "cancel.hpp"
#include "generation.hpp"
#include "retrieval.hpp"
#include "retry.hpp"
#include "session_store.hpp"
#include <memory>
#include <string>
#include <vector>

struct Answer {
    std::string text;
    std::vector<Citation> sources;
    double confidence{0.0};
};

class AnswerSynthesizer {
public:
    AnswerSynthesizer(std::shared_ptr<GenerationBackend> backend, RetryPolicy retry, long timeout_ms);

    // Same inputs, same prompt.
    static Prompt build_prompt(const std::string& question, const std::string& context,
                               const std::vector<Message>& history);

    // One generation call (plus retries of transient failures). Throws AnswerGenerationError.
    // With a live sink, fragments are forwarded as they arrive and a failure after the
    // first fragment is not retried.
    Answer answer(const std::string& question, const AssembledContext& context,
                  const std::vector<Message>& history, const CancellationToken& token,
                  const FragmentSink& live = FragmentSink()) const;

    // Distinct [n] / [n, m] markers in order of first appearance.
    static std::vector<int> citation_markers(const std::string& text);
    // 0.7 * best score (clamped to [0, 1]) + 0.3 * min(chunks / 3, 1); 0 for no chunks.
    static double confidence(const std::vector<SearchResult>& used);

private:
    std::shared_ptr<GenerationBackend> backend_;
    RetryPolicy retry_;
    long timeout_ms_;
};
