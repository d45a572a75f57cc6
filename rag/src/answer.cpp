#include "../include/answer.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <cctype>

static const char* kSystemPrompt =
    "You are a concise assistant. Answer using only the provided context. "
    "Cite the context blocks you rely on as [n]. "
    "If the context does not contain the answer, say you don't know.";

AnswerSynthesizer::AnswerSynthesizer(std::shared_ptr<GenerationBackend> backend, RetryPolicy retry, long timeout_ms)
    : backend_(std::move(backend)), retry_(std::move(retry)), timeout_ms_(timeout_ms) {}

Prompt AnswerSynthesizer::build_prompt(const std::string& question, const std::string& context,
                                       const std::vector<Message>& history) {
    Prompt p;
    p.system = kSystemPrompt;
    if (!history.empty()) {
        p.user += "Conversation so far:\n";
        for (const auto& m : history) p.user += m.role + ": " + m.text + "\n";
        p.user += "\n";
    }
    p.user += "Question: " + question + "\n\nContext:\n" + context;
    return p;
}

std::vector<int> AnswerSynthesizer::citation_markers(const std::string& text) {
    std::vector<int> out;
    size_t i = 0;
    while ((i = text.find('[', i)) != std::string::npos) {
        size_t j = i + 1;
        std::vector<int> found;
        bool ok = false;
        while (j < text.size()) {
            while (j < text.size() && text[j] == ' ') ++j;
            size_t digits = j;
            int n = 0;
            while (j < text.size() && std::isdigit((unsigned char)text[j]) && j - digits < 6) {
                n = n * 10 + (text[j] - '0');
                ++j;
            }
            if (j == digits) break;
            found.push_back(n);
            while (j < text.size() && text[j] == ' ') ++j;
            if (j < text.size() && text[j] == ',') { ++j; continue; }
            ok = j < text.size() && text[j] == ']';
            break;
        }
        if (ok) {
            for (int n : found) {
                if (std::find(out.begin(), out.end(), n) == out.end()) out.push_back(n);
            }
            i = j + 1;
        } else {
            i += 1;
        }
    }
    return out;
}

double AnswerSynthesizer::confidence(const std::vector<SearchResult>& used) {
    if (used.empty()) return 0.0;
    float best = used.front().score;
    for (const auto& r : used) best = std::max(best, r.score);
    double b = std::min(1.0, std::max(0.0, (double)best));
    double coverage = std::min(1.0, (double)used.size() / 3.0);
    return std::min(1.0, 0.7 * b + 0.3 * coverage);
}

Answer AnswerSynthesizer::answer(const std::string& question, const AssembledContext& context,
                                 const std::vector<Message>& history, const CancellationToken& token,
                                 const FragmentSink& live) const {
    Prompt prompt = build_prompt(question, context.text, history);
    Answer ans;
    bool forwarded = false;
    try {
        ans.text = retry_.run("generate", token, [&](long remaining_ms) {
            CallOptions opts;
            opts.timeout_ms = std::min(timeout_ms_, remaining_ms);
            opts.token = token;
            std::string buf; // fragments of a failed attempt are discarded
            try {
                backend_->generate(prompt, [&](const std::string& fragment) {
                    buf += fragment;
                    if (live) {
                        forwarded = true;
                        live(fragment);
                    }
                }, opts);
            } catch (const UpstreamError& e) {
                // The caller already holds part of this attempt.
                if (forwarded && e.transient()) throw UpstreamError(e.what(), false, e.status());
                throw;
            }
            return buf;
        });
    } catch (const UpstreamError& e) {
        throw AnswerGenerationError(e.what(), e.transient());
    } catch (const std::exception& e) {
        throw AnswerGenerationError(e.what(), false);
    }

    for (int n : citation_markers(ans.text)) {
        auto it = context.citations.find(n);
        if (it != context.citations.end()) ans.sources.push_back(it->second);
    }
    if (ans.sources.empty()) {
        for (const auto& kv : context.citations) ans.sources.push_back(kv.second);
    }
    ans.confidence = confidence(context.used);
    log_debug("answer", std::to_string(ans.text.size()) + " bytes, " + std::to_string(ans.sources.size()) + " sources");
    return ans;
}
