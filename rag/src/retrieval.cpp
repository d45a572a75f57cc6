#include "../include/retrieval.hpp"
#include "../include/encoding.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

static const std::size_t kExcerptBytes = 200;

bool has_anaphora(const std::string& question) {
    static const std::unordered_set<std::string> words = {
        "it", "its", "they", "them", "their", "this", "that", "these", "those",
        "he", "she", "him", "her", "his", "hers", "one", "ones", "there",
        "former", "latter", "above"
    };
    std::string word;
    auto flush = [&]{
        bool hit = !word.empty() && words.count(word) > 0;
        word.clear();
        return hit;
    };
    for (char c : question) {
        unsigned char uc = (unsigned char)c;
        if (std::isalpha(uc)) word.push_back((char)std::tolower(uc));
        else if (flush()) return true;
    }
    return flush();
}

RetrievalEngine::RetrievalEngine(const EmbeddingGateway& gateway, const VectorIndex& index, RetrievalConfig cfg)
    : gateway_(gateway), index_(index), cfg_(cfg) {}

std::string RetrievalEngine::build_query(const std::string& question, const std::vector<Message>& history) const {
    bool use_history = false;
    switch (cfg_.history_mode) {
        case HistoryMode::always: use_history = true; break;
        case HistoryMode::never: use_history = false; break;
        case HistoryMode::anaphora: use_history = has_anaphora(question); break;
    }
    if (!use_history || history.empty() || cfg_.history_turns <= 0) return question;

    std::size_t n = std::min(history.size(), history_messages(cfg_.history_turns));
    std::string out;
    for (std::size_t i = history.size() - n; i < history.size(); ++i) {
        out += history[i].role + ": " + history[i].text + "\n";
    }
    out += question;
    return out;
}

RetrievalResult RetrievalEngine::retrieve(const std::string& question, int k, const std::vector<Message>& history,
                                          const CancellationToken& token,
                                          std::optional<float> score_threshold) const {
    if (k <= 0) throw InvalidQueryError("k must be positive, got " + std::to_string(k));
    RetrievalResult res;
    res.query_text = build_query(question, history);
    float threshold = score_threshold ? *score_threshold : cfg_.score_threshold;
    try {
        auto qvec = gateway_.embed_one(res.query_text, token);
        res.candidates = index_.search(qvec, k, threshold);
    } catch (const UpstreamError& e) {
        throw RetrievalError(e.what(), e.transient());
    } catch (const std::exception& e) {
        throw RetrievalError(e.what(), false);
    }
    log_debug("retrieve", std::to_string(res.candidates.size()) + " candidates above " + std::to_string(threshold));
    return res;
}

AssembledContext RetrievalEngine::assemble_context(const std::vector<SearchResult>& candidates, std::size_t budget,
                                                   const FilenameLookup& filename_of) {
    AssembledContext ctx;
    int marker = 1;
    for (const auto& c : candidates) {
        std::string filename = filename_of ? filename_of(c.meta.document_id) : std::string();
        std::string block = "[" + std::to_string(marker) + "] " + (filename.empty() ? c.meta.document_id : filename);
        if (c.meta.page > 0) block += " (page " + std::to_string(c.meta.page) + ")";
        block += "\n" + c.meta.text + "\n\n";
        if (ctx.text.size() + block.size() > budget) continue;

        ctx.text += block;
        Citation cit;
        cit.marker = marker;
        cit.document_id = c.meta.document_id;
        cit.chunk_id = c.meta.chunk_id;
        cit.filename = filename;
        cit.excerpt = utf8_prefix(c.meta.text, kExcerptBytes);
        cit.score = c.score;
        cit.page = c.meta.page;
        ctx.citations.emplace(marker, std::move(cit));
        ctx.used.push_back(c);
        ++marker;
    }
    return ctx;
}
