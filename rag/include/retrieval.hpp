#pragma once
#include "cancel.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "session_store.hpp"
#include "vector_index.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One context block's origin, keyed by its [n] marker.
struct Citation {
    int marker{0};
    std::string document_id;
    std::string chunk_id;
    std::string filename;
    std::string excerpt;
    float score{0.0f};
    int page{0};
};

using CitationMap = std::map<int, Citation>;

struct RetrievalResult {
    std::string query_text;                // what was embedded
    std::vector<SearchResult> candidates;  // ranked, threshold applied
    bool found() const { return !candidates.empty(); }
};

struct AssembledContext {
    std::string text;
    CitationMap citations;
    std::vector<SearchResult> used; // in marker order
};

// Maps a document id to the filename shown in context headers; empty means unknown.
using FilenameLookup = std::function<std::string(const std::string& document_id)>;

// True when the question contains a word that usually refers back to an earlier turn.
bool has_anaphora(const std::string& question);

class RetrievalEngine {
public:
    RetrievalEngine(const EmbeddingGateway& gateway, const VectorIndex& index, RetrievalConfig cfg);

    // The text that gets embedded: the messages of up to history_turns prior turns, oldest first,
    // followed by the question. History is used according to the configured HistoryMode.
    std::string build_query(const std::string& question, const std::vector<Message>& history) const;

    // Throws InvalidQueryError for k <= 0, RetrievalError when embedding or search fails.
    // An empty candidate list is the "no relevant context" signal.
    RetrievalResult retrieve(const std::string& question, int k, const std::vector<Message>& history,
                             const CancellationToken& token,
                             std::optional<float> score_threshold = std::nullopt) const;

    // Appends whole blocks in ranked order while they fit in budget bytes; a block that
    // does not fit is skipped. The returned text never exceeds budget.
    static AssembledContext assemble_context(const std::vector<SearchResult>& candidates, std::size_t budget,
                                             const FilenameLookup& filename_of = {});


private:
    const EmbeddingGateway& gateway_;
    const VectorIndex& index_;
    RetrievalConfig cfg_;
};
