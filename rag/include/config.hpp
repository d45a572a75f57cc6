#pragma once
#include "log.hpp"
#include "retry.hpp"
#include <cstddef>
#include <string>

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"bge-m3"};
    int dimension{1024};
    int batch_size{32};
    long timeout_ms{120000};
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    long timeout_ms{240000};
    bool stream{true};
    double temperature{0.7};
    int max_tokens{1000};
};

struct ChunkConfig {
    int chunk_size{1000};
    int overlap{200};
};

// When prior turns are folded into the retrieval query.
enum class HistoryMode { always, never, anaphora };

HistoryMode parse_history_mode(const std::string& s);
const char* history_mode_name(HistoryMode mode);

struct RetrievalConfig {
    int top_k{5};
    float score_threshold{0.35f};
    int context_budget{4000};
    HistoryMode history_mode{HistoryMode::always};
    int history_turns{4}; // a turn is one question and its answer
};

// Messages covered by the given number of turns.
inline std::size_t history_messages(int turns) { return turns > 0 ? (std::size_t)turns * 2 : 0; }

struct SessionConfig {
    int max_messages{50};
    long idle_timeout_sec{3600};
};

struct ServiceConfig {
    std::string store_dir{"./data/store"};
    EmbedConfig embed;
    LlmConfig llm;
    ChunkConfig chunk;
    RetrievalConfig retrieval;
    SessionConfig session;
    RetryConfig retry;
    int ingest_workers{2};
    std::size_t max_file_bytes{10485760};
    long fetch_timeout_ms{30000}; // document downloads for ask_url()
    int max_url_questions{50};
    bool persist_on_write{true};
    LogLevel log_level{LogLevel::info};
    int port{8000};
};

ServiceConfig load_config_from_env();
// Throws ValidationError (InvalidChunkConfigError for the chunk window).
void validate_config(const ServiceConfig& cfg);
