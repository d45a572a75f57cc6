#include "../include/config.hpp"
#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

HistoryMode parse_history_mode(const std::string& s) {
    auto v = to_lower(s);
    if (v == "always") return HistoryMode::always;
    if (v == "never") return HistoryMode::never;
    if (v == "anaphora") return HistoryMode::anaphora;
    throw ValidationError("unknown history mode: " + s);
}

const char* history_mode_name(HistoryMode mode) {
    switch (mode) {
        case HistoryMode::always: return "always";
        case HistoryMode::never: return "never";
        case HistoryMode::anaphora: return "anaphora";
    }
    return "always";
}

ServiceConfig load_config_from_env() {
    ServiceConfig c;
    c.store_dir = getenv_or("RAG_STORE_DIR", c.store_dir);

    std::string ollama = getenv_or("OLLAMA_URL", c.embed.ollama_url);
    c.embed.ollama_url = ollama;
    c.embed.embed_model = getenv_or("RAG_EMBED_MODEL", c.embed.embed_model);
    c.embed.dimension = (int)getenv_long("RAG_EMBED_DIM", c.embed.dimension);
    c.embed.batch_size = (int)getenv_long("RAG_EMBED_BATCH", c.embed.batch_size);
    c.embed.timeout_ms = getenv_long("RAG_EMBED_TIMEOUT_MS", c.embed.timeout_ms);

    c.llm.ollama_url = ollama;
    c.llm.llm_model = getenv_or("RAG_LLM_MODEL", c.llm.llm_model);
    c.llm.timeout_ms = getenv_long("RAG_LLM_TIMEOUT_MS", c.llm.timeout_ms);
    c.llm.stream = getenv_bool("RAG_LLM_STREAM", c.llm.stream);
    c.llm.temperature = getenv_double("RAG_LLM_TEMPERATURE", c.llm.temperature);
    c.llm.max_tokens = (int)getenv_long("RAG_LLM_MAX_TOKENS", c.llm.max_tokens);

    c.chunk.chunk_size = (int)getenv_long("RAG_CHUNK_SIZE", c.chunk.chunk_size);
    c.chunk.overlap = (int)getenv_long("RAG_CHUNK_OVERLAP", c.chunk.overlap);

    c.retrieval.top_k = (int)getenv_long("RAG_TOP_K", c.retrieval.top_k);
    c.retrieval.score_threshold = (float)getenv_double("RAG_SCORE_THRESHOLD", c.retrieval.score_threshold);
    c.retrieval.context_budget = (int)getenv_long("RAG_CONTEXT_BUDGET", c.retrieval.context_budget);
    c.retrieval.history_mode = parse_history_mode(getenv_or("RAG_HISTORY_MODE", "always"));
    c.retrieval.history_turns = (int)getenv_long("RAG_HISTORY_TURNS", c.retrieval.history_turns);

    c.session.max_messages = (int)getenv_long("RAG_SESSION_MAX_MESSAGES", c.session.max_messages);
    c.session.idle_timeout_sec = getenv_long("RAG_SESSION_IDLE_SEC", c.session.idle_timeout_sec);

    c.retry.max_attempts = (int)getenv_long("RAG_RETRY_ATTEMPTS", c.retry.max_attempts);
    c.retry.base_delay_ms = getenv_long("RAG_RETRY_BASE_MS", c.retry.base_delay_ms);
    c.retry.max_delay_ms = getenv_long("RAG_RETRY_MAX_MS", c.retry.max_delay_ms);
    c.retry.max_total_ms = getenv_long("RAG_RETRY_TOTAL_MS", c.retry.max_total_ms);

    c.ingest_workers = (int)getenv_long("RAG_INGEST_WORKERS", c.ingest_workers);
    c.max_file_bytes = (std::size_t)getenv_long("RAG_MAX_FILE_BYTES", (long)c.max_file_bytes);
    c.fetch_timeout_ms = getenv_long("RAG_FETCH_TIMEOUT_MS", c.fetch_timeout_ms);
    c.max_url_questions = (int)getenv_long("RAG_MAX_URL_QUESTIONS", c.max_url_questions);
    c.log_level = parse_log_level(getenv_or("RAG_LOG_LEVEL", "info"));
    c.port = (int)getenv_long("RAG_PORT", c.port);
    return c;
}

void validate_config(const ServiceConfig& c) {
    validate_chunk_config(c.chunk.chunk_size, c.chunk.overlap);
    if (c.store_dir.empty()) throw ValidationError("store directory must be set");
    if (c.embed.dimension <= 0) throw ValidationError("embedding dimension must be positive");
    if (c.embed.batch_size <= 0) throw ValidationError("embedding batch size must be positive");
    if (c.embed.timeout_ms <= 0 || c.llm.timeout_ms <= 0) throw ValidationError("timeouts must be positive");
    if (c.llm.temperature < 0.0 || c.llm.temperature > 2.0) throw ValidationError("temperature must be within [0, 2]");
    if (c.llm.max_tokens <= 0) throw ValidationError("max tokens must be positive");
    if (c.retrieval.top_k <= 0) throw ValidationError("top_k must be positive");
    if (c.retrieval.score_threshold < -1.0f || c.retrieval.score_threshold > 1.0f) {
        throw ValidationError("score threshold must be within [-1, 1]");
    }
    if (c.retrieval.context_budget <= 0) throw ValidationError("context budget must be positive");
    if (c.retrieval.history_turns < 0) throw ValidationError("history turns must not be negative");
    if (c.session.max_messages <= 0) throw ValidationError("session max messages must be positive");
    if (c.session.idle_timeout_sec <= 0) throw ValidationError("session idle timeout must be positive");
    if (c.retry.max_attempts <= 0) throw ValidationError("retry attempts must be positive");
    if (c.retry.base_delay_ms < 0 || c.retry.max_delay_ms < c.retry.base_delay_ms) {
        throw ValidationError("retry delays must satisfy 0 <= base <= max");
    }
    if (c.retry.max_total_ms <= 0) throw ValidationError("retry total budget must be positive");
    if (c.ingest_workers <= 0) throw ValidationError("ingest workers must be positive");
    if (c.max_file_bytes == 0) throw ValidationError("max file size must be positive");
    if (c.fetch_timeout_ms <= 0) throw ValidationError("fetch timeout must be positive");
    if (c.max_url_questions <= 0) throw ValidationError("max url questions must be positive");
    if (c.port <= 0 || c.port > 65535) throw ValidationError("port must be within 1..65535");
}
