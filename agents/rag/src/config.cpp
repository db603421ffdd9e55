#include "../include/config.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"

static long positive_or(const char* key, long value, long def) {
    if (value > 0) return value;
    log_warn(std::string(key) + " must be positive, using " + std::to_string(def));
    return def;
}

ServiceConfig load_config_from_env() {
    ServiceConfig cfg;
    cfg.port = (int)positive_or("RAG_PORT", getenv_long_or("RAG_PORT", 8000), 8000);

    std::string ollama = getenv_or("OLLAMA_URL", "http://localhost:11434");
    cfg.embed.ollama_url = ollama;
    cfg.embed.embed_model = getenv_or("RAG_EMBED_MODEL", "bge-m3");
    cfg.embed.timeout_ms = positive_or("RAG_EMBED_TIMEOUT_MS", getenv_long_or("RAG_EMBED_TIMEOUT_MS", 120000), 120000);

    cfg.llm.ollama_url = ollama;
    cfg.llm.llm_model = getenv_or("RAG_LLM_MODEL", "mistral");
    cfg.llm.timeout_ms = positive_or("RAG_LLM_TIMEOUT_MS", getenv_long_or("RAG_LLM_TIMEOUT_MS", 240000), 240000);

    cfg.index.index_path = getenv_or("RAG_INDEX_PATH", "./data/rag_index.db");
    cfg.index.oversample_factor = (size_t)positive_or("RAG_OVERSAMPLE", getenv_long_or("RAG_OVERSAMPLE", 4), 4);

    cfg.startup.index_load_timeout = std::chrono::milliseconds(
        positive_or("RAG_INDEX_LOAD_TIMEOUT_MS", getenv_long_or("RAG_INDEX_LOAD_TIMEOUT_MS", 30000), 30000));
    cfg.startup.search_init_timeout = std::chrono::milliseconds(
        positive_or("RAG_SEARCH_INIT_TIMEOUT_MS", getenv_long_or("RAG_SEARCH_INIT_TIMEOUT_MS", 60000), 60000));
    return cfg;
}
