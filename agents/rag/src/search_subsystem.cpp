#include "../include/search_subsystem.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

OllamaWarmup::OllamaWarmup(EmbedConfig cfg, std::shared_ptr<Embedder> embedder)
    : cfg_(std::move(cfg)), embedder_(std::move(embedder)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

void OllamaWarmup::initialize() {
    auto r = http_get(cfg_.ollama_url + "/api/tags", cfg_.timeout_ms);
    if (!r.ok()) throw std::runtime_error("model listing failed: status " + std::to_string(r.status));

    bool listed = false;
    auto data = json::parse(r.body, nullptr, false);
    if (!data.is_discarded() && data.contains("models") && data["models"].is_array()) {
        for (const auto& m : data["models"]) {
            auto name = m.value("name", std::string());
            if (name == cfg_.embed_model || name.rfind(cfg_.embed_model + ":", 0) == 0) { listed = true; break; }
        }
    }
    if (!listed) log_warn("embedding model " + cfg_.embed_model + " is not listed by " + cfg_.ollama_url);

    auto probe = embedder_->embed("This is a test query");
    log_info("embedding model ready (dimension " + std::to_string(probe.size()) + ")");
}
