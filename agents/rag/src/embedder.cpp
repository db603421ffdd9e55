#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::vector<float> OllamaEmbedder::embed(const std::string& text) {
    json body = {
        {"model", cfg_.embed_model},
        {"prompt", text}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/embeddings", body.dump(), cfg_.timeout_ms);
    } catch (const std::exception& e) {
        throw RagError(ErrorCode::EmbeddingServiceError, std::string("embedding request failed: ") + e.what());
    }
    if (!r.ok()) {
        throw RagError(ErrorCode::EmbeddingServiceError, "embedding failed: status " + std::to_string(r.status));
    }
    std::vector<float> vec;
    try {
        auto data = json::parse(r.body);
        for (auto& v : data.at("embedding")) vec.push_back(v.get<float>());
    } catch (const json::exception& e) {
        throw RagError(ErrorCode::EmbeddingServiceError, std::string("malformed embedding response: ") + e.what());
    }
    if (vec.empty()) {
        throw RagError(ErrorCode::EmbeddingServiceError, "embedding response contained no vector");
    }
    return vec;
}
