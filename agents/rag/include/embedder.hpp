#pragma once
#include <string>
#include <vector>

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"bge-m3"};
    long timeout_ms{120000};
};

// Text -> fixed-length vector. Deterministic for identical input.
// Implementations throw RagError(EmbeddingServiceError) on failure.
class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedConfig cfg);
    std::vector<float> embed(const std::string& text) override;

    const EmbedConfig& config() const { return cfg_; }

private:
    EmbedConfig cfg_;
};
