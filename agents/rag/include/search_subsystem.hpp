#pragma once
#include "embedder.hpp"
#include <memory>

// Collaborator initialised once at startup; throws on failure.
class SearchSubsystem {
public:
    virtual ~SearchSubsystem() = default;
    virtual void initialize() = 0;
};

// Checks the embedding host lists the model, then embeds a probe query once.
class OllamaWarmup : public SearchSubsystem {
public:
    OllamaWarmup(EmbedConfig cfg, std::shared_ptr<Embedder> embedder);
    void initialize() override;

private:
    EmbedConfig cfg_;
    std::shared_ptr<Embedder> embedder_;
};
