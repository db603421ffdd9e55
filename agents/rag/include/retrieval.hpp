#pragma once
#include "llm.hpp"
#include "vector_index.hpp"
#include <memory>
#include <string>
#include <vector>

class Embedder;

struct QueryAnswer {
    bool answered{false};
    std::string answer;
    std::vector<ScoredChunk> sources;
    std::vector<Citation> citations;
};

class RetrievalEngine {
public:
    static constexpr size_t kDefaultAnswerK = 5;

    RetrievalEngine(std::shared_ptr<Embedder> embedder, const VectorIndexManager& index,
                    std::shared_ptr<LlmService> llm);

    // Throws EmptyQuery for blank text, IndexNotReady when no index is live.
    std::vector<ScoredChunk> query(const std::string& text, const SearchScope& scope, size_t k);
    // Never calls the model with an empty context.
    QueryAnswer query_with_answer(const std::string& text, const SearchScope& scope, size_t k = kDefaultAnswerK);

    static const char* no_answer_text();

private:
    std::shared_ptr<Embedder> embedder_;
    const VectorIndexManager& index_;
    std::shared_ptr<LlmService> llm_;
};
