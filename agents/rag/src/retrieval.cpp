#include "../include/retrieval.hpp"
#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

RetrievalEngine::RetrievalEngine(std::shared_ptr<Embedder> embedder, const VectorIndexManager& index,
                                 std::shared_ptr<LlmService> llm)
    : embedder_(std::move(embedder)), index_(index), llm_(std::move(llm)) {}

const char* RetrievalEngine::no_answer_text() {
    return "No answer available: no indexed passages matched this question.";
}

std::vector<ScoredChunk> RetrievalEngine::query(const std::string& text, const SearchScope& scope, size_t k) {
    if (is_blank(text)) throw RagError(ErrorCode::EmptyQuery, "query text is empty");
    if (k == 0) throw RagError(ErrorCode::InvalidArgument, "k must be at least 1");
    if (!index_.ready()) throw RagError(ErrorCode::IndexNotReady, "vector index is not ready");
    auto qvec = embedder_->embed(text);
    return index_.search(qvec, k, scope);
}

QueryAnswer RetrievalEngine::query_with_answer(const std::string& text, const SearchScope& scope, size_t k) {
    QueryAnswer res;
    res.sources = query(text, scope, k);
    if (res.sources.empty()) {
        res.answer = no_answer_text();
        return res;
    }
    auto cited = llm_->answer_with_citations(text, res.sources);
    res.answered = true;
    res.answer = std::move(cited.answer);
    res.citations = std::move(cited.citations);
    return res;
}
