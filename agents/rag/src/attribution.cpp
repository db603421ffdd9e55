#include "../include/attribution.hpp"
#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>

AttributionScorer::AttributionScorer(std::shared_ptr<Embedder> embedder, const CorpusStore& corpus)
    : embedder_(std::move(embedder)), corpus_(corpus) {}

Attribution AttributionScorer::attribute(const std::string& document_id, const std::string& sentence) const {
    if (is_blank(sentence)) throw RagError(ErrorCode::EmptyQuery, "sentence is empty");
    auto doc = corpus_.get(document_id);

    Attribution out;
    if (doc->chunks.empty()) return out;

    auto probe = embedder_->embed(sentence);
    std::vector<ScoredChunk> scored;
    scored.reserve(doc->chunks.size());
    for (const auto& c : doc->chunks) {
        scored.push_back({c, cosine_similarity(probe, c->embedding(*embedder_))});
    }
    // Chunks are held in chunk_index order; stable_sort keeps it for ties.
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });
    if (scored.size() > kTopSources) scored.resize(kTopSources);

    double sum = 0.0;
    for (const auto& sc : scored) sum += sc.score;
    out.confidence = (float)(sum / (double)scored.size());
    out.sources = std::move(scored);
    return out;
}
