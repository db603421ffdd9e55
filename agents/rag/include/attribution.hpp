#pragma once
#include "corpus.hpp"
#include <memory>
#include <string>
#include <vector>

class Embedder;

struct Attribution {
    std::vector<ScoredChunk> sources;
    float confidence{0.0f}; // mean similarity of sources, 0 when there are none
};

// Maps a generated sentence back to the chunks of one document that most likely support it.
class AttributionScorer {
public:
    static constexpr size_t kTopSources = 3;

    AttributionScorer(std::shared_ptr<Embedder> embedder, const CorpusStore& corpus);

    // Throws NotFound for an unknown document, EmptyQuery for a blank sentence.
    Attribution attribute(const std::string& document_id, const std::string& sentence) const;

private:
    std::shared_ptr<Embedder> embedder_;
    const CorpusStore& corpus_;
};
