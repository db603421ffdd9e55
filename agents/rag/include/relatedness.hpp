#pragma once
#include "corpus.hpp"
#include "llm.hpp"
#include <set>
#include <string>
#include <vector>

struct RelatedDocument {
    std::string document_id;
    std::string title;
    std::vector<std::string> common_topics;
    double score{0.0};
};

double jaccard_index(const std::set<std::string>& a, const std::set<std::string>& b);

class RelatednessAggregator {
public:
    static constexpr size_t kMaxRelated = 5;
    static constexpr size_t kMaxFieldChars = 1000;

    explicit RelatednessAggregator(const CorpusStore& corpus);

    // Other documents by topic overlap, best first, ties by id. Throws NotFound for an unknown id.
    std::vector<RelatedDocument> related(const std::string& document_id) const;
    // Digests for the known ids in request order. Throws NoValidDocuments when none resolve.
    std::vector<PaperDigest> synthesis_input(const std::vector<std::string>& document_ids) const;

private:
    const CorpusStore& corpus_;
};

std::string document_title(const DocumentRecord& doc);
