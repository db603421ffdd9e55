#pragma once
#include "attribution.hpp"
#include "corpus.hpp"
#include "embedder.hpp"
#include "llm.hpp"
#include "parser.hpp"
#include "relatedness.hpp"
#include "retrieval.hpp"
#include "vector_index.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct IngestResult {
    std::string document_id;
    size_t chunk_count{0};
    std::set<std::string> topics;
    bool index_updated{false};
    std::string warning;
};

struct DeleteResult {
    bool index_updated{false};
    std::string warning;
};

struct DocumentInfo {
    std::string document_id;
    nlohmann::json metadata;
    std::vector<std::string> sections;
    std::set<std::string> topics;
    size_t total_chunks{0};
    std::string chunking_method;
    std::chrono::system_clock::time_point ingested_at{};
};

// Owns the corpus and the index and serializes every corpus mutation with the
// rebuild request it triggers, so each rebuild sees one consistent snapshot.
class RagService {
public:
    static constexpr size_t kTopicChunks = 5;

    RagService(std::shared_ptr<Embedder> embedder, std::shared_ptr<LlmService> llm,
               std::shared_ptr<DocumentParser> parser, IndexManagerOptions index_opts);

    RagService(const RagService&) = delete;
    RagService& operator=(const RagService&) = delete;

    IngestResult ingest(const std::string& document_id, std::vector<RawChunk> chunks_raw, DocInfo doc_info);
    IngestResult ingest_file(const std::filesystem::path& path);
    DeleteResult remove(const std::string& document_id);

    std::vector<ScoredChunk> query(const std::string& text, const SearchScope& scope, size_t k);
    QueryAnswer query_with_answer(const std::string& text, const SearchScope& scope,
                                  size_t k = RetrievalEngine::kDefaultAnswerK);
    Attribution attribution(const std::string& document_id, const std::string& sentence);
    std::vector<RelatedDocument> related(const std::string& document_id);
    std::vector<PaperDigest> synthesis_input(const std::vector<std::string>& document_ids);
    nlohmann::json synthesize(const std::vector<std::string>& document_ids, const std::string& synthesis_type);

    std::string summarize(const std::string& document_id, const std::string& audience);
    nlohmann::json explain_text(const std::string& document_id, const std::string& selected_text,
                                const std::string& context, const std::string& question,
                                const std::string& audience);

    DocumentInfo document_info(const std::string& document_id) const;
    std::vector<std::string> list_documents() const;
    std::vector<ChunkPtr> chunks(const std::string& document_id, size_t start, size_t limit) const;

    IndexHealth index_health() const;
    void save_index() const;

    VectorIndexManager& index() { return index_; }
    const CorpusStore& corpus() const { return corpus_; }

private:
    void attach_topics(const DocumentRecord& doc, uint64_t revision, IngestResult& res);

    std::shared_ptr<Embedder> embedder_;
    std::shared_ptr<LlmService> llm_;
    std::shared_ptr<DocumentParser> parser_;

    CorpusStore corpus_;
    VectorIndexManager index_;
    RetrievalEngine retrieval_;
    AttributionScorer attribution_;
    RelatednessAggregator relatedness_;

    std::mutex corpus_mutex_;
};

std::string make_document_id(const std::string& filename, std::chrono::system_clock::time_point when);
