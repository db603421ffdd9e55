#include "../include/rag.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"

std::string make_document_id(const std::string& filename, std::chrono::system_clock::time_point when) {
    return format_compact_timestamp(when) + "_" + filename;
}

RagService::RagService(std::shared_ptr<Embedder> embedder, std::shared_ptr<LlmService> llm,
                       std::shared_ptr<DocumentParser> parser, IndexManagerOptions index_opts)
    : embedder_(std::move(embedder)),
      llm_(std::move(llm)),
      parser_(std::move(parser)),
      index_(embedder_, std::move(index_opts)),
      retrieval_(embedder_, index_, llm_),
      attribution_(embedder_, corpus_),
      relatedness_(corpus_) {}

IngestResult RagService::ingest(const std::string& document_id, std::vector<RawChunk> chunks_raw, DocInfo doc_info) {
    if (is_blank(document_id)) throw RagError(ErrorCode::InvalidArgument, "document_id is required");

    DocumentRecord doc;
    doc.document_id = document_id;
    doc.sections = std::move(doc_info.sections);
    doc.metadata = doc_info.metadata.is_object() ? std::move(doc_info.metadata) : nlohmann::json::object();
    doc.chunking_method = doc_info.chunking_method.empty() ? "unknown" : std::move(doc_info.chunking_method);
    doc.ingested_at = std::chrono::system_clock::now();
    for (auto& raw : chunks_raw) {
        if (is_blank(raw.content)) continue;
        ChunkMeta meta{document_id, raw.section_name, (int)doc.chunks.size()};
        doc.chunks.push_back(std::make_shared<Chunk>(std::move(raw.content), std::move(meta)));
    }
    if (doc.chunks.empty()) {
        throw RagError(ErrorCode::InvalidArgument, "could not extract any content from " + document_id);
    }

    IngestResult res;
    res.document_id = document_id;
    res.chunk_count = doc.chunks.size();
    auto snapshot_doc = doc;

    uint64_t revision = 0, ticket = 0;
    {
        std::lock_guard<std::mutex> lock(corpus_mutex_);
        revision = corpus_.add(std::move(doc));
        ticket = index_.request_rebuild(corpus_.all_chunks());
    }
    log_info("ingested " + document_id + " (" + std::to_string(res.chunk_count) + " chunks), updating index");

    auto outcome = index_.await_rebuild(ticket);
    res.index_updated = outcome.ok;
    if (!outcome.ok) {
        res.warning = "document stored, but the index update failed: " + outcome.error;
    }

    attach_topics(snapshot_doc, revision, res);
    return res;
}

void RagService::attach_topics(const DocumentRecord& doc, uint64_t revision, IngestResult& res) {
    std::string text;
    for (size_t i = 0; i < doc.chunks.size() && i < kTopicChunks; ++i) {
        if (i) text += '\n';
        text += doc.chunks[i]->content();
    }
    try {
        auto topics = llm_->extract_key_topics(text);
        if (corpus_.set_topics(doc.document_id, revision, topics)) {
            res.topics = std::move(topics);
        } else {
            log_info("topics for " + doc.document_id + " dropped: the document changed meanwhile");
        }
    } catch (const std::exception& e) {
        log_warn("topic extraction failed for " + doc.document_id + ": " + e.what());
        if (res.warning.empty()) res.warning = std::string("topic extraction failed: ") + e.what();
    }
}

IngestResult RagService::ingest_file(const std::filesystem::path& path) {
    if (!parser_) throw RagError(ErrorCode::InvalidArgument, "no document parser configured");
    ParsedDocument parsed;
    try {
        parsed = parser_->parse(path);
    } catch (const RagError&) {
        throw;
    } catch (const std::exception& e) {
        throw RagError(ErrorCode::InvalidArgument, "could not parse " + path.string() + ": " + e.what());
    }
    auto id = make_document_id(path.filename().string(), std::chrono::system_clock::now());
    return ingest(id, std::move(parsed.chunks), std::move(parsed.info));
}

DeleteResult RagService::remove(const std::string& document_id) {
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(corpus_mutex_);
        if (!corpus_.remove(document_id)) {
            throw RagError(ErrorCode::NotFound, "document not found: " + document_id);
        }
        ticket = index_.request_rebuild(corpus_.all_chunks());
    }
    log_info("removed " + document_id + ", updating index");

    DeleteResult res;
    auto outcome = index_.await_rebuild(ticket);
    res.index_updated = outcome.ok;
    if (!outcome.ok) res.warning = "document removed, but the index update failed: " + outcome.error;
    return res;
}

std::vector<ScoredChunk> RagService::query(const std::string& text, const SearchScope& scope, size_t k) {
    return retrieval_.query(text, scope, k);
}

QueryAnswer RagService::query_with_answer(const std::string& text, const SearchScope& scope, size_t k) {
    return retrieval_.query_with_answer(text, scope, k);
}

Attribution RagService::attribution(const std::string& document_id, const std::string& sentence) {
    return attribution_.attribute(document_id, sentence);
}

std::vector<RelatedDocument> RagService::related(const std::string& document_id) {
    return relatedness_.related(document_id);
}

std::vector<PaperDigest> RagService::synthesis_input(const std::vector<std::string>& document_ids) {
    return relatedness_.synthesis_input(document_ids);
}

nlohmann::json RagService::synthesize(const std::vector<std::string>& document_ids, const std::string& synthesis_type) {
    auto papers = relatedness_.synthesis_input(document_ids);
    log_info("synthesizing " + std::to_string(papers.size()) + " papers (" + synthesis_type + ")");
    return llm_->synthesize_papers(papers, synthesis_type);
}

std::string RagService::summarize(const std::string& document_id, const std::string& audience) {
    auto doc = corpus_.get(document_id);
    if (doc->chunks.empty()) throw RagError(ErrorCode::EmptyCorpus, "no content available for " + document_id);

    std::string text;
    for (const auto& c : doc->chunks) {
        if (!text.empty()) text += '\n';
        text += c->content();
    }
    auto res = llm_->generate_summary(text, audience, doc->sections);
    if (!res.ok) {
        log_error("summarization failed for " + document_id + ": " + res.error);
        throw RagError(ErrorCode::GenerationServiceError, "summarization failed: " + res.error);
    }
    return res.summary;
}

nlohmann::json RagService::explain_text(const std::string& document_id, const std::string& selected_text,
                                        const std::string& context, const std::string& question,
                                        const std::string& audience) {
    if (!corpus_.contains(document_id)) throw RagError(ErrorCode::NotFound, "document not found: " + document_id);
    if (is_blank(selected_text)) throw RagError(ErrorCode::EmptyQuery, "selected text is empty");
    return llm_->explain_text(selected_text, context, question, audience);
}

DocumentInfo RagService::document_info(const std::string& document_id) const {
    auto doc = corpus_.get(document_id);
    DocumentInfo info;
    info.document_id = doc->document_id;
    info.metadata = doc->metadata;
    for (const auto& kv : doc->sections) info.sections.push_back(kv.first);
    info.topics = doc->topics;
    info.total_chunks = doc->chunks.size();
    info.chunking_method = doc->chunking_method;
    info.ingested_at = doc->ingested_at;
    return info;
}

std::vector<std::string> RagService::list_documents() const {
    return corpus_.ids();
}

std::vector<ChunkPtr> RagService::chunks(const std::string& document_id, size_t start, size_t limit) const {
    auto doc = corpus_.get(document_id);
    std::vector<ChunkPtr> out;
    for (size_t i = start; i < doc->chunks.size() && out.size() < limit; ++i) out.push_back(doc->chunks[i]);
    return out;
}

IndexHealth RagService::index_health() const {
    return index_.health();
}

void RagService::save_index() const {
    index_.save();
}
