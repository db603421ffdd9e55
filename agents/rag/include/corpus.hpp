#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

class Embedder;

// (name, text) in document order. Names are unique.
using SectionList = std::vector<std::pair<std::string, std::string>>;

// nullptr when the section is absent.
const std::string* find_section(const SectionList& sections, const std::string& name);

struct ChunkMeta {
    std::string document_id;
    std::string section_name;
    int chunk_index{0};
};

// Content and metadata are fixed at construction. The embedding is computed at most once.
class Chunk {
public:
    Chunk(std::string content, ChunkMeta meta);
    Chunk(std::string content, ChunkMeta meta, std::vector<float> embedding);

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    const std::string& content() const { return content_; }
    const ChunkMeta& meta() const { return meta_; }
    const std::string& fingerprint() const { return fingerprint_; }

    bool has_embedding() const;
    // nullptr until an embedding has been cached.
    const std::vector<float>* cached_embedding() const;
    // Returns the cached embedding or computes it with the embedder on first use.
    const std::vector<float>& embedding(Embedder& embedder);
    // Ignored if an embedding is already cached.
    void adopt_embedding(std::vector<float> embedding);

private:
    const std::string content_;
    const ChunkMeta meta_;
    const std::string fingerprint_;
    mutable std::mutex mtx_;
    std::optional<std::vector<float>> embedding_;
};

using ChunkPtr = std::shared_ptr<Chunk>;

struct ScoredChunk {
    ChunkPtr chunk;
    float score{0.0f};
};

struct DocumentRecord {
    std::string document_id;
    std::vector<ChunkPtr> chunks;
    SectionList sections;
    std::set<std::string> topics;
    nlohmann::json metadata = nlohmann::json::object();
    std::string chunking_method;
    std::chrono::system_clock::time_point ingested_at{};
    uint64_t revision{0}; // assigned by CorpusStore::add
};

using DocumentPtr = std::shared_ptr<const DocumentRecord>;

class CorpusStore {
public:
    // Insert or replace (last write wins). A replaced id keeps its insertion slot.
    // Returns the revision assigned to the stored record.
    uint64_t add(DocumentRecord doc);
    bool remove(const std::string& document_id);

    // Every chunk in document-insertion order, chunk order preserved.
    std::vector<ChunkPtr> all_chunks() const;

    // Throws RagError(NotFound).
    DocumentPtr get(const std::string& document_id) const;
    DocumentPtr find(const std::string& document_id) const;
    bool contains(const std::string& document_id) const;

    // Applies only while the stored record still has the given revision.
    bool set_topics(const std::string& document_id, uint64_t revision, std::set<std::string> topics);

    std::vector<DocumentPtr> documents() const;
    std::vector<std::string> ids() const;
    size_t size() const;

private:
    mutable std::shared_mutex mtx_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, DocumentPtr> docs_;
    uint64_t next_revision_{1};
};
