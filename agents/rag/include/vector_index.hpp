#pragma once
#include "corpus.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class Embedder;

struct SearchScope {
    std::optional<std::string> document_id; // empty means every document

    static SearchScope all() { return {}; }
    static SearchScope document(std::string id) {
        SearchScope s;
        s.document_id = std::move(id);
        return s;
    }
    bool is_all() const { return !document_id; }
};

// Exact nearest-neighbour index. Rows are L2-normalised at construction, so the
// inner product used for ranking is cosine similarity in [-1, 1]. Immutable once built.
class VectorIndex {
public:
    // Every chunk must already carry an embedding of one common dimension.
    // Throws std::invalid_argument otherwise, or when chunks is empty.
    explicit VectorIndex(std::vector<ChunkPtr> chunks,
                         std::chrono::system_clock::time_point built_at = std::chrono::system_clock::now());

    // Best first; equal scores keep insertion order.
    std::vector<ScoredChunk> search(const std::vector<float>& query, size_t k) const;

    size_t size() const { return chunks_.size(); }
    size_t dimension() const { return dim_; }
    bool is_trained() const { return !chunks_.empty(); }
    const std::vector<ChunkPtr>& chunks() const { return chunks_; }
    std::chrono::system_clock::time_point built_at() const { return built_at_; }

    // Embedding of an indexed chunk with this content fingerprint, or nullptr.
    const std::vector<float>* embedding_for(const std::string& fingerprint) const;

private:
    std::vector<ChunkPtr> chunks_;
    size_t dim_{0};
    std::vector<float> rows_;
    std::unordered_map<std::string, size_t> by_fingerprint_;
    std::chrono::system_clock::time_point built_at_;
};

struct IndexManagerOptions {
    std::string index_path{"./data/rag_index.db"};
    size_t oversample_factor{4};
};

struct IndexHealth {
    std::string status; // "ready" or "empty"
    size_t vector_count{0};
    size_t dimension{0};
    bool is_trained{false};
    std::string index_path;
    bool index_file_exists{false};
    std::optional<std::chrono::system_clock::time_point> last_rebuild_time;
};

struct RebuildOutcome {
    bool ok{false};
    size_t vector_count{0};
    std::string error;
};

class VectorIndexManager {
public:
    VectorIndexManager(std::shared_ptr<Embedder> embedder, IndexManagerOptions opts);

    VectorIndexManager(const VectorIndexManager&) = delete;
    VectorIndexManager& operator=(const VectorIndexManager&) = delete;

    // Reads the persisted index and installs it. Missing or corrupt files are
    // logged and leave the manager empty. Returns whether an index was installed.
    bool load_or_empty();

    // Throws std::runtime_error if the file is missing or corrupt.
    // Returns nullptr for a well-formed file without vectors.
    static std::shared_ptr<const VectorIndex> read_index_file(const std::string& path);
    // Installs a loaded index unless a rebuild has been requested since construction.
    bool adopt_loaded(std::shared_ptr<const VectorIndex> index);

    // Blocking. Concurrent requests are coalesced: one build runs at a time and
    // a finished build serves every request submitted before it took its snapshot.
    RebuildOutcome rebuild(std::vector<ChunkPtr> chunks);
    // Split form of rebuild() so callers can submit under their own lock and wait outside it.
    uint64_t request_rebuild(std::vector<ChunkPtr> chunks);
    RebuildOutcome await_rebuild(uint64_t ticket);

    // Throws RagError(IndexNotReady) when no index is live.
    std::vector<ScoredChunk> search(const std::vector<float>& query, size_t k, const SearchScope& scope) const;

    IndexHealth health() const;
    // Throws RagError(IndexNotReady) when no index is live.
    void save() const;

    std::shared_ptr<const VectorIndex> current() const;
    bool ready() const { return current() != nullptr; }
    const IndexManagerOptions& options() const { return opts_; }
    uint64_t builds_run() const;

private:
    std::shared_ptr<const VectorIndex> build(const std::vector<ChunkPtr>& chunks) const;
    void drain_pending(std::unique_lock<std::mutex>& lock);

    std::shared_ptr<Embedder> embedder_;
    IndexManagerOptions opts_;
    std::shared_ptr<const VectorIndex> index_; // accessed through std::atomic_load/atomic_store

    mutable std::mutex rebuild_mtx_;
    std::condition_variable rebuild_cv_;
    bool building_{false};
    bool has_pending_{false};
    std::vector<ChunkPtr> pending_;
    uint64_t requested_{0};
    uint64_t completed_{0};
    uint64_t builds_run_{0};
    RebuildOutcome last_outcome_;
};
