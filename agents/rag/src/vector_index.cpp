#include "../include/vector_index.hpp"
#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/store.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <stdexcept>

VectorIndex::VectorIndex(std::vector<ChunkPtr> chunks, std::chrono::system_clock::time_point built_at)
    : chunks_(std::move(chunks)), built_at_(built_at) {
    if (chunks_.empty()) throw std::invalid_argument("cannot build an index without vectors");
    for (size_t i = 0; i < chunks_.size(); ++i) {
        const auto* emb = chunks_[i]->cached_embedding();
        if (!emb || emb->empty()) {
            throw std::invalid_argument("chunk " + std::to_string(i) + " has no embedding");
        }
        if (i == 0) {
            dim_ = emb->size();
            rows_.reserve(dim_ * chunks_.size());
        } else if (emb->size() != dim_) {
            throw std::invalid_argument("embedding dimension mismatch: expected " + std::to_string(dim_) +
                                        ", got " + std::to_string(emb->size()));
        }
        std::vector<float> row = *emb;
        l2_normalize(row);
        rows_.insert(rows_.end(), row.begin(), row.end());
        by_fingerprint_.emplace(chunks_[i]->fingerprint(), i);
    }
}

std::vector<ScoredChunk> VectorIndex::search(const std::vector<float>& query, size_t k) const {
    if (query.size() != dim_) {
        throw RagError(ErrorCode::InvalidArgument, "query dimension " + std::to_string(query.size()) +
                                                   " does not match index dimension " + std::to_string(dim_));
    }
    std::vector<float> q = query;
    l2_normalize(q);

    std::vector<std::pair<float, size_t>> scored;
    scored.reserve(chunks_.size());
    for (size_t i = 0; i < chunks_.size(); ++i) {
        const float* row = rows_.data() + i * dim_;
        double dot = 0.0;
        for (size_t d = 0; d < dim_; ++d) dot += (double)row[d] * (double)q[d];
        scored.emplace_back((float)std::clamp(dot, -1.0, 1.0), i);
    }

    size_t n = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + n, scored.end(),
                      [](const std::pair<float, size_t>& a, const std::pair<float, size_t>& b) {
                          if (a.first != b.first) return a.first > b.first;
                          return a.second < b.second;
                      });
    std::vector<ScoredChunk> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back({chunks_[scored[i].second], scored[i].first});
    return out;
}

const std::vector<float>* VectorIndex::embedding_for(const std::string& fingerprint) const {
    auto it = by_fingerprint_.find(fingerprint);
    return it == by_fingerprint_.end() ? nullptr : chunks_[it->second]->cached_embedding();
}

VectorIndexManager::VectorIndexManager(std::shared_ptr<Embedder> embedder, IndexManagerOptions opts)
    : embedder_(std::move(embedder)), opts_(std::move(opts)) {
    if (!embedder_) throw std::invalid_argument("VectorIndexManager requires an embedder");
    if (opts_.oversample_factor == 0) opts_.oversample_factor = 1;
}

std::shared_ptr<const VectorIndex> VectorIndexManager::current() const {
    return std::atomic_load(&index_);
}

uint64_t VectorIndexManager::builds_run() const {
    std::lock_guard<std::mutex> lock(rebuild_mtx_);
    return builds_run_;
}

std::shared_ptr<const VectorIndex> VectorIndexManager::read_index_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("index file not found: " + path);
    }
    IndexStore store(path, IndexStore::Mode::ReadOnly);
    auto meta = store.read_meta();

    auto metric = meta.find("metric");
    if (metric == meta.end() || metric->second != "cosine") {
        throw std::runtime_error("index file has unsupported or missing metric: " + path);
    }
    size_t dim = 0;
    long long built_ms = 0;
    try {
        dim = std::stoul(meta.at("dimension"));
        if (meta.count("built_at")) built_ms = std::stoll(meta.at("built_at"));
    } catch (const std::exception&) {
        throw std::runtime_error("index file has malformed metadata: " + path);
    }

    auto rows = store.read_all();
    if (rows.empty()) return nullptr;

    std::vector<ChunkPtr> chunks;
    chunks.reserve(rows.size());
    for (auto& r : rows) {
        if (r.vector.size() != dim) {
            throw std::runtime_error("corrupt index file: vector at position " + std::to_string(r.position) +
                                     " has dimension " + std::to_string(r.vector.size()) +
                                     ", expected " + std::to_string(dim));
        }
        auto chunk = std::make_shared<Chunk>(std::move(r.content), std::move(r.meta), std::move(r.vector));
        if (!r.content_sha.empty() && chunk->fingerprint() != r.content_sha) {
            throw std::runtime_error("corrupt index file: content fingerprint mismatch at position " +
                                     std::to_string(r.position));
        }
        chunks.push_back(std::move(chunk));
    }
    return std::make_shared<const VectorIndex>(std::move(chunks), from_epoch_ms(built_ms));
}

bool VectorIndexManager::adopt_loaded(std::shared_ptr<const VectorIndex> index) {
    if (!index) return false;
    std::lock_guard<std::mutex> lock(rebuild_mtx_);
    if (requested_ > 0) {
        log_info("discarding loaded index: the corpus was rebuilt while it was loading");
        return false;
    }
    std::atomic_store(&index_, std::move(index));
    return true;
}

bool VectorIndexManager::load_or_empty() {
    std::shared_ptr<const VectorIndex> loaded;
    try {
        loaded = read_index_file(opts_.index_path);
    } catch (const std::exception& e) {
        log_warn(std::string("no usable persisted index, starting empty: ") + e.what());
        return false;
    }
    if (!loaded) {
        log_info("persisted index at " + opts_.index_path + " holds no vectors, starting empty");
        return false;
    }
    size_t n = loaded->size();
    if (!adopt_loaded(std::move(loaded))) return false;
    log_info("loaded index from " + opts_.index_path + " (" + std::to_string(n) + " vectors)");
    return true;
}

std::shared_ptr<const VectorIndex> VectorIndexManager::build(const std::vector<ChunkPtr>& chunks) const {
    if (chunks.empty()) return nullptr;
    auto previous = current();
    size_t reused = 0, embedded = 0;
    for (const auto& c : chunks) {
        if (c->has_embedding()) continue;
        if (previous) {
            if (const auto* emb = previous->embedding_for(c->fingerprint())) {
                c->adopt_embedding(*emb);
                ++reused;
                continue;
            }
        }
        c->embedding(*embedder_);
        ++embedded;
    }
    if (reused || embedded) {
        log_info("rebuild embedded " + std::to_string(embedded) + " chunks, reused " + std::to_string(reused));
    }
    return std::make_shared<const VectorIndex>(chunks);
}

uint64_t VectorIndexManager::request_rebuild(std::vector<ChunkPtr> chunks) {
    std::lock_guard<std::mutex> lock(rebuild_mtx_);
    pending_ = std::move(chunks);
    has_pending_ = true;
    return ++requested_;
}

void VectorIndexManager::drain_pending(std::unique_lock<std::mutex>& lock) {
    building_ = true;
    while (has_pending_) {
        std::vector<ChunkPtr> snapshot = std::move(pending_);
        pending_.clear();
        has_pending_ = false;
        uint64_t covers = requested_;
        ++builds_run_;
        lock.unlock();

        RebuildOutcome outcome;
        std::shared_ptr<const VectorIndex> built;
        try {
            built = build(snapshot);
            outcome.ok = true;
            outcome.vector_count = built ? built->size() : 0;
        } catch (const std::exception& e) {
            outcome.error = e.what();
            log_error(std::string("index rebuild failed, keeping previous index: ") + e.what());
        }

        lock.lock();
        if (outcome.ok) {
            std::atomic_store(&index_, built);
            if (built) {
                log_info("index rebuilt with " + std::to_string(built->size()) + " vectors");
            } else {
                log_info("corpus is empty, index cleared");
            }
        }
        completed_ = covers;
        last_outcome_ = outcome;
        rebuild_cv_.notify_all();
    }
    building_ = false;
    rebuild_cv_.notify_all();
}

RebuildOutcome VectorIndexManager::await_rebuild(uint64_t ticket) {
    std::unique_lock<std::mutex> lock(rebuild_mtx_);
    while (completed_ < ticket) {
        if (!building_) {
            drain_pending(lock);
        } else {
            rebuild_cv_.wait(lock);
        }
    }
    return last_outcome_;
}

RebuildOutcome VectorIndexManager::rebuild(std::vector<ChunkPtr> chunks) {
    return await_rebuild(request_rebuild(std::move(chunks)));
}

std::vector<ScoredChunk> VectorIndexManager::search(const std::vector<float>& query, size_t k,
                                                    const SearchScope& scope) const {
    auto index = current();
    if (!index) throw RagError(ErrorCode::IndexNotReady, "vector index is not ready");
    if (scope.is_all()) return index->search(query, k);

    // No per-document partitions: over-fetch from the whole index, then filter.
    // fetch = min(size, k * factor) without overflowing the product.
    size_t fetch = index->size();
    if (k <= fetch / opts_.oversample_factor) fetch = k * opts_.oversample_factor;
    auto candidates = index->search(query, fetch);
    std::vector<ScoredChunk> out;
    for (auto& sc : candidates) {
        if (out.size() >= k) break;
        if (sc.chunk->meta().document_id == *scope.document_id) out.push_back(std::move(sc));
    }
    return out;
}

IndexHealth VectorIndexManager::health() const {
    IndexHealth h;
    h.index_path = opts_.index_path;
    std::error_code ec;
    h.index_file_exists = std::filesystem::exists(opts_.index_path, ec);
    auto index = current();
    if (!index) {
        h.status = "empty";
        return h;
    }
    h.status = "ready";
    h.vector_count = index->size();
    h.dimension = index->dimension();
    h.is_trained = index->is_trained();
    h.last_rebuild_time = index->built_at();
    return h;
}

void VectorIndexManager::save() const {
    auto index = current();
    if (!index) throw RagError(ErrorCode::IndexNotReady, "no index to save");

    std::filesystem::path target(opts_.index_path);
    if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path());
    std::filesystem::path tmp = target;
    tmp += ".tmp";
    std::filesystem::remove(tmp);
    {
        IndexStore store(tmp.string(), IndexStore::Mode::ReadWrite);
        store.begin();
        store.reset();
        store.put_meta("dimension", std::to_string(index->dimension()));
        store.put_meta("metric", "cosine");
        store.put_meta("vector_count", std::to_string(index->size()));
        store.put_meta("built_at", std::to_string(to_epoch_ms(index->built_at())));
        int64_t pos = 0;
        for (const auto& c : index->chunks()) {
            store.append(pos++, *c, *c->cached_embedding());
        }
        store.commit();
    }
    std::filesystem::rename(tmp, target);
    log_info("saved index with " + std::to_string(index->size()) + " vectors to " + target.string());
}
