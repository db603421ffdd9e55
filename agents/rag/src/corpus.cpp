#include "../include/corpus.hpp"
#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>

const std::string* find_section(const SectionList& sections, const std::string& name) {
    for (const auto& s : sections) {
        if (s.first == name) return &s.second;
    }
    return nullptr;
}

Chunk::Chunk(std::string content, ChunkMeta meta)
    : content_(std::move(content)), meta_(std::move(meta)), fingerprint_(sha1_hex(content_)) {}

Chunk::Chunk(std::string content, ChunkMeta meta, std::vector<float> embedding)
    : content_(std::move(content)), meta_(std::move(meta)), fingerprint_(sha1_hex(content_)),
      embedding_(std::move(embedding)) {}

bool Chunk::has_embedding() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return embedding_.has_value();
}

const std::vector<float>* Chunk::cached_embedding() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return embedding_ ? &*embedding_ : nullptr;
}

const std::vector<float>& Chunk::embedding(Embedder& embedder) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!embedding_) {
        embedding_ = embedder.embed(content_);
    }
    return *embedding_;
}

void Chunk::adopt_embedding(std::vector<float> embedding) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!embedding_) embedding_ = std::move(embedding);
}

uint64_t CorpusStore::add(DocumentRecord doc) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    doc.revision = next_revision_++;
    uint64_t rev = doc.revision;
    std::string id = doc.document_id;
    auto it = docs_.find(id);
    auto ptr = std::make_shared<const DocumentRecord>(std::move(doc));
    if (it == docs_.end()) {
        order_.push_back(id);
        docs_.emplace(id, std::move(ptr));
    } else {
        it->second = std::move(ptr);
    }
    return rev;
}

bool CorpusStore::remove(const std::string& document_id) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    if (docs_.erase(document_id) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), document_id), order_.end());
    return true;
}

std::vector<ChunkPtr> CorpusStore::all_chunks() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<ChunkPtr> out;
    for (const auto& id : order_) {
        const auto& doc = docs_.at(id);
        out.insert(out.end(), doc->chunks.begin(), doc->chunks.end());
    }
    return out;
}

DocumentPtr CorpusStore::get(const std::string& document_id) const {
    auto doc = find(document_id);
    if (!doc) throw RagError(ErrorCode::NotFound, "document not found: " + document_id);
    return doc;
}

DocumentPtr CorpusStore::find(const std::string& document_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = docs_.find(document_id);
    return it == docs_.end() ? nullptr : it->second;
}

bool CorpusStore::contains(const std::string& document_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return docs_.count(document_id) > 0;
}

bool CorpusStore::set_topics(const std::string& document_id, uint64_t revision, std::set<std::string> topics) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    auto it = docs_.find(document_id);
    if (it == docs_.end() || it->second->revision != revision) return false;
    auto updated = std::make_shared<DocumentRecord>(*it->second);
    updated->topics = std::move(topics);
    it->second = std::move(updated);
    return true;
}

std::vector<DocumentPtr> CorpusStore::documents() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<DocumentPtr> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(docs_.at(id));
    return out;
}

std::vector<std::string> CorpusStore::ids() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return order_;
}

size_t CorpusStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return order_.size();
}
