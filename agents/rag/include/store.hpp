#pragma once
#include "corpus.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct StoredVector {
    int64_t position{0};
    ChunkMeta meta;
    std::string content;
    std::string content_sha;
    std::vector<float> vector;
};

// SQLite file holding one persisted vector index.
class IndexStore {
public:
    enum class Mode { ReadOnly, ReadWrite };

    IndexStore(const std::string& db_path, Mode mode);
    ~IndexStore();

    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;

    void begin();
    void commit();
    void reset();

    void put_meta(const std::string& key, const std::string& value);
    void append(int64_t position, const Chunk& chunk, const std::vector<float>& vector);

    std::map<std::string, std::string> read_meta();
    std::vector<StoredVector> read_all();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* meta_stmt_ {nullptr};
    struct sqlite3_stmt* all_stmt_ {nullptr};
    struct sqlite3_stmt* all_meta_stmt_ {nullptr};
};
