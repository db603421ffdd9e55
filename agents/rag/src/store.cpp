#include "../include/store.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <cstring>

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? reinterpret_cast<const char*>(t) : std::string();
}

IndexStore::IndexStore(const std::string& db_path, Mode mode) {
    int flags = mode == Mode::ReadOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) { sqlite3_close(db_); db_ = nullptr; }
        throw std::runtime_error("Failed to open index file " + db_path + ": " + msg);
    }
    try {
        if (mode == Mode::ReadWrite) init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

IndexStore::~IndexStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void IndexStore::init() {
    exec("CREATE TABLE IF NOT EXISTS index_meta (\n"
         "  key TEXT PRIMARY KEY,\n"
         "  value TEXT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS index_vectors (\n"
         "  position INTEGER PRIMARY KEY,\n"
         "  document_id TEXT,\n"
         "  section_name TEXT,\n"
         "  chunk_index INTEGER,\n"
         "  content TEXT,\n"
         "  content_sha TEXT,\n"
         "  vector BLOB\n"
         ");");
}

void IndexStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void IndexStore::prepare_statements() {
    const char* ins = "INSERT OR REPLACE INTO index_vectors \n"
                      "(position, document_id, section_name, chunk_index, content, content_sha, vector) \n"
                      "VALUES (?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare insert failed: ") + sqlite3_errmsg(db_));
    }
    const char* meta = "INSERT OR REPLACE INTO index_meta (key, value) VALUES (?, ?);";
    if (sqlite3_prepare_v2(db_, meta, -1, &meta_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare meta failed: ") + sqlite3_errmsg(db_));
    }
    const char* all = "SELECT position, document_id, section_name, chunk_index, content, content_sha, vector "
                      "FROM index_vectors ORDER BY position;";
    if (sqlite3_prepare_v2(db_, all, -1, &all_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare select failed: ") + sqlite3_errmsg(db_));
    }
    const char* all_meta = "SELECT key, value FROM index_meta;";
    if (sqlite3_prepare_v2(db_, all_meta, -1, &all_meta_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare meta select failed: ") + sqlite3_errmsg(db_));
    }
}

void IndexStore::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (meta_stmt_) { sqlite3_finalize(meta_stmt_); meta_stmt_ = nullptr; }
    if (all_stmt_) { sqlite3_finalize(all_stmt_); all_stmt_ = nullptr; }
    if (all_meta_stmt_) { sqlite3_finalize(all_meta_stmt_); all_meta_stmt_ = nullptr; }
}

void IndexStore::begin() { exec("BEGIN IMMEDIATE;"); }

void IndexStore::commit() { exec("COMMIT;"); }

void IndexStore::reset() {
    exec("DELETE FROM index_vectors;");
    exec("DELETE FROM index_meta;");
}

void IndexStore::put_meta(const std::string& key, const std::string& value) {
    sqlite3_reset(meta_stmt_);
    sqlite3_clear_bindings(meta_stmt_);
    bind_text(meta_stmt_, 1, key);
    bind_text(meta_stmt_, 2, value);
    if (sqlite3_step(meta_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("insert meta failed: " + key);
    }
}

void IndexStore::append(int64_t position, const Chunk& chunk, const std::vector<float>& vector) {
    const auto& m = chunk.meta();
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_int64(insert_stmt_, 1, position);
    bind_text(insert_stmt_, 2, m.document_id);
    bind_text(insert_stmt_, 3, m.section_name);
    sqlite3_bind_int(insert_stmt_, 4, m.chunk_index);
    bind_text(insert_stmt_, 5, chunk.content());
    bind_text(insert_stmt_, 6, chunk.fingerprint());
    bind_blob(insert_stmt_, 7, vector);
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("insert vector failed at position " + std::to_string(position));
    }
}

std::map<std::string, std::string> IndexStore::read_meta() {
    std::map<std::string, std::string> out;
    sqlite3_reset(all_meta_stmt_);
    int rc;
    while ((rc = sqlite3_step(all_meta_stmt_)) == SQLITE_ROW) {
        out[column_text(all_meta_stmt_, 0)] = column_text(all_meta_stmt_, 1);
    }
    sqlite3_reset(all_meta_stmt_);
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("read meta failed: ") + sqlite3_errmsg(db_));
    return out;
}

std::vector<StoredVector> IndexStore::read_all() {
    std::vector<StoredVector> out;
    sqlite3_reset(all_stmt_);
    int rc;
    while ((rc = sqlite3_step(all_stmt_)) == SQLITE_ROW) {
        StoredVector v;
        v.position = sqlite3_column_int64(all_stmt_, 0);
        v.meta.document_id = column_text(all_stmt_, 1);
        v.meta.section_name = column_text(all_stmt_, 2);
        v.meta.chunk_index = sqlite3_column_int(all_stmt_, 3);
        v.content = column_text(all_stmt_, 4);
        v.content_sha = column_text(all_stmt_, 5);
        const void* blob = sqlite3_column_blob(all_stmt_, 6);
        int bytes = sqlite3_column_bytes(all_stmt_, 6);
        if (bytes % (int)sizeof(float) != 0) {
            sqlite3_reset(all_stmt_);
            throw std::runtime_error("corrupt vector blob at position " + std::to_string(v.position));
        }
        v.vector.resize(bytes / sizeof(float));
        if (bytes > 0) std::memcpy(v.vector.data(), blob, bytes);
        out.push_back(std::move(v));
    }
    sqlite3_reset(all_stmt_);
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("read vectors failed: ") + sqlite3_errmsg(db_));
    return out;
}
