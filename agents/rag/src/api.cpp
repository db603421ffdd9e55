#include "../include/api.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return 404;
        case ErrorCode::IndexNotReady: return 503;
        case ErrorCode::EmptyQuery:
        case ErrorCode::EmptyCorpus:
        case ErrorCode::InvalidArgument:
        case ErrorCode::NoValidDocuments: return 400;
        case ErrorCode::EmbeddingServiceError:
        case ErrorCode::GenerationServiceError: return 502;
        case ErrorCode::RebuildFailed: return 500;
    }
    return 500;
}

static json meta_json(const ChunkMeta& m) {
    return json{{"document_id", m.document_id}, {"section", m.section_name}, {"chunk_index", m.chunk_index}};
}

json to_json(const ScoredChunk& sc) {
    return json{{"content", sc.chunk->content()}, {"metadata", meta_json(sc.chunk->meta())}, {"score", sc.score}};
}

json to_json(const IndexHealth& h) {
    json j = {
        {"status", h.status},
        {"vector_count", h.vector_count},
        {"dimension", h.dimension},
        {"is_trained", h.is_trained},
        {"index_path", h.index_path},
        {"index_file_exists", h.index_file_exists},
        {"last_rebuild_time", nullptr}
    };
    if (h.last_rebuild_time) j["last_rebuild_time"] = format_iso8601(*h.last_rebuild_time);
    return j;
}

json to_json(const StartupState& s) {
    return json{
        {"phase", startup_phase_name(s.phase)},
        {"index_ready", s.index_ready},
        {"search_subsystem_ready", s.search_subsystem_ready},
        {"init_in_progress", s.init_in_progress}
    };
}

static json scored_array(const std::vector<ScoredChunk>& v) {
    json arr = json::array();
    for (const auto& sc : v) arr.push_back(to_json(sc));
    return arr;
}

static SearchScope scope_from(const json& j) {
    auto id = j.value("document_id", std::string());
    return id.empty() ? SearchScope::all() : SearchScope::document(id);
}

static size_t k_from(const json& j, size_t def) {
    if (!j.contains("k")) return def;
    long long k = j.at("k").get<long long>();
    if (k < 1) throw RagError(ErrorCode::InvalidArgument, "k must be at least 1");
    return (size_t)k;
}

static std::string required_string(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        throw RagError(ErrorCode::InvalidArgument, std::string(key) + " is required");
    }
    return j.at(key).get<std::string>();
}

static size_t query_size(const std::map<std::string, std::string>& q, const char* key, size_t def) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return def;
    try {
        long long v = std::stoll(it->second);
        if (v < 0) throw std::out_of_range(key);
        return (size_t)v;
    } catch (const std::exception&) {
        throw RagError(ErrorCode::InvalidArgument, std::string("invalid ") + key);
    }
}

static bool strip_prefix(const std::string& path, const std::string& prefix, std::string& rest) {
    if (path.rfind(prefix, 0) != 0 || path.size() == prefix.size()) return false;
    rest = path.substr(prefix.size());
    return true;
}

RagApi::RagApi(RagService& service, const StartupOrchestrator& startup) : service_(service), startup_(startup) {}

ApiResponse RagApi::handle(const ApiRequest& req) {
    ApiResponse resp;
    try {
        int status = 200;
        resp.body = dispatch(req, status).dump();
        resp.status = status;
    } catch (const RagError& e) {
        resp.status = http_status_for(e.code());
        if (resp.status >= 500) log_error(req.method + " " + req.path + ": " + e.what());
        resp.body = json({{"error", e.what()}, {"code", error_code_name(e.code())}}).dump();
    } catch (const json::exception& e) {
        resp.status = 400;
        resp.body = json({{"error", std::string("invalid request body: ") + e.what()}}).dump();
    } catch (const std::exception& e) {
        resp.status = 500;
        log_error(req.method + " " + req.path + ": " + e.what());
        resp.body = json({{"error", e.what()}}).dump();
    }
    return resp;
}

json RagApi::dispatch(const ApiRequest& req, int& status) {
    const std::string& m = req.method;
    const std::string& path = req.path;
    json body = req.body.empty() ? json::object() : json::parse(req.body);
    std::string id;

    if (m == "GET" && (path == "/" || path == "/healthz")) {
        auto health = service_.index_health();
        return json{
            {"status", "ok"},
            {"timestamp", format_iso8601(std::chrono::system_clock::now())},
            {"startup_state", to_json(startup_.state())},
            {"index_ready", health.status == "ready"},
            {"documents", service_.list_documents().size()}
        };
    }
    if (m == "GET" && path == "/index/health") {
        return to_json(service_.index_health());
    }
    if (m == "POST" && path == "/index/save") {
        service_.save_index();
        return json{{"ok", true}, {"index_path", service_.index_health().index_path}};
    }
    if (m == "POST" && path == "/ingest") {
        std::vector<RawChunk> chunks;
        for (const auto& c : body.at("chunks")) {
            if (c.is_string()) {
                chunks.push_back({c.get<std::string>(), std::string()});
            } else {
                chunks.push_back({c.at("content").get<std::string>(), c.value("section", std::string())});
            }
        }
        DocInfo info;
        const json& di = body.contains("doc_info") ? body.at("doc_info") : json::object();
        if (di.contains("sections")) {
            // Re-read with insertion order kept; json objects sort their keys.
            auto ordered = nlohmann::ordered_json::parse(req.body).at("doc_info").at("sections");
            for (const auto& item : ordered.items()) {
                info.sections.emplace_back(item.key(), item.value().get<std::string>());
            }
        }
        if (di.contains("metadata")) info.metadata = di.at("metadata");
        info.chunking_method = di.value("chunking_method", std::string());
        auto res = service_.ingest(required_string(body, "document_id"), std::move(chunks), std::move(info));
        json out = {
            {"document_id", res.document_id},
            {"chunk_count", res.chunk_count},
            {"topics", res.topics},
            {"index_updated", res.index_updated}
        };
        if (!res.warning.empty()) out["warning"] = res.warning;
        return out;
    }
    if (m == "POST" && path == "/ingest/file") {
        auto res = service_.ingest_file(required_string(body, "path"));
        json out = {
            {"document_id", res.document_id},
            {"chunk_count", res.chunk_count},
            {"topics", res.topics},
            {"index_updated", res.index_updated}
        };
        if (!res.warning.empty()) out["warning"] = res.warning;
        return out;
    }
    if (m == "GET" && path == "/documents") {
        return json{{"documents", service_.list_documents()}};
    }
    if (strip_prefix(path, "/documents/", id)) {
        const std::string suffix = "/chunks";
        if (m == "GET" && id.size() > suffix.size() &&
            id.compare(id.size() - suffix.size(), suffix.size(), suffix) == 0) {
            id = id.substr(0, id.size() - suffix.size());
            size_t start = query_size(req.query, "start", 0);
            size_t limit = query_size(req.query, "limit", 5);
            json arr = json::array();
            for (const auto& c : service_.chunks(id, start, limit)) {
                arr.push_back({
                    {"content", c->content()},
                    {"metadata", meta_json(c->meta())},
                    {"length", c->content().size()}
                });
            }
            return json{{"document_id", id}, {"total_chunks", service_.document_info(id).total_chunks},
                        {"start", start}, {"chunks", arr}};
        }
        if (m == "GET") {
            auto info = service_.document_info(id);
            return json{
                {"document_id", info.document_id},
                {"metadata", info.metadata},
                {"sections", info.sections},
                {"topics", info.topics},
                {"total_chunks", info.total_chunks},
                {"chunking_method", info.chunking_method},
                {"ingested_at", format_iso8601(info.ingested_at)}
            };
        }
        if (m == "DELETE") {
            auto res = service_.remove(id);
            json out = {{"ok", true}, {"index_updated", res.index_updated}};
            if (!res.warning.empty()) out["warning"] = res.warning;
            return out;
        }
    }
    if (m == "POST" && path == "/query") {
        auto results = service_.query(required_string(body, "query"), scope_from(body), k_from(body, 5));
        return json{{"results", scored_array(results)}};
    }
    if (m == "POST" && path == "/query/answer") {
        auto res = service_.query_with_answer(required_string(body, "query"), scope_from(body),
                                              k_from(body, RetrievalEngine::kDefaultAnswerK));
        json citations = json::array();
        for (const auto& c : res.citations) {
            citations.push_back({{"index", c.index}, {"document_id", c.document_id},
                                 {"section", c.section_name}, {"chunk_index", c.chunk_index}});
        }
        return json{{"answer", res.answer}, {"answered", res.answered},
                    {"sources", scored_array(res.sources)}, {"citations", citations}};
    }
    if (m == "POST" && path == "/attribution") {
        auto res = service_.attribution(required_string(body, "document_id"), required_string(body, "sentence"));
        return json{{"source_chunks", scored_array(res.sources)}, {"confidence", res.confidence}};
    }
    if (m == "GET" && strip_prefix(path, "/related/", id)) {
        json arr = json::array();
        for (const auto& r : service_.related(id)) {
            arr.push_back({{"document_id", r.document_id}, {"title", r.title},
                           {"common_topics", r.common_topics}, {"similarity_score", r.score}});
        }
        return json{{"related", arr}};
    }
    if (m == "POST" && path == "/synthesis/input") {
        json arr = json::array();
        for (const auto& p : service_.synthesis_input(body.at("document_ids").get<std::vector<std::string>>())) {
            arr.push_back(to_json(p));
        }
        return json{{"papers", arr}};
    }
    if (m == "POST" && path == "/synthesize") {
        return service_.synthesize(body.at("document_ids").get<std::vector<std::string>>(),
                                   body.value("synthesis_type", std::string("comparison")));
    }
    if (m == "POST" && path == "/summarize") {
        auto audience = body.value("audience_type", std::string("clinician"));
        auto summary = service_.summarize(required_string(body, "document_id"), audience);
        return json{{"message", summary}, {"audience", audience}};
    }
    if (m == "POST" && path == "/explain") {
        return service_.explain_text(required_string(body, "document_id"), required_string(body, "selected_text"),
                                     body.value("context", std::string()), body.value("question", std::string()),
                                     body.value("audience_type", std::string("patient")));
    }
    status = 404;
    return json{{"error", "not found"}};
}
