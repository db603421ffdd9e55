#include "../include/api.hpp"
#include "../include/config.hpp"
#include "../include/log.hpp"
#include "../include/rag.hpp"
#include "../include/search_subsystem.hpp"
#include "../include/startup.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <microhttpd.h>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static std::atomic<bool> g_stop{false};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    auto* api = static_cast<RagApi*>(cls);
    ApiRequest req{ci->method, ci->url, parse_query(connection), ci->body};
    ApiResponse resp = api->handle(req);
    return send_response(connection, resp.status, resp.body, resp.content_type.c_str());
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "rag_server usage:\n"
              << "  rag_server [--port N] [--index <file>] [--ollama <url>] [--embed-model <name>] [--llm <name>]\n";
}

int main(int argc, char** argv) {
    ServiceConfig cfg = load_config_from_env();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try { cfg.port = std::stoi(argv[++i]); } catch (const std::exception&) { usage(); return 2; }
        }
        else if (a == "--index" && i + 1 < argc) cfg.index.index_path = argv[++i];
        else if (a == "--ollama" && i + 1 < argc) { cfg.embed.ollama_url = argv[++i]; cfg.llm.ollama_url = cfg.embed.ollama_url; }
        else if (a == "--embed-model" && i + 1 < argc) cfg.embed.embed_model = argv[++i];
        else if (a == "--llm" && i + 1 < argc) cfg.llm.llm_model = argv[++i];
        else { usage(); return 2; }
    }

    auto embedder = std::make_shared<OllamaEmbedder>(cfg.embed);
    auto llm = std::make_shared<OllamaLlm>(cfg.llm);
    auto parser = std::make_shared<TextDocumentParser>();
    RagService service(embedder, llm, parser, cfg.index);
    StartupOrchestrator startup(service.index(), std::make_shared<OllamaWarmup>(cfg.embed, embedder), cfg.startup);
    RagApi api(service, startup);

    log_info("Starting HTTP server on port " + std::to_string(cfg.port) + "...");
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_THREAD_PER_CONNECTION,
                                            (uint16_t)cfg.port, nullptr, nullptr, &handler, &api,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        log_error("Failed to start HTTP server");
        return 1;
    }

    // Serve health while the index loads and the embedding model warms up.
    startup.start();

    std::signal(SIGINT, [](int){ g_stop = true; });
    std::signal(SIGTERM, [](int){ g_stop = true; });
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    log_info("Shutting down");
    MHD_stop_daemon(d);
    return 0;
}
