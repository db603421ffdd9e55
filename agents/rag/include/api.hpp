#pragma once
#include "rag.hpp"
#include "errors.hpp"
#include "startup.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

int http_status_for(ErrorCode code);

nlohmann::json to_json(const ScoredChunk& sc);
nlohmann::json to_json(const IndexHealth& h);
nlohmann::json to_json(const StartupState& s);

// Maps JSON requests onto RagService. Independent of the HTTP server library.
class RagApi {
public:
    RagApi(RagService& service, const StartupOrchestrator& startup);
    ApiResponse handle(const ApiRequest& req);

private:
    nlohmann::json dispatch(const ApiRequest& req, int& status);

    RagService& service_;
    const StartupOrchestrator& startup_;
};
