#include "../include/llm.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <regex>

using json = nlohmann::json;

static const size_t kMaxPromptChars = 12000;

static std::string audience_guidance(const std::string& audience) {
    if (audience == "patient") {
        return "Write for a patient with no medical training. Avoid jargon and explain any term you must use.";
    }
    if (audience == "researcher") {
        return "Write for a researcher. Be precise about methods, sample sizes, statistics and limitations.";
    }
    return "Write for a practising clinician. Focus on clinical relevance, outcomes and practical implications.";
}

static std::string synthesis_instruction(const std::string& type) {
    if (type == "evolution") return "Describe how the findings and approaches evolved over time across the papers.";
    if (type == "consensus") return "Identify where the papers agree, where they disagree, and the overall consensus.";
    if (type == "methods") return "Compare the methodologies used, their strengths and weaknesses.";
    return "Compare and contrast the papers' findings, methods and conclusions.";
}

json to_json(const PaperDigest& p) {
    return json{
        {"document_id", p.document_id},
        {"title", p.title},
        {"year", p.year},
        {"topics", p.topics},
        {"findings", p.findings},
        {"methods", p.methods}
    };
}

std::vector<int> parse_citation_markers(const std::string& answer, int max_index) {
    static const std::regex marker("\\[(\\d+)\\]");
    std::vector<int> out;
    for (auto it = std::sregex_iterator(answer.begin(), answer.end(), marker); it != std::sregex_iterator(); ++it) {
        int n = 0;
        try {
            n = std::stoi((*it)[1].str());
        } catch (const std::out_of_range&) {
            continue;
        }
        if (n < 1 || n > max_index) continue;
        if (std::find(out.begin(), out.end(), n) == out.end()) out.push_back(n);
    }
    return out;
}

std::set<std::string> normalize_topics(const std::vector<std::string>& raw, size_t max_topics) {
    std::set<std::string> out;
    for (const auto& t : raw) {
        if (out.size() >= max_topics) break;
        auto v = to_lower(trim(t));
        if (!v.empty()) out.insert(v);
    }
    return out;
}

OllamaLlm::OllamaLlm(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaLlm::chat(const std::string& system_prompt, const std::string& user_prompt, bool json_format) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"messages", json::array({
            json{{"role","system"},{"content",system_prompt}},
            json{{"role","user"},{"content",user_prompt}}
        })}
    };
    if (json_format) body["format"] = "json";

    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    } catch (const std::exception& e) {
        throw RagError(ErrorCode::GenerationServiceError, std::string("chat request failed: ") + e.what());
    }
    if (!r.ok()) {
        throw RagError(ErrorCode::GenerationServiceError, "chat failed: status " + std::to_string(r.status));
    }
    try {
        auto data = json::parse(r.body);
        if (data.contains("message")) return data["message"].value("content", std::string());
    } catch (const json::exception& e) {
        throw RagError(ErrorCode::GenerationServiceError, std::string("malformed chat response: ") + e.what());
    }
    return {};
}

json OllamaLlm::chat_json(const std::string& system_prompt, const std::string& user_prompt) {
    auto content = chat(system_prompt, user_prompt, true);
    auto parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw RagError(ErrorCode::GenerationServiceError, "model did not return a JSON object");
    }
    return parsed;
}

SummaryResult OllamaLlm::generate_summary(const std::string& text, const std::string& audience,
                                          const SectionList& sections) {
    std::string sys = "You summarize medical research papers. " + audience_guidance(audience) +
                      " Keep the summary under 300 words and do not invent facts.";
    std::string user = "Paper text:\n" + utf8_truncate(text, kMaxPromptChars);
    if (!sections.empty()) {
        user += "\n\nDetected sections:";
        for (const auto& kv : sections) user += " " + kv.first + ";";
    }
    SummaryResult res;
    try {
        res.summary = chat(sys, user, false);
        res.ok = !res.summary.empty();
        if (!res.ok) res.error = "model returned an empty summary";
    } catch (const RagError& e) {
        res.error = e.what();
    }
    return res;
}

CitedAnswer OllamaLlm::answer_with_citations(const std::string& question,
                                             const std::vector<ScoredChunk>& chunks) {
    std::string ctx;
    int i = 1;
    for (const auto& sc : chunks) {
        const auto& m = sc.chunk->meta();
        ctx += "[" + std::to_string(i) + "] " + m.document_id + " / " + m.section_name + "\n---\n" +
               sc.chunk->content() + "\n\n";
        ++i;
    }
    std::string sys = "You are a concise assistant. Use only the provided context to answer. "
                      "Cite sources as [n]. If unsure, say you don't know.";
    std::string user = std::string("Question: ") + question + "\n\nContext:\n" + ctx;

    CitedAnswer out;
    out.answer = chat(sys, user, false);
    for (int n : parse_citation_markers(out.answer, (int)chunks.size())) {
        const auto& m = chunks[n - 1].chunk->meta();
        out.citations.push_back({n, m.document_id, m.section_name, m.chunk_index});
    }
    return out;
}

std::set<std::string> OllamaLlm::extract_key_topics(const std::string& text) {
    std::string sys = "You extract key topics from medical research text. Respond with a JSON object "
                      "{\"topics\": [...]} holding at most 10 short lowercase topic phrases.";
    auto data = chat_json(sys, utf8_truncate(text, kMaxPromptChars));
    std::vector<std::string> raw;
    if (data.contains("topics") && data["topics"].is_array()) {
        for (const auto& t : data["topics"]) {
            if (t.is_string()) raw.push_back(t.get<std::string>());
        }
    }
    return normalize_topics(raw);
}

json OllamaLlm::synthesize_papers(const std::vector<PaperDigest>& papers, const std::string& synthesis_type) {
    json arr = json::array();
    for (const auto& p : papers) arr.push_back(to_json(p));
    std::string sys = "You synthesize findings across medical research papers. " + synthesis_instruction(synthesis_type) +
                      " Respond with a JSON object with keys \"synthesis\" (string), \"key_points\" (array of strings) "
                      "and \"gaps\" (array of strings).";
    auto data = chat_json(sys, "Papers:\n" + arr.dump(2));
    data["synthesis_type"] = synthesis_type;
    data["paper_count"] = papers.size();
    return data;
}

json OllamaLlm::explain_text(const std::string& selected_text, const std::string& context,
                             const std::string& question, const std::string& audience) {
    std::string sys = "You explain passages of medical research papers. " + audience_guidance(audience) +
                      " Respond with a JSON object with keys \"explanation\" (string) and \"key_terms\" (array of strings).";
    std::string user = "Selected text:\n" + selected_text + "\n\nSurrounding context:\n" +
                       utf8_truncate(context, kMaxPromptChars) + "\n\nQuestion: " + question;
    auto data = chat_json(sys, user);
    data["audience"] = audience;
    return data;
}
