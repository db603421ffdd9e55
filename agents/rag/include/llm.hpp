#pragma once
#include "corpus.hpp"
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    long timeout_ms{240000};
};

struct SummaryResult {
    bool ok{false};
    std::string summary;
    std::string error;
};

struct Citation {
    int index{0}; // 1-based position in the context handed to the model
    std::string document_id;
    std::string section_name;
    int chunk_index{0};
};

struct CitedAnswer {
    std::string answer;
    std::vector<Citation> citations;
};

struct PaperDigest {
    std::string document_id;
    std::string title;
    std::string year;
    std::set<std::string> topics;
    std::string findings;
    std::string methods;
};

nlohmann::json to_json(const PaperDigest& p);

// Generative model. Everything except generate_summary throws
// RagError(GenerationServiceError) on failure; generate_summary reports it in the result.
class LlmService {
public:
    virtual ~LlmService() = default;
    virtual SummaryResult generate_summary(const std::string& text, const std::string& audience,
                                           const SectionList& sections) = 0;
    virtual CitedAnswer answer_with_citations(const std::string& question,
                                              const std::vector<ScoredChunk>& chunks) = 0;
    virtual std::set<std::string> extract_key_topics(const std::string& text) = 0;
    virtual nlohmann::json synthesize_papers(const std::vector<PaperDigest>& papers,
                                             const std::string& synthesis_type) = 0;
    virtual nlohmann::json explain_text(const std::string& selected_text, const std::string& context,
                                        const std::string& question, const std::string& audience) = 0;
};

class OllamaLlm : public LlmService {
public:
    explicit OllamaLlm(LlmConfig cfg);

    SummaryResult generate_summary(const std::string& text, const std::string& audience,
                                   const SectionList& sections) override;
    CitedAnswer answer_with_citations(const std::string& question,
                                      const std::vector<ScoredChunk>& chunks) override;
    std::set<std::string> extract_key_topics(const std::string& text) override;
    nlohmann::json synthesize_papers(const std::vector<PaperDigest>& papers,
                                     const std::string& synthesis_type) override;
    nlohmann::json explain_text(const std::string& selected_text, const std::string& context,
                                const std::string& question, const std::string& audience) override;

private:
    std::string chat(const std::string& system_prompt, const std::string& user_prompt, bool json_format);
    nlohmann::json chat_json(const std::string& system_prompt, const std::string& user_prompt);

    LlmConfig cfg_;
};

// Unique [n] markers in first-appearance order, restricted to 1..max_index.
std::vector<int> parse_citation_markers(const std::string& answer, int max_index);
// Lowercased, trimmed, de-duplicated; at most max_topics entries.
std::set<std::string> normalize_topics(const std::vector<std::string>& raw, size_t max_topics = 10);
