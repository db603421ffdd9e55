#pragma once
#include "corpus.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RawChunk {
    std::string content;
    std::string section_name;
};

struct DocInfo {
    SectionList sections;
    nlohmann::json metadata = nlohmann::json::object();
    std::string chunking_method;
};

struct ParsedDocument {
    std::vector<RawChunk> chunks;
    DocInfo info;
};

class DocumentParser {
public:
    virtual ~DocumentParser() = default;
    virtual ParsedDocument parse(const std::filesystem::path& file_path) = 0;
};

struct TextParserOptions {
    int max_chars{1200};
    int overlap{200};
};

// Plain text and markdown. Sections start at markdown headings or short all-caps lines.
class TextDocumentParser : public DocumentParser {
public:
    explicit TextDocumentParser(TextParserOptions opts = {});
    ParsedDocument parse(const std::filesystem::path& file_path) override;
    ParsedDocument parse_text(const std::string& text, const std::string& fallback_title);

private:
    TextParserOptions opts_;
};
