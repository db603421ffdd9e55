#include "../include/parser.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

static const char* kDefaultSection = "body";

static bool heading_name(const std::string& raw_line, std::string& name) {
    std::string line = trim(raw_line);
    if (line.empty()) return false;
    if (line[0] == '#') {
        size_t i = line.find_first_not_of('#');
        if (i == std::string::npos) return false;
        name = trim(line.substr(i));
        return !name.empty();
    }
    if (line.size() > 60) return false;
    int letters = 0;
    for (unsigned char c : line) {
        if (std::islower(c)) return false;
        if (std::isupper(c)) ++letters;
    }
    if (letters < 3) return false;
    name = line;
    return true;
}

TextDocumentParser::TextDocumentParser(TextParserOptions opts) : opts_(opts) {}

ParsedDocument TextDocumentParser::parse(const std::filesystem::path& file_path) {
    if (!std::filesystem::is_regular_file(file_path)) {
        throw std::runtime_error("not a regular file: " + file_path.string());
    }
    auto doc = parse_text(read_text_file(file_path), file_path.stem().string());

    auto ftime = std::filesystem::last_write_time(file_path);
    auto mtime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    doc.info.metadata["creation_date"] = format_iso8601(mtime);
    doc.info.metadata["source_path"] = file_path.string();
    return doc;
}

ParsedDocument TextDocumentParser::parse_text(const std::string& text, const std::string& fallback_title) {
    std::vector<std::pair<std::string, std::string>> blocks;
    std::string title;
    std::string current = kDefaultSection;
    std::string body;

    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        std::string name;
        if (heading_name(line, name)) {
            if (title.empty()) title = name;
            if (!is_blank(body)) blocks.emplace_back(current, body);
            current = name;
            body.clear();
            continue;
        }
        body += line;
        body += '\n';
    }
    if (!is_blank(body)) blocks.emplace_back(current, body);

    ParsedDocument doc;
    doc.info.chunking_method = "paragraph";
    doc.info.metadata["title"] = title.empty() ? fallback_title : title;
    for (const auto& b : blocks) {
        auto body_text = trim(b.second);
        auto it = std::find_if(doc.info.sections.begin(), doc.info.sections.end(),
                               [&](const std::pair<std::string, std::string>& s) { return s.first == b.first; });
        if (it == doc.info.sections.end()) {
            doc.info.sections.emplace_back(b.first, body_text);
        } else {
            it->second += "\n\n";
            it->second += body_text;
        }
        for (auto& c : chunk_text_paragraphs(body_text, opts_.max_chars, opts_.overlap)) {
            doc.chunks.push_back({std::move(c), b.first});
        }
    }
    return doc;
}
