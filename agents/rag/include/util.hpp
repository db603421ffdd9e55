#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
long getenv_long_or(const char* key, long def);
std::string sha1_hex(const std::string& data);
std::string read_text_file(const std::filesystem::path& p);
std::vector<std::string> chunk_text_paragraphs(const std::string& text, int max_chars, int overlap);
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
void l2_normalize(std::vector<float>& v);

bool is_blank(const std::string& s);
std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool contains_ci(const std::string& haystack, const std::string& needle);
// Cuts at max_chars code points, never inside a UTF-8 sequence.
std::string utf8_truncate(const std::string& s, size_t max_chars);

std::string format_compact_timestamp(std::chrono::system_clock::time_point tp);
std::string format_iso8601(std::chrono::system_clock::time_point tp);
long long to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(long long ms);
