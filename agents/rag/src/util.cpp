#include "../include/util.hpp"
#include "../include/log.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <cmath>
#include <ctime>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long_or(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        size_t used = 0;
        long n = std::stol(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        log_warn(std::string("ignoring invalid value for ") + key + ": " + v);
        return def;
    }
}

std::string sha1_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha1) failed");
    }
    std::ostringstream oss;
    for (unsigned int i = 0; i < md_len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<std::string> chunk_text_paragraphs(const std::string& text, int max_chars, int overlap) {
    std::vector<std::string> out;
    std::string buf;
    auto push = [&](const std::string& s){ if (!is_blank(s)) out.push_back(s); };
    size_t pos = 0, n = text.size();
    while (pos < n) {
        size_t next = text.find("\n\n", pos);
        std::string p = text.substr(pos, next == std::string::npos ? n - pos : next - pos);
        if ((int)(buf.size() + p.size()) + 2 <= max_chars) {
            buf += (buf.empty() ? "" : "\n\n");
            buf += p;
        } else {
            push(buf);
            buf = p;
        }
        if (next == std::string::npos) break;
        pos = next + 2;
    }
    push(buf);

    // Oversized paragraphs are split with a sliding window.
    std::vector<std::string> sized;
    int step = std::max(1, max_chars - overlap);
    for (auto& c : out) {
        if ((int)c.size() <= max_chars) { sized.push_back(std::move(c)); continue; }
        for (size_t i = 0; i < c.size(); i += step) {
            sized.push_back(c.substr(i, max_chars));
            if (i + max_chars >= c.size()) break;
        }
    }
    return sized;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}

void l2_normalize(std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += (double)x * (double)x;
    if (norm == 0.0) return;
    norm = std::sqrt(norm);
    for (auto& x : v) x = (float)(x / norm);
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string utf8_truncate(const std::string& s, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = (unsigned char)s[i];
        if ((c & 0xC0) != 0x80) {
            if (count == max_chars) return s.substr(0, i);
            ++count;
        }
    }
    return s;
}

static std::tm local_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format_compact_timestamp(std::chrono::system_clock::time_point tp) {
    std::tm tm = local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    std::tm tm = local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}
