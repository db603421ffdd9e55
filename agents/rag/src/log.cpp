#include "../include/log.hpp"
#include <iostream>
#include <mutex>

static std::mutex g_log_mutex;

void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[rag] " << msg << "\n";
}

void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[rag] [WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[rag] [ERROR] " << msg << std::endl;
}
