#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace toolhost {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_write_mutex;

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    return false;
}

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << tag << "] " << message << "\n";
}

} // namespace toolhost
