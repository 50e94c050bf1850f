#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace tale {
namespace log {

namespace {

std::mutex g_mutex;
Level g_min = Level::INFO;
std::FILE* g_file = nullptr;

uint64_t nowMillis() {
    using clock = std::chrono::system_clock;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock::now().time_since_epoch()).count();
    return static_cast<uint64_t>(ms);
}

} // namespace

void setLevel(Level min_level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_min = min_level;
}

Level getLevel() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_min;
}

Level parseLevel(const std::string& text, Level fallback) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return Level::TRACE;
    if (lower == "info")  return Level::INFO;
    if (lower == "warn")  return Level::WARN;
    if (lower == "error") return Level::ERR;
    if (lower == "off")   return Level::OFF;
    return fallback;
}

const char* levelName(Level level) {
    switch (level) {
        case Level::TRACE: return "trace";
        case Level::INFO:  return "info";
        case Level::WARN:  return "warn";
        case Level::ERR: return "error";
        case Level::OFF:   return "off";
    }
    return "unknown";
}

bool setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    g_file = std::fopen(path.c_str(), "a");
    return g_file != nullptr;
}

void closeFile() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
}

void write(Level level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (level == Level::OFF || level < g_min) return;

    std::string line = "[" + std::to_string(nowMillis()) + "] [" +
                       levelName(level) + "] [" + tag + "] " + msg + "\n";

    std::fwrite(line.data(), 1, line.size(), stderr);
    if (g_file) {
        std::fwrite(line.data(), 1, line.size(), g_file);
        std::fflush(g_file);
    }
}

} // namespace log
} // namespace tale
