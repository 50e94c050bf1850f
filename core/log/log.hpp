#pragma once

#include <cstdint>
#include <string>

namespace tale {
namespace log {

// ─── Log Level ─────────────────────────────────────────────────
// Process-global minimum level. Lines below it are dropped before
// formatting.

enum class Level : uint32_t {
    TRACE = 0,
    INFO = 1,
    WARN = 2,
    ERR = 3,
    OFF = 4
};

void setLevel(Level min_level);
Level getLevel();

/// Parse "trace" / "info" / "warn" / "error" / "off" (any case).
/// Returns fallback for anything else.
Level parseLevel(const std::string& text, Level fallback = Level::INFO);

const char* levelName(Level level);

/// Mirror every line into a file (append mode). Returns false if the
/// file cannot be opened; the stderr sink is unaffected.
bool setFile(const std::string& path);
void closeFile();

/// Emit "[<ms>] [<level>] [<tag>] <msg>" to stderr and the file sink.
/// stdout is never written: a stdio transport may own it.
void write(Level level, const std::string& tag, const std::string& msg);

inline void trace(const std::string& tag, const std::string& msg) { write(Level::TRACE, tag, msg); }
inline void info(const std::string& tag, const std::string& msg) { write(Level::INFO, tag, msg); }
inline void warn(const std::string& tag, const std::string& msg) { write(Level::WARN, tag, msg); }
inline void error(const std::string& tag, const std::string& msg) { write(Level::ERR, tag, msg); }

} // namespace log
} // namespace tale
