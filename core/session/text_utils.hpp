#pragma once

#include <cstddef>
#include <string>

namespace tale {
namespace text {

/// Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF).
std::string trim(const std::string& s);

/// ASCII lower-casing; bytes outside A-Z pass through.
std::string toLower(const std::string& s);

/// First n characters of s. Counts UTF-8 code points, so a multi-byte
/// character is never split.
std::string excerpt(const std::string& s, size_t n);

/// Location name of an observation: its first non-empty line, trimmed.
/// Returns "Unknown" when every line is blank.
///
/// Two rooms whose descriptions open with the same line are conflated
/// into one location.
std::string extractLocation(const std::string& observation);

} // namespace text
} // namespace tale
