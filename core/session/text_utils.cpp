#include "session/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tale {
namespace text {

namespace {
const char* const kWhitespace = " \t\r\n\v\f";
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(kWhitespace);
    return s.substr(begin, end - begin + 1);
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string excerpt(const std::string& s, size_t n) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); i++) {
        bool continuation = (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80;
        if (continuation) continue;
        if (chars == n) return s.substr(0, i);
        chars++;
    }
    return s;
}

std::string extractLocation(const std::string& observation) {
    std::istringstream iss(observation);
    std::string line;
    while (std::getline(iss, line)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) return trimmed;
    }
    return "Unknown";
}

} // namespace text
} // namespace tale
