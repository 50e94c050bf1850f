#include "session/history_log.hpp"

#include <stdexcept>

namespace tale {

HistoryLog::HistoryLog(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("History capacity must be positive");
    }
}

void HistoryLog::append(const std::string& action, const std::string& result) {
    entries_.push_back(HistoryEntry{action, result});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<HistoryEntry> HistoryLog::recent(size_t n) const {
    if (n >= entries_.size()) return entries();
    return std::vector<HistoryEntry>(entries_.end() - static_cast<std::ptrdiff_t>(n),
                                     entries_.end());
}

std::vector<HistoryEntry> HistoryLog::entries() const {
    return std::vector<HistoryEntry>(entries_.begin(), entries_.end());
}

} // namespace tale
