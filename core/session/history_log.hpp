#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace tale {

/// One action issued by the caller and the narrative it produced.
struct HistoryEntry {
    std::string action;
    std::string result;
};

// ─── History Log ───────────────────────────────────────────────
// Bounded, time-ordered record of actions. Once `capacity` entries are
// held, each append drops the oldest one.

class HistoryLog {
public:
    explicit HistoryLog(size_t capacity = 50);

    void append(const std::string& action, const std::string& result);

    /// Up to n most recent entries, oldest first.
    std::vector<HistoryEntry> recent(size_t n) const;

    /// All retained entries, oldest first.
    std::vector<HistoryEntry> entries() const;

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }

private:
    size_t capacity_;
    std::deque<HistoryEntry> entries_;
};

} // namespace tale
