#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace tale {

// ─── Exploration Graph ─────────────────────────────────────────
// Map of visited locations. Each location owns a set of exit labels of
// the form "<action> -> <destination>". Grows monotonically: nothing is
// ever removed, and load() does not rewind it.

class ExplorationGraph {
public:
    ExplorationGraph() = default;

    /// True for north/south/east/west/up/down/enter/exit and the
    /// one-letter forms n/s/e/w/u/d. Exact, case-sensitive match.
    static bool isMovementAction(const std::string& action);

    /// "<action> -> <destination>"
    static std::string edgeLabel(const std::string& action,
                                 const std::string& destination);

    /// Record the outcome of an action issued at `from`.
    /// Non-movement actions are ignored. A movement action marks `from`
    /// as explored and adds an exit only when `to` differs from `from`.
    /// Returns true if a new exit was inserted.
    bool recordMove(const std::string& from, const std::string& action,
                    const std::string& to);

    bool hasLocation(const std::string& location) const;

    /// Exit labels of a location in lexical order; empty if unknown.
    std::vector<std::string> exitsFrom(const std::string& location) const;

    /// Explored locations in lexical order.
    std::vector<std::string> locations() const;

    size_t locationCount() const { return exits_.size(); }
    size_t edgeCount() const;
    bool empty() const { return exits_.empty(); }

    /// Multi-line map report ending with a "[Current]" marker.
    std::string render(const std::string& current_location) const;

private:
    std::map<std::string, std::set<std::string>> exits_;
};

} // namespace tale
