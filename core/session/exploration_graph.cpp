#include "session/exploration_graph.hpp"

#include <array>
#include <sstream>

namespace tale {

namespace {

const std::array<const char*, 14> kMovementActions = {
    "north", "south", "east", "west", "up", "down", "enter", "exit",
    "n", "s", "e", "w", "u", "d"
};

} // namespace

bool ExplorationGraph::isMovementAction(const std::string& action) {
    for (const char* m : kMovementActions) {
        if (action == m) return true;
    }
    return false;
}

std::string ExplorationGraph::edgeLabel(const std::string& action,
                                        const std::string& destination) {
    return action + " -> " + destination;
}

bool ExplorationGraph::recordMove(const std::string& from, const std::string& action,
                                  const std::string& to) {
    if (!isMovementAction(action)) return false;

    auto& exits = exits_[from];
    if (to == from) return false;
    return exits.insert(edgeLabel(action, to)).second;
}

bool ExplorationGraph::hasLocation(const std::string& location) const {
    return exits_.count(location) > 0;
}

std::vector<std::string> ExplorationGraph::exitsFrom(const std::string& location) const {
    auto it = exits_.find(location);
    if (it == exits_.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> ExplorationGraph::locations() const {
    std::vector<std::string> names;
    names.reserve(exits_.size());
    for (const auto& [name, _] : exits_) {
        names.push_back(name);
    }
    return names;
}

size_t ExplorationGraph::edgeCount() const {
    size_t total = 0;
    for (const auto& [_, exits] : exits_) {
        total += exits.size();
    }
    return total;
}

std::string ExplorationGraph::render(const std::string& current_location) const {
    if (exits_.empty()) {
        return "Map: No locations explored yet. Try moving around!";
    }

    std::ostringstream out;
    out << "Explored Locations and Exits:";
    for (const auto& [location, exits] : exits_) {
        out << "\n\n* " << location;
        for (const auto& exit : exits) {
            out << "\n    -> " << exit;
        }
    }
    out << "\n\n[Current] " << current_location;
    return out.str();
}

} // namespace tale
