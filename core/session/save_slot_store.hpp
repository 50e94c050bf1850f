#pragma once

#include "engine/engine_snapshot.hpp"

#include <map>
#include <string>
#include <vector>

namespace tale {

/// Named engine snapshots. One snapshot per name; saving again under a
/// name replaces it. Held in memory only: every slot is lost when the
/// process exits.
class SaveSlotStore {
public:
    /// Store a snapshot. Returns true if an older one was overwritten.
    bool save(const std::string& name, EngineSnapshot snapshot);

    /// Snapshot for a name, or nullptr if the slot was never saved.
    const EngineSnapshot* find(const std::string& name) const;

    bool contains(const std::string& name) const;
    bool remove(const std::string& name);

    /// Slot names in lexical order.
    std::vector<std::string> names() const;

    size_t count() const { return slots_.size(); }

private:
    std::map<std::string, EngineSnapshot> slots_;
};

} // namespace tale
