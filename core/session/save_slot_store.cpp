#include "session/save_slot_store.hpp"

#include <utility>

namespace tale {

bool SaveSlotStore::save(const std::string& name, EngineSnapshot snapshot) {
    auto it = slots_.find(name);
    if (it != slots_.end()) {
        it->second = std::move(snapshot);
        return true;
    }
    slots_.emplace(name, std::move(snapshot));
    return false;
}

const EngineSnapshot* SaveSlotStore::find(const std::string& name) const {
    auto it = slots_.find(name);
    return it != slots_.end() ? &it->second : nullptr;
}

bool SaveSlotStore::contains(const std::string& name) const {
    return slots_.count(name) > 0;
}

bool SaveSlotStore::remove(const std::string& name) {
    return slots_.erase(name) > 0;
}

std::vector<std::string> SaveSlotStore::names() const {
    std::vector<std::string> result;
    result.reserve(slots_.size());
    for (const auto& [name, _] : slots_) {
        result.push_back(name);
    }
    return result;
}

} // namespace tale
