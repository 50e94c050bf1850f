#include "engine/engine_registry.hpp"
#include "log/log.hpp"

#include <stdexcept>

namespace tale {

void EngineRegistry::registerGame(const std::string& name, Factory factory) {
    if (name.empty()) {
        throw std::invalid_argument("Game name must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Null engine factory for game: " + name);
    }
    factories_[name] = std::move(factory);
}

bool EngineRegistry::remove(const std::string& name) {
    return factories_.erase(name) > 0;
}

bool EngineRegistry::contains(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::unique_ptr<GameEngine> EngineRegistry::create(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        throw std::runtime_error("Unknown game: " + name);
    }
    std::unique_ptr<GameEngine> engine = it->second();
    if (!engine) {
        throw std::runtime_error("Engine factory returned null for game: " + name);
    }
    log::info("registry", "created engine for " + name);
    return engine;
}

std::vector<std::string> EngineRegistry::availableGames() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        names.push_back(name);
    }
    return names;
}

} // namespace tale
