#pragma once

#include "engine/game_engine.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tale {

/// Registry of engine factories keyed by game name.
/// The host registers one factory per playable game; sessions are then
/// created from the configured game name alone.
class EngineRegistry {
public:
    using Factory = std::function<std::unique_ptr<GameEngine>()>;

    /// Register (or replace) the factory for a game.
    void registerGame(const std::string& name, Factory factory);

    /// Remove a game by name. Returns true if found.
    bool remove(const std::string& name);

    bool contains(const std::string& name) const;

    /// Build a fresh engine. Throws std::runtime_error for unknown games.
    std::unique_ptr<GameEngine> create(const std::string& name) const;

    /// Registered game names in lexical order.
    std::vector<std::string> availableGames() const;

    size_t count() const { return factories_.size(); }

private:
    std::map<std::string, Factory> factories_;
};

} // namespace tale
