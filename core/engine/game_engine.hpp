#pragma once

#include "engine/engine_snapshot.hpp"
#include "engine/transition.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace tale {

/// Raised by engine implementations when a call cannot be completed.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Contract of the external game-stepping engine.
/// The session interprets none of the game rules; everything it knows
/// about the world arrives through these calls.
class GameEngine {
public:
    virtual ~GameEngine() = default;

    /// Start a fresh game and return the opening transition.
    virtual Transition reset() = 0;

    /// Feed one textual action to the game.
    virtual Transition step(const std::string& action) = 0;

    /// Actions the engine believes are useful in the current state.
    virtual std::vector<std::string> validActions() = 0;

    /// Every vocabulary token the parser knows. Tokens may be truncated
    /// to the engine's fixed dictionary width.
    virtual std::vector<std::string> dictionary() = 0;

    virtual EngineSnapshot getState() = 0;
    virtual void setState(const EngineSnapshot& snapshot) = 0;
};

} // namespace tale
