#pragma once

#include "engine/engine_registry.hpp"
#include "session/game_session.hpp"
#include "session/session_config.hpp"

#include <memory>
#include <string>

namespace tale {

/// Dispatch-facing owner of one GameSession.
/// The session is created on first use from the configured game and
/// lives until the host is destroyed or a state transition fails. After
/// a SessionError the broken session is dropped and the next call
/// starts a fresh game.
class SessionHost {
public:
    SessionHost(EngineRegistry registry, SessionConfig config);

    /// The live session, created on demand.
    GameSession& session();

    bool hasSession() const { return session_ != nullptr; }

    /// Drop the current session; the next call starts a new game.
    void restart() { session_.reset(); }

    const SessionConfig& config() const { return config_; }
    const EngineRegistry& registry() const { return registry_; }

    // ── Operations by dispatch name ──
    std::string playAction(const std::string& action);
    std::string memory() { return session().getMemorySummary(); }
    std::string map() { return session().getMap(); }
    std::string inventory() { return session().getInventory(); }
    std::string validActions() { return session().getValidActions(); }
    std::string checkVocabulary(const std::string& word) { return session().checkVocabulary(word); }
    std::string saveState(const std::string& slot_name) { return session().save(slot_name); }
    std::string loadState(const std::string& slot_name);

private:
    EngineRegistry registry_;
    SessionConfig config_;
    std::unique_ptr<GameSession> session_;
};

} // namespace tale
