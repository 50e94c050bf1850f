#pragma once

#include "engine/engine_registry.hpp"
#include "engine/game_engine.hpp"
#include "engine/transition.hpp"
#include "session/exploration_graph.hpp"
#include "session/history_log.hpp"
#include "session/save_slot_store.hpp"
#include "session/session_config.hpp"
#include "session/vocabulary_index.hpp"

#include <memory>
#include <string>

namespace tale {

// ─── Game Session ──────────────────────────────────────────────
// One live game. Owns the engine exclusively and keeps the telemetry
// derived from its transitions: history, exploration map, save slots.
//
// Error policy:
//   - takeAction(), load()'s resynchronizing look, and construction
//     throw SessionError when the engine fails; discard the session.
//   - every other operation absorbs engine failures and answers with
//     an error description instead.
//
// Not thread-safe. A concurrent host must serialize all calls on one
// session behind a single mutex.

class GameSession {
public:
    /// Applies config.log_level process-wide, then resets the engine to
    /// obtain the opening transition. Throws SessionError if the reset fails.
    GameSession(std::unique_ptr<GameEngine> engine, SessionConfig config = {});

    /// Build the configured game's engine from a registry.
    static std::unique_ptr<GameSession> create(const EngineRegistry& registry,
                                               const SessionConfig& config);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // ── Play ──

    /// Forward an action to the engine and update history and map.
    /// Returns the narrative plus a score line, and "GAME OVER" once the
    /// game has ended. Post-terminal actions are still forwarded.
    std::string takeAction(const std::string& action);

    // ── Derived state ──
    std::string getMemorySummary() const;
    std::string getMap() const;
    std::string getInventory() const;

    // ── Live engine queries (never throw) ──
    std::string getValidActions();
    std::string checkVocabulary(const std::string& word);

    // ── Snapshots ──

    /// Save the engine state under slot_name, replacing any earlier save.
    std::string save(const std::string& slot_name);

    /// Restore a slot and re-read the observation with a "look".
    /// History and map are left as they are.
    std::string load(const std::string& slot_name);

    // ── Accessors ──
    const std::string& gameName() const { return config_.game; }
    const SessionConfig& config() const { return config_; }
    const Transition& currentTransition() const { return current_; }
    const std::string& currentLocation() const { return location_; }
    const HistoryLog& history() const { return history_; }
    const ExplorationGraph& exploration() const { return exploration_; }
    const SaveSlotStore& slots() const { return slots_; }

private:
    Transition stepEngine(const std::string& action);

    SessionConfig config_;
    std::unique_ptr<GameEngine> engine_;
    Transition current_;
    std::string location_;
    HistoryLog history_;
    ExplorationGraph exploration_;
    SaveSlotStore slots_;
    VocabularyIndex vocabulary_;
};

} // namespace tale
