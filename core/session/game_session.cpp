#include "session/game_session.hpp"
#include "session/inventory_parser.hpp"
#include "session/session_error.hpp"
#include "session/text_utils.hpp"
#include "log/log.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tale {

namespace {
const char* const kTag = "session";
const char* const kLookAction = "look";
}

GameSession::GameSession(std::unique_ptr<GameEngine> engine, SessionConfig config)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      history_(config_.history_limit),
      vocabulary_(config_.vocabulary_prefix) {
    config_.validate();
    log::setLevel(config_.log_level);
    if (!engine_) {
        throw std::invalid_argument("GameSession requires an engine");
    }

    try {
        current_ = engine_->reset();
    } catch (const std::exception& e) {
        log::error(kTag, "reset failed for " + config_.game + ": " + e.what());
        throw SessionError("reset", e.what());
    }
    location_ = text::extractLocation(current_.observation);
    log::info(kTag, "started " + config_.game + " at " + location_);
}

std::unique_ptr<GameSession> GameSession::create(const EngineRegistry& registry,
                                                 const SessionConfig& config) {
    config.validate();
    return std::make_unique<GameSession>(registry.create(config.game), config);
}

Transition GameSession::stepEngine(const std::string& action) {
    try {
        return engine_->step(action);
    } catch (const std::exception& e) {
        log::error(kTag, "step '" + action + "' failed: " + e.what());
        throw SessionError(action, e.what());
    }
}

// ─── Play ──────────────────────────────────────────────────────

std::string GameSession::takeAction(const std::string& action) {
    current_ = stepEngine(action);
    const std::string& result = current_.observation;

    history_.append(action, result);

    std::string previous = location_;
    location_ = text::extractLocation(result);
    if (exploration_.recordMove(previous, action, location_)) {
        log::info(kTag, "mapped " + previous + " --" + action + "--> " + location_);
    }
    log::trace(kTag, "'" + action + "' -> " + location_ +
                     " (score " + std::to_string(current_.score) +
                     ", moves " + std::to_string(current_.moves) + ")");

    std::string out = result;
    if (current_.reward > 0) {
        out += "\n\n+" + std::to_string(current_.reward) +
               " points! (Total: " + std::to_string(current_.score) + ")";
    } else {
        out += "\n\n[Score: " + std::to_string(current_.score) +
               " | Moves: " + std::to_string(current_.moves) + "]";
    }
    if (current_.done) {
        out += "\n\nGAME OVER";
    }
    return out;
}

// ─── Derived state ─────────────────────────────────────────────

std::string GameSession::getMemorySummary() const {
    std::ostringstream out;
    out << "Current State:\n"
        << "- Location: " << location_ << "\n"
        << "- Score: " << current_.score << " points\n"
        << "- Moves: " << current_.moves << "\n"
        << "- Game: " << config_.game << "\n"
        << "\n"
        << "Recent Actions:\n";

    auto recent = history_.recent(config_.recent_actions);
    if (recent.empty()) {
        out << "  (none yet)\n";
    }
    for (const auto& entry : recent) {
        out << "  > " << entry.action << " -> "
            << text::excerpt(entry.result, config_.excerpt_length) << "...\n";
    }

    out << "\n"
        << "Current Observation:\n"
        << current_.observation;
    return out.str();
}

std::string GameSession::getMap() const {
    return exploration_.render(location_);
}

std::string GameSession::getInventory() const {
    if (current_.inventory.empty()) {
        return "Inventory: You are empty-handed.";
    }
    auto names = parseInventory(current_.inventory);
    std::string joined;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    return "Inventory: " + joined;
}

// ─── Live engine queries ───────────────────────────────────────

std::string GameSession::getValidActions() {
    try {
        auto actions = engine_->validActions();
        if (actions.empty()) {
            return "No valid actions available.";
        }
        std::string out = "Valid Actions:";
        for (const auto& a : actions) {
            out += "\n  - " + a;
        }
        return out;
    } catch (const std::exception& e) {
        log::warn(kTag, std::string("valid actions unavailable: ") + e.what());
        return std::string("Could not retrieve valid actions: ") + e.what();
    }
}

std::string GameSession::checkVocabulary(const std::string& word) {
    try {
        return vocabulary_.lookup(*engine_, word).report();
    } catch (const std::exception& e) {
        log::warn(kTag, std::string("dictionary unavailable: ") + e.what());
        return std::string("Could not check vocabulary: ") + e.what();
    }
}

// ─── Snapshots ─────────────────────────────────────────────────

std::string GameSession::save(const std::string& slot_name) {
    try {
        bool replaced = slots_.save(slot_name, engine_->getState());
        log::info(kTag, std::string(replaced ? "overwrote" : "saved") +
                        " slot '" + slot_name + "' at " + location_);
        return "Game saved successfully to slot: '" + slot_name + "'";
    } catch (const std::exception& e) {
        log::warn(kTag, "save to '" + slot_name + "' failed: " + e.what());
        return "Error saving game to slot '" + slot_name + "': " + e.what();
    }
}

std::string GameSession::load(const std::string& slot_name) {
    const EngineSnapshot* snapshot = slots_.find(slot_name);
    if (!snapshot) {
        return "Error: No save found in slot '" + slot_name + "'";
    }

    try {
        engine_->setState(*snapshot);
    } catch (const std::exception& e) {
        log::warn(kTag, "restore of '" + slot_name + "' failed: " + e.what());
        return "Error loading game from slot '" + slot_name + "': " + e.what();
    }

    // The restored engine state is authoritative; refresh the cached view
    // without recording the look in history.
    current_ = stepEngine(kLookAction);
    location_ = text::extractLocation(current_.observation);
    log::info(kTag, "loaded slot '" + slot_name + "' at " + location_);

    return "Game loaded from slot: '" + slot_name + "'.\nCurrent location: " +
           current_.observation;
}

} // namespace tale
