#include "session/session_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace tale {

SessionConfig SessionConfig::fromEnvironment() {
    SessionConfig config;

    const char* game = std::getenv("GAME");
    if (game && *game) {
        config.game = game;
    }

    const char* level = std::getenv("TALE_LOG_LEVEL");
    if (level && *level) {
        config.log_level = log::parseLevel(level, config.log_level);
    }
    return config;
}

void SessionConfig::validate() const {
    if (game.empty())
        throw std::invalid_argument("SessionConfig: game must not be empty");
    if (history_limit == 0)
        throw std::invalid_argument("SessionConfig: history_limit must be positive");
    if (recent_actions == 0)
        throw std::invalid_argument("SessionConfig: recent_actions must be positive");
    if (excerpt_length == 0)
        throw std::invalid_argument("SessionConfig: excerpt_length must be positive");
    if (vocabulary_prefix == 0)
        throw std::invalid_argument("SessionConfig: vocabulary_prefix must be positive");
}

} // namespace tale
