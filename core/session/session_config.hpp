#pragma once

#include "log/log.hpp"

#include <cstddef>
#include <string>

namespace tale {

/// Session configuration parameters.
struct SessionConfig {
    std::string game = "zork1";          // game the host starts
    size_t history_limit = 50;           // actions kept in the history log
    size_t recent_actions = 5;           // actions shown by memory()
    size_t excerpt_length = 60;          // result characters per memory() line
    size_t vocabulary_prefix = 6;        // dictionary width for word matching
    log::Level log_level = log::Level::INFO;

    /// Defaults overridden by GAME and TALE_LOG_LEVEL when set.
    static SessionConfig fromEnvironment();

    /// Throws std::invalid_argument on an empty game name or a zero limit.
    void validate() const;
};

} // namespace tale
