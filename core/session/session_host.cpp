#include "session/session_host.hpp"
#include "session/session_error.hpp"
#include "log/log.hpp"

#include <utility>

namespace tale {

SessionHost::SessionHost(EngineRegistry registry, SessionConfig config)
    : registry_(std::move(registry)), config_(std::move(config)) {
    config_.validate();
}

GameSession& SessionHost::session() {
    if (!session_) {
        session_ = GameSession::create(registry_, config_);
    }
    return *session_;
}

std::string SessionHost::playAction(const std::string& action) {
    try {
        return session().takeAction(action);
    } catch (const SessionError&) {
        log::error("host", "dropping session after failed '" + action + "'");
        restart();
        throw;
    }
}

std::string SessionHost::loadState(const std::string& slot_name) {
    try {
        return session().load(slot_name);
    } catch (const SessionError&) {
        log::error("host", "dropping session after failed load of '" + slot_name + "'");
        restart();
        throw;
    }
}

} // namespace tale
