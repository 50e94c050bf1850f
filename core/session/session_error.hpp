#pragma once

#include <stdexcept>
#include <string>

namespace tale {

/// A state-changing engine call failed (reset, step, or the look that
/// follows a load). The session's cached state can no longer be trusted
/// and the caller should discard the session.
class SessionError : public std::runtime_error {
public:
    SessionError(const std::string& action, const std::string& cause)
        : std::runtime_error("Engine transition failed on '" + action + "': " + cause),
          action_(action) {}

    const std::string& action() const { return action_; }

private:
    std::string action_;
};

} // namespace tale
