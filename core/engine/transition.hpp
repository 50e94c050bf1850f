#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tale {

/// Result of one engine step. Replaced wholesale on every step; the
/// session never patches fields in place.
struct Transition {
    std::string observation;
    int score = 0;
    int moves = 0;
    int reward = 0;               // score delta reported by this step
    bool done = false;            // game reached a terminal state
    std::vector<std::string> inventory;  // engine-specific item descriptors

    Transition() = default;
    Transition(std::string observation, int score, int moves)
        : observation(std::move(observation)), score(score), moves(moves) {}
};

} // namespace tale
