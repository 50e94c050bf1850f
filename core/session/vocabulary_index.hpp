#pragma once

#include "engine/game_engine.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tale {

/// Outcome of one vocabulary lookup.
struct VocabularyMatch {
    std::string word;                  // as asked, original casing
    std::vector<std::string> matches;  // dictionary tokens, dictionary order

    bool understood() const { return !matches.empty(); }

    /// Human-readable yes/no answer listing every match.
    std::string report() const;
};

// ─── Vocabulary Index ──────────────────────────────────────────
// Answers "does the parser know this word?". Z-machine dictionaries
// keep only a fixed-width prefix of each word, so an exact test would
// reject long words the game actually understands. Instead every token
// starting with the first prefix_length characters of the lower-cased
// word counts as a match.

class VocabularyIndex {
public:
    explicit VocabularyIndex(size_t prefix_length = 6)
        : prefix_length_(prefix_length) {}

    /// Pure prefix match against an already fetched dictionary.
    /// The word is not trimmed; an empty word matches every token.
    VocabularyMatch match(const std::string& word,
                          const std::vector<std::string>& dictionary) const;

    /// Fetch the engine dictionary and match against it.
    /// Engine failures propagate to the caller.
    VocabularyMatch lookup(GameEngine& engine, const std::string& word) const;

    size_t prefixLength() const { return prefix_length_; }

private:
    size_t prefix_length_;
};

} // namespace tale
