#include "session/vocabulary_index.hpp"
#include "session/text_utils.hpp"

namespace tale {

std::string VocabularyMatch::report() const {
    if (matches.empty()) {
        return "No, the game does NOT understand the word '" + word +
               "'. Try a different synonym.";
    }
    std::string joined;
    for (size_t i = 0; i < matches.size(); i++) {
        if (i > 0) joined += ", ";
        joined += matches[i];
    }
    return "Yes, the game understands '" + word + "' (matches: " + joined + ").";
}

VocabularyMatch VocabularyIndex::match(const std::string& word,
                                       const std::vector<std::string>& dictionary) const {
    VocabularyMatch result;
    result.word = word;

    std::string key = text::toLower(word);
    if (key.size() > prefix_length_) key.resize(prefix_length_);

    for (const auto& token : dictionary) {
        if (token.compare(0, key.size(), key) == 0) {
            result.matches.push_back(token);
        }
    }
    return result;
}

VocabularyMatch VocabularyIndex::lookup(GameEngine& engine, const std::string& word) const {
    return match(word, engine.dictionary());
}

} // namespace tale
