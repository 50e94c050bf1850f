#include <gtest/gtest.h>
#include "session/vocabulary_index.hpp"
#include "scripted_engine.hpp"

using namespace tale;

// ─── Prefix Matching ───────────────────────────────────────────

TEST(VocabularyTest, UnknownWordIsNegative) {
    VocabularyIndex index;
    auto result = index.match("xyzzyqq", {"north", "lamp", "plugh"});
    EXPECT_FALSE(result.understood());
    EXPECT_EQ(result.report(),
              "No, the game does NOT understand the word 'xyzzyqq'. Try a different synonym.");
}

TEST(VocabularyTest, ExactWordIsPositive) {
    VocabularyIndex index;
    auto result = index.match("xyzzy", {"north", "xyzzy"});
    ASSERT_TRUE(result.understood());
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0], "xyzzy");
    EXPECT_EQ(result.report(), "Yes, the game understands 'xyzzy' (matches: xyzzy).");
}

TEST(VocabularyTest, LongWordMatchesTruncatedToken) {
    VocabularyIndex index;
    auto result = index.match("Examine", {"examin", "exit"});
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0], "examin");
    // Report echoes the word as asked
    EXPECT_NE(result.report().find("'Examine'"), std::string::npos);
}

TEST(VocabularyTest, ShortWordListsEveryMatch) {
    VocabularyIndex index;
    auto result = index.match("la", {"lamp", "lanter", "north", "ladder"});
    ASSERT_EQ(result.matches.size(), 3u);
    EXPECT_EQ(result.report(),
              "Yes, the game understands 'la' (matches: lamp, lanter, ladder).");
}

TEST(VocabularyTest, PrefixLongerThanSixCharsIgnored) {
    VocabularyIndex index;
    // Only "xyzzyq" is compared, so both spellings hit the same token
    EXPECT_TRUE(index.match("xyzzyqq", {"xyzzyq"}).understood());
    EXPECT_TRUE(index.match("xyzzyqz", {"xyzzyq"}).understood());
}

TEST(VocabularyTest, CustomPrefixLength) {
    VocabularyIndex index(9);
    EXPECT_EQ(index.prefixLength(), 9u);
    EXPECT_FALSE(index.match("lanterns", {"lanter"}).understood());
    EXPECT_TRUE(index.match("lanterns", {"lanterns"}).understood());
}

TEST(VocabularyTest, EmptyWordMatchesWholeDictionary) {
    VocabularyIndex index;
    auto result = index.match("", {"north", "lamp"});
    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.report(), "Yes, the game understands '' (matches: north, lamp).");
}

TEST(VocabularyTest, WhitespaceIsPartOfTheWord) {
    VocabularyIndex index;
    EXPECT_FALSE(index.match(" lamp", {"lamp"}).understood());
    EXPECT_FALSE(index.match("   ", {"north"}).understood());
}

TEST(VocabularyTest, LookupFetchesEngineDictionary) {
    test::ScriptedEngine engine;
    VocabularyIndex index;
    EXPECT_TRUE(index.lookup(engine, "inventory").understood());

    engine.fail_dictionary = true;
    EXPECT_THROW(index.lookup(engine, "inventory"), EngineError);
}
