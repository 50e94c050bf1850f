#include <gtest/gtest.h>
#include "session/history_log.hpp"
#include "session/save_slot_store.hpp"

#include <stdexcept>
#include <string>

using namespace tale;

// ─── History Log Tests ─────────────────────────────────────────

TEST(HistoryTest, GrowsBelowCapacity) {
    HistoryLog log;
    EXPECT_EQ(log.capacity(), 50u);
    for (int i = 0; i < 49; i++) {
        log.append("a" + std::to_string(i), "r" + std::to_string(i));
        EXPECT_EQ(log.size(), static_cast<size_t>(i + 1));
    }
}

TEST(HistoryTest, KeepsMostRecentFifty) {
    HistoryLog log;
    for (int i = 0; i < 120; i++) {
        log.append("a" + std::to_string(i), "r" + std::to_string(i));
    }
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 50u);
    EXPECT_EQ(entries.front().action, "a70");
    EXPECT_EQ(entries.back().action, "a119");
    for (size_t i = 1; i < entries.size(); i++) {
        EXPECT_EQ(entries[i].action, "a" + std::to_string(70 + i));
    }
}

TEST(HistoryTest, RecentReturnsTailOldestFirst) {
    HistoryLog log(10);
    for (int i = 0; i < 7; i++) {
        log.append("a" + std::to_string(i), "r");
    }
    auto recent = log.recent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].action, "a4");
    EXPECT_EQ(recent[2].action, "a6");

    EXPECT_EQ(log.recent(100).size(), 7u);
    EXPECT_TRUE(log.recent(0).empty());
}

TEST(HistoryTest, ZeroCapacityRejected) {
    EXPECT_THROW(HistoryLog(0), std::invalid_argument);
}

// ─── Save Slot Store Tests ─────────────────────────────────────

TEST(SaveSlotTest, SaveAndFind) {
    SaveSlotStore slots;
    EXPECT_EQ(slots.find("a"), nullptr);

    EXPECT_FALSE(slots.save("a", EngineSnapshot(42)));
    ASSERT_NE(slots.find("a"), nullptr);
    EXPECT_EQ(slots.find("a")->as<int>(), 42);
    EXPECT_TRUE(slots.contains("a"));
    EXPECT_EQ(slots.count(), 1u);
}

TEST(SaveSlotTest, OverwriteByName) {
    SaveSlotStore slots;
    slots.save("checkpoint", EngineSnapshot(std::string("first")));
    EXPECT_TRUE(slots.save("checkpoint", EngineSnapshot(std::string("second"))));
    EXPECT_EQ(slots.count(), 1u);
    EXPECT_EQ(slots.find("checkpoint")->as<std::string>(), "second");
}

TEST(SaveSlotTest, NamesSortedAndRemove) {
    SaveSlotStore slots;
    slots.save("zeta", EngineSnapshot(1));
    slots.save("alpha", EngineSnapshot(2));

    auto names = slots.names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "zeta");

    EXPECT_TRUE(slots.remove("zeta"));
    EXPECT_FALSE(slots.remove("zeta"));
    EXPECT_EQ(slots.count(), 1u);
}

TEST(SaveSlotTest, SnapshotIsOpaque) {
    EngineSnapshot empty;
    EXPECT_TRUE(empty.empty());

    EngineSnapshot snap(3.5);
    EXPECT_FALSE(snap.empty());
    EXPECT_THROW(snap.as<int>(), std::bad_any_cast);
}
