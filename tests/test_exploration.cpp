#include <gtest/gtest.h>
#include "session/exploration_graph.hpp"

using namespace tale;

// ─── Movement Vocabulary ───────────────────────────────────────

TEST(ExplorationTest, MovementActions) {
    for (const char* a : {"north", "south", "east", "west", "up", "down",
                          "enter", "exit", "n", "s", "e", "w", "u", "d"}) {
        EXPECT_TRUE(ExplorationGraph::isMovementAction(a)) << a;
    }
    EXPECT_FALSE(ExplorationGraph::isMovementAction("take lamp"));
    EXPECT_FALSE(ExplorationGraph::isMovementAction("go north"));
    EXPECT_FALSE(ExplorationGraph::isMovementAction("North"));
    EXPECT_FALSE(ExplorationGraph::isMovementAction(""));
}

// ─── Edge Recording ────────────────────────────────────────────

TEST(ExplorationTest, MoveAddsOneEdge) {
    ExplorationGraph g;
    EXPECT_TRUE(g.empty());

    EXPECT_TRUE(g.recordMove("West of House", "north", "North of House"));
    EXPECT_EQ(g.locationCount(), 1u);
    EXPECT_EQ(g.edgeCount(), 1u);

    auto exits = g.exitsFrom("West of House");
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_EQ(exits[0], "north -> North of House");
}

TEST(ExplorationTest, RepeatedMoveDoesNotDuplicate) {
    ExplorationGraph g;
    g.recordMove("West of House", "north", "North of House");
    EXPECT_FALSE(g.recordMove("West of House", "north", "North of House"));
    EXPECT_EQ(g.edgeCount(), 1u);

    // Same destination under another label is a distinct exit
    EXPECT_TRUE(g.recordMove("West of House", "n", "North of House"));
    EXPECT_EQ(g.edgeCount(), 2u);
}

TEST(ExplorationTest, NonMovementNeverAddsEdge) {
    ExplorationGraph g;
    EXPECT_FALSE(g.recordMove("West of House", "take lamp", "Taken."));
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.edgeCount(), 0u);
}

TEST(ExplorationTest, MoveInPlaceRegistersLocationOnly) {
    ExplorationGraph g;
    EXPECT_FALSE(g.recordMove("Kitchen", "up", "Kitchen"));
    EXPECT_TRUE(g.hasLocation("Kitchen"));
    EXPECT_EQ(g.edgeCount(), 0u);
    EXPECT_TRUE(g.exitsFrom("Kitchen").empty());
}

TEST(ExplorationTest, LocationsAndExitsSorted) {
    ExplorationGraph g;
    g.recordMove("West of House", "south", "South of House");
    g.recordMove("Behind House", "enter", "Kitchen");
    g.recordMove("West of House", "north", "North of House");

    auto locs = g.locations();
    ASSERT_EQ(locs.size(), 2u);
    EXPECT_EQ(locs[0], "Behind House");
    EXPECT_EQ(locs[1], "West of House");

    auto exits = g.exitsFrom("West of House");
    ASSERT_EQ(exits.size(), 2u);
    EXPECT_EQ(exits[0], "north -> North of House");
    EXPECT_EQ(exits[1], "south -> South of House");

    EXPECT_TRUE(g.exitsFrom("Nowhere").empty());
}

// ─── Rendering ─────────────────────────────────────────────────

TEST(ExplorationTest, RenderEmpty) {
    ExplorationGraph g;
    EXPECT_EQ(g.render("West of House"),
              "Map: No locations explored yet. Try moving around!");
}

TEST(ExplorationTest, RenderReport) {
    ExplorationGraph g;
    g.recordMove("West of House", "north", "North of House");
    g.recordMove("North of House", "east", "Behind House");

    std::string expected =
        "Explored Locations and Exits:\n"
        "\n"
        "* North of House\n"
        "    -> east -> Behind House\n"
        "\n"
        "* West of House\n"
        "    -> north -> North of House\n"
        "\n"
        "[Current] Behind House";
    EXPECT_EQ(g.render("Behind House"), expected);
}
