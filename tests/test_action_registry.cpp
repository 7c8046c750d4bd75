#include <gtest/gtest.h>

#include "commands/action_registry.hpp"

TEST(ActionRegistry, DefaultTableHasHandlersForLightActions) {
    ActionRegistry registry;
    for (const char* action : { "turn on", "turn off", "dim", "brighten", "maximum", "minimum" }) {
        const ActionEntry* entry = registry.find(action);
        ASSERT_NE(entry, nullptr) << action;
        EXPECT_EQ(entry->phrases.front(), action);
        EXPECT_TRUE(static_cast<bool>(entry->handler));
    }
    EXPECT_EQ(registry.find("undo"), nullptr);
    EXPECT_EQ(registry.find("brightness"), nullptr);
}

TEST(ActionRegistry, ExactMatchByAlias) {
    ActionRegistry registry;
    auto m = registry.matchExact("switch off the kitchen");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry->action, "turn off");
    EXPECT_EQ(m->phrase, "switch off");
    EXPECT_EQ(m->score, 100);
}

TEST(ActionRegistry, LongestPhraseWins) {
    ActionRegistry registry;
    // "on" and "turn on" both match; the longer phrase decides
    auto m = registry.matchExact("turn on the lights");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry->action, "turn on");
    EXPECT_EQ(m->phrase, "turn on");

    auto max = registry.matchExact("max brightness please");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(max->entry->action, "maximum");
}

TEST(ActionRegistry, ExactMatchNeedsWholeWords) {
    ActionRegistry registry;
    EXPECT_FALSE(registry.matchExact("office").has_value());
    EXPECT_FALSE(registry.matchExact("what time is it").has_value());
}

TEST(ActionRegistry, FuzzyMatchAboveThreshold) {
    ActionRegistry registry;
    auto m = registry.matchFuzzy("brigten", 70);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry->action, "brighten");
    EXPECT_GT(m->score, 70);
}

TEST(ActionRegistry, FuzzyMatchRejectsGibberish) {
    ActionRegistry registry;
    EXPECT_FALSE(registry.matchFuzzy("asdkjhasd", 70).has_value());
}

TEST(ActionRegistry, UndoPhrases) {
    ActionRegistry registry;
    EXPECT_TRUE(registry.isUndo("undo"));
    EXPECT_TRUE(registry.isUndo("please go back"));
    EXPECT_TRUE(registry.isUndo("revert that"));
    EXPECT_FALSE(registry.isUndo("turn off"));
}

TEST(ActionRegistry, CustomAliasGroups) {
    std::vector<AliasGroup> groups = {
        { "turn off", { "lights out" } },
        { "undo", { "oops" } },
        { "party", { "disco" } }
    };
    ActionRegistry registry(groups);

    EXPECT_EQ(registry.entries().size(), 1u);
    auto m = registry.matchExact("lights out");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry->action, "turn off");

    EXPECT_TRUE(registry.isUndo("oops"));
    EXPECT_FALSE(registry.isUndo("revert"));
    EXPECT_FALSE(registry.matchExact("disco").has_value());
}
