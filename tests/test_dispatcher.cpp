#include <gtest/gtest.h>

#include "commands/dispatcher.hpp"
#include "fakes.hpp"

using namespace std::chrono;
using Outcome = Dispatcher::Outcome;

struct DispatcherTest : ::testing::Test {
    AppConfig config;
    ActionRegistry registry;
    FakeBridge bridge;
    RecordingFeedback feedback;
    ManualClock clock;

    EventChannel commands{ 16 };
    EventChannel capture{ 16 };
    ErrorChannel errors{ 16 };
    TimerService timers{ commands, errors, clock };

    std::unique_ptr<Dispatcher> dispatcher;

    void SetUp() override {
        dispatcher = std::make_unique<Dispatcher>(config, registry, bridge, timers, feedback,
                                                  commands, &capture, errors, clock);
    }

    std::vector<Outcome> run(const std::string& text) {
        return dispatcher->process(Command{ text, system_clock::now() });
    }
};

TEST_F(DispatcherTest, MaximumForcesPowerAndRecordsSnapshot) {
    auto a = bridge.add("A", false, std::nullopt);
    auto b = bridge.add("B", true, 200);

    EXPECT_EQ(run("maximum"), std::vector<Outcome>{ Outcome::Executed });

    EXPECT_TRUE(a->on());
    EXPECT_EQ(a->brightness(), 254);
    EXPECT_TRUE(b->on());
    EXPECT_EQ(b->brightness(), 254);

    ASSERT_EQ(dispatcher->undoStack().size(), 1u);
    const UndoEntry& entry = dispatcher->undoStack().top();
    EXPECT_FALSE(entry.at("A").on);
    EXPECT_FALSE(entry.at("A").brightness.has_value());
    EXPECT_TRUE(entry.at("B").on);
    EXPECT_EQ(entry.at("B").brightness, 200);
}

TEST_F(DispatcherTest, ChainRunsInOrderWithOwnSnapshots) {
    auto a = bridge.add("A", false, 100);

    auto outcomes = run("turn on and then dim a little");
    EXPECT_EQ(outcomes, (std::vector<Outcome>{ Outcome::Executed, Outcome::Executed }));

    EXPECT_EQ(a->writes, (std::vector<std::string>{ "on", "bri=75" }));
    ASSERT_EQ(dispatcher->undoStack().size(), 2u);

    // Top snapshot was taken after "turn on" and before "dim"
    EXPECT_TRUE(dispatcher->undoStack().top().at("A").on);
}

TEST_F(DispatcherTest, UndoIsLastInFirstOut) {
    auto a = bridge.add("A", true, 100);

    run("maximum");
    run("dim");
    run("turn off");
    EXPECT_FALSE(a->on());

    EXPECT_EQ(run("undo"), std::vector<Outcome>{ Outcome::Undone });
    EXPECT_TRUE(a->on());
    EXPECT_EQ(a->brightness(), 190);

    run("undo");
    EXPECT_EQ(a->brightness(), 254);

    run("go back");
    EXPECT_TRUE(a->on());
    EXPECT_EQ(a->brightness(), 100);

    EXPECT_EQ(run("undo"), std::vector<Outcome>{ Outcome::NothingToUndo });
    EXPECT_EQ(feedback.count(Cue::Error), 1u);
}

TEST_F(DispatcherTest, PercentIsClamped) {
    auto a = bridge.add("A", false, 10);

    EXPECT_EQ(run("set brightness to 50 percent"), std::vector<Outcome>{ Outcome::BrightnessSet });
    EXPECT_TRUE(a->on());
    EXPECT_EQ(a->brightness(), 127);

    run("150 percent");
    EXPECT_EQ(a->brightness(), 254);

    run("-20 percent");
    EXPECT_EQ(a->brightness(), 1);
}

TEST_F(DispatcherTest, DelayIsScheduledNotExecuted) {
    auto a = bridge.add("A", true, 100);

    EXPECT_EQ(run("in 5 minutes turn off lights"), std::vector<Outcome>{ Outcome::Scheduled });
    EXPECT_TRUE(a->on());
    EXPECT_EQ(bridge.listCalls, 0);
    EXPECT_TRUE(dispatcher->undoStack().empty());
    EXPECT_EQ(timers.pending(), 1u);
    EXPECT_EQ(feedback.notes().size(), 1u);

    clock.advance(seconds(300));
    EXPECT_EQ(timers.poll(), 1u);
    auto ev = commands.tryPop();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(std::get<TimerFired>(*ev).action, "turn off lights");
}

TEST_F(DispatcherTest, FuzzyMatchDispatchesTurnOff) {
    auto a = bridge.add("A", true, 100);

    // "off" is an exact alias, so force the fuzzy path with a typo
    EXPECT_EQ(run("trn of"), std::vector<Outcome>{ Outcome::Executed });
    EXPECT_FALSE(a->on());
}

TEST_F(DispatcherTest, NaturalPhrasingTurnsOff) {
    auto a = bridge.add("A", true, 100);
    EXPECT_EQ(run("turn the lightbulbs off please"), std::vector<Outcome>{ Outcome::Executed });
    EXPECT_FALSE(a->on());
}

TEST_F(DispatcherTest, GibberishIsNotRecognized) {
    auto a = bridge.add("A", true, 100);

    EXPECT_EQ(run("asdkjhasd"), std::vector<Outcome>{ Outcome::NotRecognized });
    EXPECT_TRUE(a->writes.empty());
    EXPECT_TRUE(dispatcher->undoStack().empty());
    EXPECT_EQ(bridge.listCalls, 0);
    EXPECT_EQ(feedback.count(Cue::Error), 1u);
}

TEST_F(DispatcherTest, DeviceErrorInvalidatesCacheAndChainContinues) {
    auto a = bridge.add("A", true, 100);
    a->failWrites = true;

    auto outcomes = run("turn off and then maximum");
    EXPECT_EQ(outcomes, (std::vector<Outcome>{ Outcome::Failed, Outcome::Failed }));
    EXPECT_EQ(bridge.listCalls, 2);

    a->failWrites = false;
    EXPECT_EQ(run("turn off"), std::vector<Outcome>{ Outcome::Executed });
    EXPECT_FALSE(a->on());
}

TEST_F(DispatcherTest, NoDevices) {
    EXPECT_EQ(run("turn on"), std::vector<Outcome>{ Outcome::NoDevices });
    EXPECT_TRUE(dispatcher->undoStack().empty());
}

TEST_F(DispatcherTest, UnreachableBridgeFailsSubCommand) {
    bridge.failList = true;
    EXPECT_EQ(run("turn on"), std::vector<Outcome>{ Outcome::Failed });
    EXPECT_EQ(feedback.count(Cue::Error), 1u);
}

TEST_F(DispatcherTest, HistoryIsBounded) {
    bridge.add("A", true, 100);
    for (int i = 0; i < 12; ++i) run("turn on " + std::to_string(i));

    ASSERT_EQ(dispatcher->history().size(), 10u);
    EXPECT_EQ(dispatcher->history().front(), "turn on 2");
}

TEST_F(DispatcherTest, StageProcessesEventsAndSignalsCooldown) {
    auto a = bridge.add("A", false, 100);
    dispatcher->start();

    commands.tryPush(PipelineEvent{ CommandReady{ Command{ "Turn on.", system_clock::now() } } });
    EXPECT_TRUE(waitFor([&] { return a->on(); }));
    EXPECT_TRUE(waitFor([&] { return capture.size() == 1; }));

    commands.tryPush(PipelineEvent{ TimerFired{ 7, "turn off" } });
    EXPECT_TRUE(waitFor([&] { return !a->on(); }));
    EXPECT_TRUE(waitFor([&] { return capture.size() == 2; }));
    EXPECT_EQ(feedback.count(Cue::Timer), 1u);

    dispatcher->stop();
    auto ev = capture.tryPop();
    ASSERT_TRUE(ev.has_value());
    EXPECT_TRUE(std::holds_alternative<CommandExecuted>(*ev));
}
