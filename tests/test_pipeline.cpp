#include <gtest/gtest.h>

#include "fakes.hpp"
#include "pipeline/pipeline.hpp"

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() {
        recognition = FakeRecognitionService::returning("Turn on.", 0.9f);
        deps.wakeBackend = &wake;
        deps.frames      = &frames;
        deps.utterances  = &utterances;
        deps.recognition = recognition;
        deps.bridge      = &bridge;
        deps.feedback    = &feedback;
    }

    AppConfig config;
    ActionRegistry registry;
    FakeWakeBackend wake;
    FakeFrameSource frames;
    FakeUtteranceSource utterances;
    std::shared_ptr<FakeRecognitionService> recognition;
    FakeBridge bridge;
    RecordingFeedback feedback;
    PipelineDeps deps;
};

TEST_F(PipelineTest, WakeWordToLightChange) {
    auto lamp = bridge.add("Desk", false, 120);
    utterances.queue(1600);

    Pipeline pipeline(config, registry, deps);
    EXPECT_FALSE(pipeline.continuous());
    pipeline.start();
    ASSERT_TRUE(pipeline.running());
    EXPECT_EQ(pipeline.health().size(), 5u);

    frames.push(std::vector<int16_t>(512, 7));
    ASSERT_TRUE(waitFor([&] { return feedback.count(Cue::CommandExecuted) == 1; }));
    pipeline.stop();

    EXPECT_TRUE(lamp->on());
    EXPECT_EQ(lamp->writes, std::vector<std::string>{ "on" });
    EXPECT_EQ(recognition->calls.load(), 1);
    EXPECT_EQ(feedback.count(Cue::WakeWord), 1u);
    EXPECT_EQ(feedback.count(Cue::CommandRecognized), 1u);
    EXPECT_TRUE(pipeline.drainErrors().empty());
}

TEST_F(PipelineTest, ContinuousModeSkipsWakeStage) {
    auto lamp = bridge.add("Desk", true, 120);
    recognition = FakeRecognitionService::returning("turn off", 0.95f);
    deps.recognition = recognition;
    deps.wakeBackend = nullptr;
    deps.frames = nullptr;
    utterances.queue(1600);

    Pipeline pipeline(config, registry, deps);
    EXPECT_TRUE(pipeline.continuous());
    pipeline.start();
    EXPECT_EQ(pipeline.health().size(), 4u);

    ASSERT_TRUE(waitFor([&] { return feedback.count(Cue::CommandExecuted) == 1; }));
    pipeline.stop();
    EXPECT_FALSE(lamp->on());
}

TEST_F(PipelineTest, MissingCollaboratorsAreRejected) {
    deps.bridge = nullptr;
    try {
        Pipeline pipeline(config, registry, deps);
        FAIL() << "expected FatalError";
    } catch (const FatalError& e) {
        EXPECT_EQ(e.code(), "ERR_PIPELINE_INCOMPLETE");
    }

    deps.bridge = &bridge;
    deps.frames = nullptr;
    EXPECT_THROW(Pipeline p(config, registry, deps), FatalError);
}

TEST_F(PipelineTest, RestartBuildsFreshStages) {
    Pipeline pipeline(config, registry, deps);
    pipeline.start();
    Dispatcher* first = pipeline.dispatcher();
    ASSERT_NE(first, nullptr);

    pipeline.stop();
    EXPECT_FALSE(pipeline.running());
    EXPECT_EQ(pipeline.dispatcher(), nullptr);
    EXPECT_TRUE(pipeline.health().empty());
    EXPECT_TRUE(pipeline.drainErrors().empty());

    pipeline.start();
    EXPECT_TRUE(pipeline.running());
    ASSERT_NE(pipeline.dispatcher(), nullptr);
    EXPECT_EQ(pipeline.dispatcher()->undoStack().size(), 0u);
    for (const auto& st : pipeline.health()) {
        EXPECT_TRUE(st.alive) << st.name;
        EXPECT_FALSE(st.crashed) << st.name;
    }
    pipeline.stop();
}

TEST_F(PipelineTest, StopCancelsPendingTimers) {
    Pipeline pipeline(config, registry, deps);
    pipeline.start();
    pipeline.dispatcher()->process(Command{ "turn off in 5 minutes", std::chrono::system_clock::now() });
    EXPECT_EQ(pipeline.timers()->pending(), 1u);

    pipeline.stop();
    pipeline.start();
    EXPECT_EQ(pipeline.timers()->pending(), 0u);
    pipeline.stop();
}
