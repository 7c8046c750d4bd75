#include <gtest/gtest.h>

#include "voice/recognizer.hpp"
#include "fakes.hpp"

using namespace std::chrono;

struct RecognizerTest : ::testing::Test {
    RecognitionConfig config;
    RecordingFeedback feedback;
    EventChannel in{ 4 };
    EventChannel out{ 4 };
    ErrorChannel errors{ 8 };

    std::unique_ptr<Recognizer> make(std::shared_ptr<RecognitionService> service) {
        return std::make_unique<Recognizer>(config, std::move(service), feedback, in, out, errors);
    }
};

TEST_F(RecognizerTest, AcceptedTranscriptIsNormalized) {
    auto rec = make(FakeRecognitionService::returning("  Turn Off The Lights. ", 0.92f));

    auto t = rec->handle(makeClip());
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->text, "turn off the lights");
    EXPECT_FLOAT_EQ(t->confidence, 0.92f);
    EXPECT_EQ(feedback.count(Cue::CommandRecognized), 1u);
    EXPECT_TRUE(errors.empty());
}

TEST_F(RecognizerTest, LowConfidenceAndDuplicatesAreDroppedSilently) {
    auto low = make(FakeRecognitionService::returning("dim", 0.5f));
    EXPECT_FALSE(low->handle(makeClip()).has_value());

    auto rec = make(FakeRecognitionService::returning("dim", 0.9f));
    EXPECT_TRUE(rec->handle(makeClip()).has_value());
    EXPECT_FALSE(rec->handle(makeClip()).has_value());

    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(feedback.count(Cue::Error), 0u);
}

TEST_F(RecognizerTest, ServiceErrorIsEscalated) {
    auto rec = make(std::make_shared<FakeRecognitionService>([](const AudioClip&) -> RecognitionResult {
        throw ServiceError("ERR_RECOGNITION_UNAVAILABLE", "connection refused");
    }));

    EXPECT_FALSE(rec->handle(makeClip()).has_value());
    auto err = errors.tryPop();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::Service);
    EXPECT_EQ(err->code, "ERR_RECOGNITION_UNAVAILABLE");
    EXPECT_EQ(err->source, "Recognizer");
    EXPECT_EQ(feedback.count(Cue::Error), 1u);
}

TEST_F(RecognizerTest, UnintelligibleAudioIsNotEscalated) {
    auto rec = make(std::make_shared<FakeRecognitionService>([](const AudioClip&) -> RecognitionResult {
        throw PerceptionError("ERR_AUDIO_UNINTELLIGIBLE", "nothing heard");
    }));

    EXPECT_FALSE(rec->handle(makeClip()).has_value());
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(feedback.count(Cue::Error), 1u);
}

TEST_F(RecognizerTest, SlowServiceIsAbandoned) {
    config.timeoutMs = 50;
    auto rec = make(std::make_shared<FakeRecognitionService>([](const AudioClip&) {
        std::this_thread::sleep_for(milliseconds(300));
        return RecognitionResult{ { RecognitionAlternative{ "turn on", 0.99f } } };
    }));

    auto started = steady_clock::now();
    EXPECT_FALSE(rec->handle(makeClip()).has_value());
    EXPECT_LT(steady_clock::now() - started, milliseconds(250));

    auto err = errors.tryPop();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, "ERR_RECOGNITION_TIMEOUT");
}

TEST_F(RecognizerTest, OnlyOneAbandonedAttemptRunsAtATime) {
    config.timeoutMs = 20;
    std::atomic<int> running{ 0 };
    std::atomic<int> peak{ 0 };
    auto service = std::make_shared<FakeRecognitionService>([&](const AudioClip&) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(milliseconds(200));
        --running;
        return RecognitionResult{ { RecognitionAlternative{ "turn on", 0.99f } } };
    });

    {
        auto rec = make(service);
        for (int i = 0; i < 10; i++) {
            EXPECT_FALSE(rec->handle(makeClip()).has_value());
        }
        EXPECT_EQ(service->calls.load(), 1);
        EXPECT_EQ(peak.load(), 1);

        std::size_t busy = 0;
        while (auto err = errors.tryPop()) {
            if (err->code == "ERR_RECOGNITION_BUSY") ++busy;
        }
        EXPECT_EQ(busy, 7u);   // capacity 8, first slot holds the timeout

        // Once the abandoned attempt finishes, new clips go through again
        ASSERT_TRUE(waitFor([&] { return running.load() == 0; }));
        EXPECT_FALSE(rec->handle(makeClip()).has_value());
        EXPECT_EQ(service->calls.load(), 2);
    }

    // Destruction waits for the worker instead of leaving it behind
    EXPECT_EQ(running.load(), 0);
}

TEST_F(RecognizerTest, StageTurnsAudioIntoCommands) {
    auto service = FakeRecognitionService::returning("Brighten", 0.8f);
    auto rec = make(service);
    rec->start();

    in.tryPush(PipelineEvent{ AudioReady{ makeClip() } });
    ASSERT_TRUE(waitFor([&] { return out.size() == 1; }));
    rec->stop();

    auto ev = out.tryPop();
    ASSERT_TRUE(ev.has_value());
    auto* ready = std::get_if<CommandReady>(&*ev);
    ASSERT_NE(ready, nullptr);
    EXPECT_EQ(ready->command.rawText, "brighten");
    EXPECT_EQ(service->calls.load(), 1);
}
