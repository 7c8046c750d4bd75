#include <gtest/gtest.h>

#include "fakes.hpp"
#include "wake/wake_detector.hpp"

using std::chrono::milliseconds;

// ------------------------------------------------------------
// Backend selection
// ------------------------------------------------------------
TEST(WakeBackend, KeywordFileLookup) {
    WakeConfig config;
    config.keywordDir = "/opt/wake";
    EXPECT_EQ(Wake::keywordFile(config, "jarvis"), "/opt/wake/jarvis.ppn");

    config.keywordPath = "/home/me/hey_lumen.ppn";
    EXPECT_EQ(Wake::keywordFile(config, "philips"), "/home/me/hey_lumen.ppn");
    EXPECT_EQ(Wake::keywordFile(config, "jarvis"), "/opt/wake/jarvis.ppn");
}

TEST(WakeBackend, FallsBackToNextKeyword) {
    WakeConfig config;
    std::vector<std::string> tried;

    auto backend = Wake::createBackend(config,
        [&](const std::string& keyword, const std::string&, float) -> std::unique_ptr<Wake::Backend> {
            tried.push_back(keyword);
            if (keyword == "philips") throw ServiceError("ERR_WAKE_INIT", "model missing");
            return std::make_unique<FakeWakeBackend>(keyword);
        });

    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->keyword(), "jarvis");
    EXPECT_EQ(tried, (std::vector<std::string>{ "philips", "jarvis" }));
}

TEST(WakeBackend, PassesSensitivityThrough) {
    WakeConfig config;
    config.sensitivity = 0.8f;
    float seen = 0.0f;

    Wake::createBackend(config, [&](const std::string& keyword, const std::string&, float s) {
        seen = s;
        return std::make_unique<FakeWakeBackend>(keyword);
    });
    EXPECT_FLOAT_EQ(seen, 0.8f);
}

TEST(WakeBackend, NothingAvailableIsFatal) {
    WakeConfig config;
    int attempts = 0;

    try {
        Wake::createBackend(config, [&](const std::string&, const std::string&, float)
                                        -> std::unique_ptr<Wake::Backend> {
            ++attempts;
            throw ServiceError("ERR_WAKE_INIT", "no access key");
        });
        FAIL() << "expected FatalError";
    } catch (const FatalError& e) {
        EXPECT_EQ(e.code(), "ERR_WAKE_UNAVAILABLE");
    }
    EXPECT_EQ(attempts, 1 + static_cast<int>(config.fallbackKeywords.size()));
}

// ------------------------------------------------------------
// Detector stage
// ------------------------------------------------------------
class WakeDetectorTest : public ::testing::Test {
protected:
    FakeWakeBackend backend;
    FakeFrameSource frames;
    RecordingFeedback feedback;
    EventChannel out{ 4 };
    ErrorChannel errors{ 4 };
};

TEST_F(WakeDetectorTest, EmitsEventAndCueOnMatch) {
    WakeDetector detector(backend, frames, feedback, out, errors);
    frames.push(std::vector<int16_t>(512, 0));
    frames.push(std::vector<int16_t>(512, 7));
    detector.start();

    ASSERT_TRUE(waitFor([&] { return out.size() == 1; }));
    detector.stop();

    EXPECT_EQ(backend.frames.load(), 2);
    EXPECT_EQ(detector.detections(), 1u);
    EXPECT_EQ(feedback.count(Cue::WakeWord), 1u);

    auto ev = out.tryPop();
    auto* wake = std::get_if<WakeDetected>(&*ev);
    ASSERT_NE(wake, nullptr);
    EXPECT_EQ(wake->keywordIndex, 0);
}

TEST_F(WakeDetectorTest, FullChannelDropsDetection) {
    EventChannel tiny{ 1 };
    WakeDetector detector(backend, frames, feedback, tiny, errors);
    frames.push(std::vector<int16_t>(512, 7));
    frames.push(std::vector<int16_t>(512, 7));
    detector.start();

    ASSERT_TRUE(waitFor([&] { return detector.detections() == 2; }));
    detector.stop();
    EXPECT_EQ(tiny.size(), 1u);
    EXPECT_FALSE(detector.crashed());
}

TEST_F(WakeDetectorTest, FrameErrorIsReportedAndDetectionContinues) {
    WakeDetector detector(backend, frames, feedback, out, errors);
    backend.failNext = true;
    frames.push(std::vector<int16_t>(512, 7));
    frames.push(std::vector<int16_t>(512, 7));
    detector.start();

    ASSERT_TRUE(waitFor([&] { return out.size() == 1; }));
    detector.stop();

    EXPECT_FALSE(detector.crashed());
    auto err = errors.tryPop();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::Service);
    EXPECT_EQ(err->code, "ERR_WAKE_FRAME");
    EXPECT_EQ(err->source, "WakeDetector");
}
