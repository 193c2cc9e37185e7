// test_hearing_test.cpp - Ascending-limits threshold search
#include <gtest/gtest.h>
#include "hearing_test.h"

#include <vector>

namespace {

struct Presentation {
    int   frequency_hz;
    float level_db;
};

class FakeToneSink : public ToneSink {
public:
    bool available = true;
    bool tone_on   = false;
    std::vector<Presentation> presented;

    bool tone_available() const override { return available; }
    void present_tone(int hz, float db) override
    {
        presented.push_back({ hz, db });
        tone_on = true;
    }
    void silence_tone() override { tone_on = false; }
};

class HearingTestFixture : public ::testing::Test {
protected:
    FakeToneSink sink;
    HearingTest  test{ sink };

    // Answers "not heard" until the level reaches heard_at, then "heard".
    // A heard_at above 90 runs the frequency out to the not-heard sentinel.
    void answer_at(float heard_at)
    {
        const size_t before = test.status().completed;
        while (test.status().completed == before && test.status().level_db < heard_at)
            ASSERT_EQ(test.record_response(false), HlStatus::OK);
        if (test.status().completed == before)
            ASSERT_EQ(test.record_response(true), HlStatus::OK);
    }
};

TEST_F(HearingTestFixture, StartsIdle) {
    EXPECT_EQ(test.state(), HearingTest::State::IDLE);
    EXPECT_EQ(test.status().phase, HearingTest::Phase::IDLE);
    EXPECT_TRUE(test.results().empty());
}

TEST_F(HearingTestFixture, FirstToneAt125HzLevel30) {
    ASSERT_EQ(test.start(), HlStatus::OK);

    HearingTest::Status st = test.status();
    EXPECT_EQ(st.phase, HearingTest::Phase::PLAYING_TONE);
    EXPECT_EQ(st.frequency_hz, 125);
    EXPECT_EQ(st.level_db, 30.0f);
    ASSERT_EQ(sink.presented.size(), 1u);
    EXPECT_EQ(sink.presented[0].frequency_hz, 125);
    EXPECT_EQ(sink.presented[0].level_db, 30.0f);
    EXPECT_TRUE(sink.tone_on);
}

TEST_F(HearingTestFixture, HeardAfterThreeMissesRecords45) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    for (int i = 0; i < 3; i++) ASSERT_EQ(test.record_response(false), HlStatus::OK);
    EXPECT_EQ(test.status().level_db, 45.0f);
    ASSERT_EQ(test.record_response(true), HlStatus::OK);

    EXPECT_EQ(test.results().at(125), 45.0f);
    HearingTest::Status st = test.status();
    EXPECT_EQ(st.frequency_hz, 250);
    EXPECT_EQ(st.level_db, 30.0f);
    EXPECT_EQ(st.completed, 1u);
}

TEST_F(HearingTestFixture, NotHeardSentinelAfterThirteenMisses) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    for (size_t i = 0; i + 1 < kTestFrequencies.size(); i++)
        ASSERT_EQ(test.record_response(true), HlStatus::OK);
    ASSERT_EQ(test.status().frequency_hz, 8000);

    for (int i = 0; i < 12; i++) {
        ASSERT_EQ(test.record_response(false), HlStatus::OK);
        ASSERT_EQ(test.state(), HearingTest::State::RUNNING) << "call " << i + 1;
    }
    EXPECT_EQ(test.status().level_db, 90.0f);

    // 13th miss would need 95 dB: commit the sentinel and finish
    ASSERT_EQ(test.record_response(false), HlStatus::OK);
    EXPECT_EQ(test.state(), HearingTest::State::COMPLETE);
    EXPECT_EQ(test.results().at(8000), kNotHeardThreshold);

    // Further responses are rejected, nothing else changes
    for (int i = 0; i < 4; i++)
        EXPECT_EQ(test.record_response(false), HlStatus::INVALID_STATE);
    EXPECT_EQ(test.results().at(8000), kNotHeardThreshold);
}

TEST_F(HearingTestFixture, LevelsAscendInFiveDbSteps) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    for (int i = 0; i < 20 && test.status().frequency_hz == 125; i++)
        test.record_response(false);

    std::vector<float> levels;
    for (const auto& p : sink.presented)
        if (p.frequency_hz == 125) levels.push_back(p.level_db);

    ASSERT_EQ(levels.size(), 13u);
    for (size_t i = 1; i < levels.size(); i++)
        EXPECT_EQ(levels[i] - levels[i - 1], 5.0f);
    EXPECT_EQ(levels.back(), 90.0f);
}

TEST_F(HearingTestFixture, CompletedRunCoversEveryFrequency) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    const float heard_at[] = { 30, 45, 90, 55, 30, 70, 999 };
    for (float h : heard_at) answer_at(h);

    ASSERT_EQ(test.state(), HearingTest::State::COMPLETE);
    EXPECT_EQ(test.status().phase, HearingTest::Phase::COMPLETE);
    EXPECT_FALSE(sink.tone_on);

    HearingProfile r = test.results();
    ASSERT_EQ(r.size(), kTestFrequencies.size());
    for (int f : kTestFrequencies) {
        ASSERT_EQ(r.count(f), 1u) << f;
        const float v = r.at(f);
        EXPECT_TRUE((v >= 0.0f && v <= 90.0f) || v == kNotHeardThreshold) << f << " " << v;
    }
    EXPECT_EQ(r.at(500), 90.0f);
    EXPECT_EQ(r.at(8000), kNotHeardThreshold);
}

TEST_F(HearingTestFixture, CompletionCallbackGetsResults) {
    HearingProfile got;
    int calls = 0;
    test.set_on_complete([&](const HearingProfile& p) { got = p; calls++; });

    ASSERT_EQ(test.start(), HlStatus::OK);
    for (size_t i = 0; i < kTestFrequencies.size(); i++) answer_at(30.0f);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(got, test.results());
    // Callback runs without the engine lock held
    EXPECT_EQ(test.state(), HearingTest::State::COMPLETE);
}

TEST_F(HearingTestFixture, CancelThenFreshStart) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    answer_at(40.0f);
    answer_at(50.0f);
    test.record_response(false);

    ASSERT_EQ(test.cancel(), HlStatus::OK);
    EXPECT_EQ(test.state(), HearingTest::State::IDLE);
    EXPECT_TRUE(test.results().empty());
    EXPECT_FALSE(sink.tone_on);

    ASSERT_EQ(test.start(), HlStatus::OK);
    HearingTest::Status st = test.status();
    EXPECT_EQ(st.frequency_index, 0u);
    EXPECT_EQ(st.frequency_hz, 125);
    EXPECT_EQ(st.level_db, 30.0f);
    EXPECT_EQ(st.completed, 0u);
    EXPECT_TRUE(test.results().empty());
}

TEST_F(HearingTestFixture, InvalidStateTransitions) {
    EXPECT_EQ(test.record_response(true), HlStatus::INVALID_STATE);
    EXPECT_EQ(test.cancel(), HlStatus::INVALID_STATE);

    ASSERT_EQ(test.start(), HlStatus::OK);
    EXPECT_EQ(test.start(), HlStatus::INVALID_STATE);
    EXPECT_EQ(test.status().frequency_hz, 125);
}

TEST_F(HearingTestFixture, RestartAfterCompleteOverwritesResults) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    for (size_t i = 0; i < kTestFrequencies.size(); i++) answer_at(60.0f);
    ASSERT_EQ(test.state(), HearingTest::State::COMPLETE);

    ASSERT_EQ(test.start(), HlStatus::OK);
    EXPECT_TRUE(test.results().empty());
    answer_at(35.0f);
    EXPECT_EQ(test.results().at(125), 35.0f);
    EXPECT_EQ(test.results().count(250), 0u);
}

TEST_F(HearingTestFixture, StartRequiresAudio) {
    sink.available = false;
    EXPECT_EQ(test.start(), HlStatus::ENGINE_UNAVAILABLE);
    EXPECT_EQ(test.state(), HearingTest::State::IDLE);
    EXPECT_TRUE(sink.presented.empty());
}

TEST_F(HearingTestFixture, InterruptedToneAwaitsResponse) {
    ASSERT_EQ(test.start(), HlStatus::OK);
    sink.silence_tone();
    test.tone_interrupted();
    EXPECT_EQ(test.status().phase, HearingTest::Phase::AWAITING_RESPONSE);

    // A response still counts and replays the next level
    ASSERT_EQ(test.record_response(false), HlStatus::OK);
    EXPECT_EQ(test.status().phase, HearingTest::Phase::PLAYING_TONE);
    EXPECT_EQ(test.status().level_db, 35.0f);
}

} // namespace
