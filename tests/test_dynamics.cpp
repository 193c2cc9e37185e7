// test_dynamics.cpp - Compressor / expander static curve and envelope
#include <gtest/gtest.h>
#include "dsp/dynamics.h"

#include <cmath>
#include <vector>

using namespace hldsp;

namespace {

TEST(Dynamics, DefaultsMatchHearingAidTuning) {
    DynamicsConfig d;
    EXPECT_EQ(d.threshold_db, -20.0f);
    EXPECT_EQ(d.headroom_db, 5.0f);
    EXPECT_EQ(d.attack_sec, 0.001f);
    EXPECT_EQ(d.release_sec, 0.05f);
    EXPECT_EQ(d.compression_ratio, 6.0f);
    EXPECT_EQ(d.master_gain_db, 0.0f);
    EXPECT_EQ(d.expansion_ratio, 1.0f);
    EXPECT_EQ(d.expansion_threshold_db, -100.0f);
}

TEST(Dynamics, UnityBelowThreshold) {
    DspDynamics dyn;
    EXPECT_FLOAT_EQ(dyn.static_gain_db(-30.0f), 0.0f);
    EXPECT_FLOAT_EQ(dyn.static_gain_db(-20.0f), 0.0f);
}

TEST(Dynamics, ReductionAboveThreshold) {
    DynamicsConfig c;
    c.threshold_db      = -20.0f;
    c.compression_ratio = 4.0f;
    DspDynamics dyn;
    dyn.set_config(c);

    // 12 dB over at 4:1 leaves 3 dB over: 9 dB of reduction
    EXPECT_NEAR(dyn.static_gain_db(-8.0f), -9.0f, 1e-4f);
}

TEST(Dynamics, MakeupGainAddsEverywhere) {
    DynamicsConfig c;
    c.master_gain_db = 6.0f;
    DspDynamics dyn;
    dyn.set_config(c);
    EXPECT_NEAR(dyn.static_gain_db(-40.0f), 6.0f, 1e-4f);
}

TEST(Dynamics, ExpanderCutsBelowItsThreshold) {
    DynamicsConfig c;
    c.expansion_ratio        = 2.0f;
    c.expansion_threshold_db = -60.0f;
    DspDynamics dyn;
    dyn.set_config(c);

    EXPECT_NEAR(dyn.static_gain_db(-70.0f), -10.0f, 1e-4f);
    EXPECT_NEAR(dyn.static_gain_db(-50.0f), 0.0f, 1e-4f);
}

TEST(Dynamics, SanitizeClampsRanges) {
    DynamicsConfig c;
    c.compression_ratio = 0.5f;
    c.master_gain_db    = 200.0f;
    c.attack_sec        = -1.0f;
    c.threshold_db      = std::nanf("");
    DynamicsConfig s = dynamics_sanitize(c);
    EXPECT_EQ(s.compression_ratio, 1.0f);
    EXPECT_EQ(s.master_gain_db, 20.0f);
    EXPECT_GT(s.attack_sec, 0.0f);
    EXPECT_EQ(s.threshold_db, -20.0f);
}

TEST(Dynamics, QuietSignalPassesUnchanged) {
    DspDynamics dyn;
    dyn.set_sample_rate(48000);

    // -40 dBFS square wave, well under the -20 dB threshold
    std::vector<float> pcm(4800);
    for (size_t i = 0; i < pcm.size(); i++) pcm[i] = (i & 1) ? 0.01f : -0.01f;
    dyn.process(pcm.data(), pcm.size(), 1);

    EXPECT_NEAR(pcm.back(), 0.01f, 1e-5f);
    EXPECT_NEAR(dyn.gain_reduction_db(), 0.0f, 0.01f);
}

TEST(Dynamics, LoudSignalIsCompressedAndCeilinged) {
    DynamicsConfig c;
    c.threshold_db      = -20.0f;
    c.headroom_db       = 5.0f;
    c.compression_ratio = 6.0f;
    DspDynamics dyn;
    dyn.set_config(c);
    dyn.set_sample_rate(48000);

    // 0 dBFS: static curve asks for about -16.7 dB
    std::vector<float> pcm(48000);
    for (size_t i = 0; i < pcm.size(); i++) pcm[i] = (i & 1) ? 1.0f : -1.0f;
    dyn.process(pcm.data(), pcm.size(), 1);

    const float ceiling = std::pow(10.0f, -15.0f / 20.0f);
    for (float s : pcm) EXPECT_LE(std::fabs(s), ceiling + 1e-6f);
    EXPECT_GT(dyn.gain_reduction_db(), 15.0f);
    EXPECT_NEAR(std::fabs(pcm.back()), std::pow(10.0f, dyn.static_gain_db(0.0f) / 20.0f), 1e-3f);
}

TEST(Dynamics, DisabledIsBypass) {
    DspDynamics dyn;
    dyn.set_enabled(false);
    std::vector<float> pcm(64, 0.9f);
    dyn.process(pcm.data(), pcm.size(), 1);
    for (float s : pcm) EXPECT_EQ(s, 0.9f);
}

} // namespace
