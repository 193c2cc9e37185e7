// test_profile_mapper.cpp - Audiogram / preset -> chain parameters
#include <gtest/gtest.h>
#include "dsp/profile_mapper.h"

#include <cmath>

using namespace hldsp;

namespace {

TEST(ProfileMapper, SingleFrequencyMapsToItsBandOnly) {
    HearingProfile profile = { { 1000, 40.0f } };
    auto bands = eq_bands_for_profile(profile, eq_default_bands(7));

    ASSERT_EQ(bands.size(), 7u);
    for (size_t i = 0; i < bands.size(); i++) {
        EXPECT_EQ(bands[i].freq_hz, static_cast<float>(kTestFrequencies[i]));
        EXPECT_EQ(bands[i].bandwidth, 0.5f);
        EXPECT_EQ(bands[i].type, EqFilterType::PARAMETRIC);
        EXPECT_FALSE(bands[i].bypass);
        EXPECT_EQ(bands[i].gain_db, i == 3 ? 30.0f : 0.0f) << "band " << i;
    }
}

TEST(ProfileMapper, GainClampedToZeroThroughThirty) {
    HearingProfile profile = {
        { 125, -10.0f }, { 250, 0.0f }, { 500, 12.5f }, { 8000, kNotHeardThreshold },
    };
    auto bands = eq_bands_for_profile(profile, eq_default_bands(7));
    EXPECT_EQ(bands[0].gain_db, 0.0f);
    EXPECT_EQ(bands[1].gain_db, 0.0f);
    EXPECT_EQ(bands[2].gain_db, 12.5f);
    EXPECT_EQ(bands[6].gain_db, 30.0f);
}

TEST(ProfileMapper, OverridesPresetShapes) {
    ChainSettings s;
    s.bands = eq_default_bands(7);
    s = preset_settings(AudioProfile::VOICE_ISOLATION, s);

    auto bands = eq_bands_for_profile({}, s.bands);
    for (const auto& b : bands) {
        EXPECT_EQ(b.type, EqFilterType::PARAMETRIC);
        EXPECT_FALSE(b.bypass);
        EXPECT_EQ(b.gain_db, 0.0f);
    }
}

TEST(ProfileMapper, FewerBandsTruncate) {
    HearingProfile profile = { { 125, 20.0f }, { 8000, 25.0f } };
    auto bands = eq_bands_for_profile(profile, eq_default_bands(3));
    ASSERT_EQ(bands.size(), 3u);
    EXPECT_EQ(bands[0].gain_db, 20.0f);
    EXPECT_EQ(bands[2].freq_hz, 500.0f);
}

TEST(ProfileMapper, ExtraBandsKeepTheirValues) {
    auto current = eq_default_bands(9);
    current[8].gain_db = -4.0f;
    current[8].bypass  = true;

    auto bands = eq_bands_for_profile({ { 1000, 10.0f } }, current);
    ASSERT_EQ(bands.size(), 9u);
    EXPECT_EQ(bands[7], current[7]);
    EXPECT_EQ(bands[8], current[8]);
}

TEST(ProfileMapper, AmplitudeAtNinetyIsFullScale) {
    EXPECT_EQ(dbhl_to_amplitude(90.0f), 1.0f);
    EXPECT_NEAR(dbhl_to_amplitude(0.0f), std::pow(10.0f, -4.5f), 1e-9f);
}

TEST(ProfileMapper, AmplitudeMonotonic) {
    float prev = dbhl_to_amplitude(0.0f);
    for (float db = 5.0f; db <= 90.0f; db += 5.0f) {
        const float a = dbhl_to_amplitude(db);
        EXPECT_GT(a, prev) << db;
        prev = a;
    }
}

TEST(ProfileMapper, AmplitudeClampIsIdempotent) {
    EXPECT_EQ(dbhl_to_amplitude(120.0f), dbhl_to_amplitude(90.0f));
    EXPECT_EQ(dbhl_to_amplitude(-15.0f), dbhl_to_amplitude(0.0f));
    EXPECT_EQ(dbhl_to_amplitude(999.0f), 1.0f);
}

TEST(ProfileMapper, StandardPresetBypassesAndNeutralises) {
    ChainSettings s;
    s.bands = eq_default_bands(7);
    s.bands[2].gain_db = 6.0f;
    s.dynamics.compression_ratio = 8.0f;

    ChainSettings out = preset_settings(AudioProfile::STANDARD, s);
    for (const auto& b : out.bands) EXPECT_TRUE(b.bypass);
    EXPECT_EQ(out.dynamics.threshold_db, 0.0f);
    EXPECT_EQ(out.dynamics.master_gain_db, 0.0f);
    // Untouched by the preset
    EXPECT_EQ(out.dynamics.compression_ratio, 8.0f);
    EXPECT_EQ(out.bands[2].gain_db, 6.0f);
}

TEST(ProfileMapper, WideSpectrumIsFlatAndActive) {
    ChainSettings s;
    s.bands = eq_default_bands(7);
    s.bands[0].type    = EqFilterType::HIGH_PASS;
    s.bands[4].bypass  = true;
    s.bands[5].gain_db = 12.0f;

    ChainSettings out = preset_settings(AudioProfile::WIDE_SPECTRUM, s);
    for (const auto& b : out.bands) {
        EXPECT_EQ(b.type, EqFilterType::PARAMETRIC);
        EXPECT_FALSE(b.bypass);
        EXPECT_EQ(b.gain_db, 0.0f);
        EXPECT_EQ(b.bandwidth, 1.0f);
    }
    EXPECT_EQ(out.dynamics.threshold_db, 0.0f);
    EXPECT_EQ(out.dynamics.master_gain_db, 0.0f);
}

TEST(ProfileMapper, VoiceIsolationBandPass) {
    ChainSettings s;
    s.bands = eq_default_bands(7);
    ChainSettings out = preset_settings(AudioProfile::VOICE_ISOLATION, s);

    EXPECT_EQ(out.bands[0].type, EqFilterType::HIGH_PASS);
    EXPECT_EQ(out.bands[0].freq_hz, 150.0f);
    EXPECT_FALSE(out.bands[0].bypass);
    EXPECT_EQ(out.bands[1].type, EqFilterType::LOW_PASS);
    EXPECT_EQ(out.bands[1].freq_hz, 6000.0f);
    EXPECT_FALSE(out.bands[1].bypass);
    for (size_t i = 2; i < out.bands.size(); i++) EXPECT_TRUE(out.bands[i].bypass);

    EXPECT_EQ(out.dynamics.threshold_db, -20.0f);
    EXPECT_EQ(out.dynamics.compression_ratio, 3.0f);
    EXPECT_EQ(out.dynamics.master_gain_db, 2.0f);
}

TEST(ProfileMapper, VoiceIsolationNeedsTwoBands) {
    ChainSettings s;
    s.bands = eq_default_bands(1);
    ChainSettings out = preset_settings(AudioProfile::VOICE_ISOLATION, s);
    EXPECT_EQ(out.bands[0], s.bands[0]);
    EXPECT_EQ(out.dynamics.compression_ratio, 3.0f);
}

TEST(ProfileMapper, NoiseReductionCutsLowestBand) {
    DspChain chain(7);
    apply_noise_reduction(chain, true);
    EXPECT_EQ(chain.band(0).gain_db, kNoiseReductionGainDb);
    apply_noise_reduction(chain, false);
    EXPECT_EQ(chain.band(0).gain_db, 0.0f);
}

TEST(ProfileMapper, MasterGainClamped) {
    DspChain chain(7);
    apply_master_gain(chain, 6.0f);
    EXPECT_EQ(chain.dynamics().master_gain_db, 6.0f);
    apply_master_gain(chain, 50.0f);
    EXPECT_EQ(chain.dynamics().master_gain_db, 20.0f);
    apply_master_gain(chain, -200.0f);
    EXPECT_EQ(chain.dynamics().master_gain_db, -90.0f);
}

TEST(ProfileMapper, ApplyHearingProfilePushesBands) {
    DspChain chain(7);
    apply_hearing_profile(chain, { { 2000, 25.0f } });
    EXPECT_EQ(chain.band(4).gain_db, 25.0f);
    EXPECT_EQ(chain.band(4).freq_hz, 2000.0f);
    EXPECT_EQ(chain.band(3).gain_db, 0.0f);
}

TEST(ProfileMapper, FullBoostReachesTheChain) {
    DspChain chain(7);
    apply_hearing_profile(chain, { { 1000, 40.0f } });
    EXPECT_EQ(chain.band(3).gain_db, kMaxProfileGainDb);
    for (size_t i = 0; i < chain.band_count(); i++) {
        if (i != 3) EXPECT_EQ(chain.band(i).gain_db, 0.0f) << "band " << i;
        EXPECT_EQ(chain.band(i).bandwidth, kProfileBandwidth);
        EXPECT_FALSE(chain.band(i).bypass);
    }

    // Direct band writes accept the same ceiling
    EqBandConfig b;
    b.gain_db = kMaxProfileGainDb;
    ASSERT_EQ(chain.set_band(0, b), HlStatus::OK);
    EXPECT_EQ(chain.band(0).gain_db, kMaxProfileGainDb);
}

} // namespace
