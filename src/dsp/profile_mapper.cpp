// dsp/profile_mapper.cpp - Hearing profile / preset mapping
// HearLoop v1.0.0
#include "profile_mapper.h"

#include <cmath>
#include <algorithm>

namespace hldsp {

std::vector<EqBandConfig> eq_bands_for_profile(const HearingProfile& profile,
                                               const std::vector<EqBandConfig>& current)
{
    std::vector<EqBandConfig> bands = current;
    const size_t n = std::min(bands.size(), kTestFrequencies.size());

    for (size_t i = 0; i < n; i++) {
        const int freq = kTestFrequencies[i];
        auto& b = bands[i];

        b.type      = EqFilterType::PARAMETRIC;
        b.freq_hz   = static_cast<float>(freq);
        b.bandwidth = kProfileBandwidth;
        b.bypass    = false;

        // Higher threshold = more loss = more boost, capped
        auto it = profile.find(freq);
        b.gain_db = (it != profile.end())
                  ? std::min(std::max(it->second, 0.0f), kMaxProfileGainDb)
                  : 0.0f;
    }
    return bands;
}

ChainSettings preset_settings(AudioProfile profile, const ChainSettings& current)
{
    ChainSettings s = current;

    switch (profile) {

    case AudioProfile::STANDARD:
        // Flat passthrough, neutral dynamics
        for (auto& b : s.bands) b.bypass = true;
        s.dynamics.threshold_db   = 0.0f;
        s.dynamics.master_gain_db = 0.0f;
        break;

    case AudioProfile::WIDE_SPECTRUM:
        // Flat but active: a baseline for manual tuning
        for (auto& b : s.bands) {
            b.type      = EqFilterType::PARAMETRIC;
            b.bypass    = false;
            b.gain_db   = 0.0f;
            b.bandwidth = 1.0f;
        }
        s.dynamics.threshold_db   = 0.0f;
        s.dynamics.master_gain_db = 0.0f;
        break;

    case AudioProfile::VOICE_ISOLATION:
        // Speech band-pass 150 Hz .. 6 kHz, needs two bands
        if (s.bands.size() >= 2) {
            auto& hp = s.bands[0];
            hp.type      = EqFilterType::HIGH_PASS;
            hp.bypass    = false;
            hp.freq_hz   = 150.0f;
            hp.bandwidth = 0.5f;

            auto& lp = s.bands[1];
            lp.type      = EqFilterType::LOW_PASS;
            lp.bypass    = false;
            lp.freq_hz   = 6000.0f;
            lp.bandwidth = 0.5f;

            for (size_t i = 2; i < s.bands.size(); i++) s.bands[i].bypass = true;
        }
        s.dynamics.threshold_db      = -20.0f;
        s.dynamics.compression_ratio =   3.0f;
        s.dynamics.master_gain_db    =   2.0f;
        break;
    }
    return s;
}

float dbhl_to_amplitude(float db_hl)
{
    if (std::isnan(db_hl)) db_hl = kMinHearingLevelDb;
    const float clamped = std::min(std::max(db_hl, kMinHearingLevelDb), kMaxHearingLevelDb);
    return powf(10.0f, (clamped - kMaxHearingLevelDb) / 20.0f);
}

void apply_hearing_profile(DspChain& chain, const HearingProfile& profile)
{
    chain.update_settings([&profile](ChainSettings& s) {
        s.bands = eq_bands_for_profile(profile, s.bands);
    });
}

void apply_noise_reduction(DspChain& chain, bool enabled)
{
    chain.update_settings([enabled](ChainSettings& s) {
        if (!s.bands.empty())
            s.bands[0].gain_db = enabled ? kNoiseReductionGainDb : 0.0f;
    });
}

void apply_master_gain(DspChain& chain, float gain_db)
{
    chain.update_settings([gain_db](ChainSettings& s) {
        s.dynamics.master_gain_db = gain_db;
    });
}

} // namespace hldsp
