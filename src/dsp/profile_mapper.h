// dsp/profile_mapper.h - Hearing profile / preset -> chain parameters
// HearLoop v1.0.0
//
// The mapping functions are pure: they take the current settings and return
// new ones. The apply_* helpers push the result into a DspChain in a single
// publish.
#pragma once

#include "dsp_chain.h"
#include "../hearing_profile.h"

#include <vector>

namespace hldsp {

// Largest boost the audiogram mapping will apply to one band (dB)
constexpr float kMaxProfileGainDb   = 30.0f;
// Bandwidth (octaves) of the audiogram bands
constexpr float kProfileBandwidth   = 0.5f;
// Calibration range for the tone test (dB HL)
constexpr float kMinHearingLevelDb  = 0.0f;
constexpr float kMaxHearingLevelDb  = 90.0f;
// Gain of the lowest band when noise reduction is on (dB)
constexpr float kNoiseReductionGainDb = -15.0f;

// Band i <- kTestFrequencies[i], gain = clamp(threshold, 0, 30) dB or 0 dB
// when the profile has no entry. Positional: a chain with fewer bands is
// truncated, bands past the last test frequency keep their current values.
std::vector<EqBandConfig> eq_bands_for_profile(const HearingProfile& profile,
                                               const std::vector<EqBandConfig>& current);

// Standard / VoiceIsolation / WideSpectrum applied on top of current.
ChainSettings preset_settings(AudioProfile profile, const ChainSettings& current);

// 90 dB HL = full scale (1.0); 0 dB HL = 10^-4.5. Input clamped to [0, 90].
float dbhl_to_amplitude(float db_hl);

// Convenience wrappers issuing one chain update each
void apply_hearing_profile(DspChain& chain, const HearingProfile& profile);
void apply_noise_reduction(DspChain& chain, bool enabled);
void apply_master_gain    (DspChain& chain, float gain_db);

} // namespace hldsp
