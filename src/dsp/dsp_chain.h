// dsp/dsp_chain.h - Master DSP processing chain
// HearLoop v1.0.0
//
// Processing order per audio buffer:
//   [Input PCM float32] -> Dynamics -> EQ -> [Output]
// Dynamics gain reduction happens before the EQ boost, so a hearing-profile
// lift is never squashed by the compressor.
//
// Threading: every setter runs on a control thread and edits a staging copy
// of ChainSettings, then publishes the whole copy. process() runs on the audio
// thread and adopts the newest published copy at the start of each block.
#pragma once

#include "eq.h"
#include "dynamics.h"
#include "triple_buffer.h"
#include "../hl_status.h"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hldsp {

// ── Named presets ─────────────────────────────────────────────────────────
enum class AudioProfile { STANDARD, VOICE_ISOLATION, WIDE_SPECTRUM };

const char* audio_profile_to_string(AudioProfile p);

// Accepts "standard", "voice_isolation", "wide_spectrum" (and the short
// forms "voice" / "wide"). Returns false for anything else.
bool audio_profile_from_string(const std::string& name, AudioProfile& out);

// ── Complete parameter set for one chain ──────────────────────────────────
struct ChainSettings {
    std::vector<EqBandConfig> bands;
    DynamicsConfig            dynamics;
    bool                      eq_enabled       = true;
    bool                      dynamics_enabled = true;
};

struct DspChainConfig {
    int    sample_rate = 48000;
    int    channels    = 2;      // 1 or 2
};

// ---------------------------------------------------------------------------
// DspChain - owns EQ + dynamics; band count fixed at construction
// ---------------------------------------------------------------------------
class DspChain {
public:
    explicit DspChain(size_t num_bands = DspEq::kDefaultBands);

    // (Re)configure sample rate / channel count. Not while process() runs.
    void configure(const DspChainConfig& cfg);
    const DspChainConfig& config() const { return cfg_; }

    // ── Control thread ─────────────────────────────────────────────────────
    HlStatus set_band(size_t index, const EqBandConfig& band);
    void     set_dynamics(const DynamicsConfig& params);
    void     apply_preset(AudioProfile profile);
    void     bypass_all(bool bypass);

    // Read-modify-write of the staging copy under the control lock, then
    // one publish. fn must not call back into this chain.
    void     update_settings(const std::function<void(ChainSettings&)>& fn);

    void     set_eq_enabled(bool on);
    void     set_dynamics_enabled(bool on);

    size_t         band_count() const { return num_bands_; }
    EqBandConfig   band(size_t index) const;
    DynamicsConfig dynamics() const;
    ChainSettings  settings() const;

    float gain_reduction_db() const { return dynamics_.gain_reduction_db(); }

    // ── Audio thread ───────────────────────────────────────────────────────
    // Process one interleaved PCM buffer in-place: dynamics -> EQ
    void process(float* pcm, size_t frames);

    // Clear filter / envelope state (call with audio stopped)
    void reset();

private:
    const size_t   num_bands_;
    DspChainConfig cfg_;

    mutable std::mutex          ctl_mtx_;
    ChainSettings               staging_;
    TripleBuffer<ChainSettings> shared_;

    // Audio-thread state
    DspEq       eq_;
    DspDynamics dynamics_;

    void publish_locked();
    void adopt(const ChainSettings& s);
};

} // namespace hldsp
