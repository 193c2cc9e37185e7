// dsp/dynamics.h - Compressor / downward expander / ceiling limiter
// HearLoop v1.0.0
#pragma once

#include <atomic>
#include <cstddef>

namespace hldsp {

struct DynamicsConfig {
    // Compression threshold in dBFS (gain reduction starts here)
    float threshold_db           = -20.0f;
    // Extra dB above threshold before the hard ceiling (ceiling <= 0 dBFS)
    float headroom_db            =   5.0f;
    // Attack / release times in seconds
    float attack_sec             =   0.001f;
    float release_sec            =   0.05f;
    // Compression ratio (e.g. 4.0 = 4:1)
    float compression_ratio      =   6.0f;
    // Post-compression makeup gain (dB)
    float master_gain_db         =   0.0f;
    // Downward expansion below expansion_threshold_db (1.0 = off)
    float expansion_ratio        =   1.0f;
    float expansion_threshold_db = -100.0f;
};

bool operator==(const DynamicsConfig& a, const DynamicsConfig& b);
inline bool operator!=(const DynamicsConfig& a, const DynamicsConfig& b) { return !(a == b); }

// Clamp every field into its legal range.
DynamicsConfig dynamics_sanitize(const DynamicsConfig& cfg);

// ---------------------------------------------------------------------------
// DspDynamics - feedforward peak compressor; owned by the audio thread
// ---------------------------------------------------------------------------
class DspDynamics {
public:
    DspDynamics() { update_coeffs(); }

    void set_config(const DynamicsConfig& cfg) { cfg_ = dynamics_sanitize(cfg); update_coeffs(); }
    const DynamicsConfig& config() const { return cfg_; }

    void set_sample_rate(int sr)  { sample_rate_ = (sr > 0) ? sr : 48000; update_coeffs(); }
    void set_enabled(bool on)     { enabled_ = on; }
    bool is_enabled()       const { return enabled_; }

    // Process interleaved PCM in-place (1 or 2 channels)
    void process(float* pcm, size_t frames, int channels);

    // Static gain curve in dB for a given input peak in dBFS (makeup included,
    // ceiling excluded). Exposed for tests and metering.
    float static_gain_db(float level_db) const;

    // Current gain reduction in dB; safe to read from the control thread
    float gain_reduction_db() const { return gain_reduction_db_.load(std::memory_order_relaxed); }

    // Reset gain state (call on discontinuity / startup)
    void reset()  { gain_lin_ = 1.0f; gain_reduction_db_.store(0.0f, std::memory_order_relaxed); }

private:
    DynamicsConfig cfg_;
    bool      enabled_           = true;
    int       sample_rate_       = 48000;
    float     gain_lin_          = 1.0f;    // current smoothed gain
    float     attack_coeff_      = 0.0f;
    float     release_coeff_     = 0.0f;
    float     ceiling_lin_       = 1.0f;
    std::atomic<float> gain_reduction_db_{0.0f};

    void update_coeffs();
};

} // namespace hldsp
