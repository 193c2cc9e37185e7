// dsp/eq.h - Fixed-size multi-band EQ (RBJ Audio EQ Cookbook biquad IIR)
// HearLoop v1.0.0
#pragma once

#include <cstddef>
#include <vector>

namespace hldsp {

// ── Biquad filter (direct form I, 2-channel state) ────────────────────────
struct Biquad {
    // Normalized coefficients (a0 = 1 absorbed)
    float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
    float              a1 = 0.0f, a2 = 0.0f;

    // Delay-line state, separate per channel (0=L, 1=R)
    float x1[2] = {}, x2[2] = {};
    float y1[2] = {}, y2[2] = {};

    inline float process(float x, int ch)
    {
        float y = b0*x + b1*x1[ch] + b2*x2[ch] - a1*y1[ch] - a2*y2[ch];
        x2[ch] = x1[ch]; x1[ch] = x;
        y2[ch] = y1[ch]; y1[ch] = y;
        return y;
    }

    void reset()
    {
        for (int c = 0; c < 2; c++) x1[c] = x2[c] = y1[c] = y2[c] = 0.0f;
    }
};

// ── Band type ─────────────────────────────────────────────────────────────
// HIGH_PASS / LOW_PASS are 2nd-order Butterworth; bandwidth only shapes
// PARAMETRIC bands.
enum class EqFilterType { PARAMETRIC, HIGH_PASS, LOW_PASS };

const char* eq_filter_type_to_string(EqFilterType t);

struct EqBandConfig {
    EqFilterType type      = EqFilterType::PARAMETRIC;
    float        freq_hz   = 1000.0f;   // center / corner frequency (Hz)
    float        gain_db   = 0.0f;      // -96 .. +30 dB
    float        bandwidth = 0.5f;      // octaves, 0.05 .. 5.0
    bool         bypass    = false;
};

bool operator==(const EqBandConfig& a, const EqBandConfig& b);
inline bool operator!=(const EqBandConfig& a, const EqBandConfig& b) { return !(a == b); }

// Clamp every field into its legal range (NaN falls back to the default).
EqBandConfig eq_sanitize_band(const EqBandConfig& cfg);

// Default band layout: octave spacing from 125 Hz, parametric, 0 dB, 0.5 oct.
std::vector<EqBandConfig> eq_default_bands(size_t num_bands);

// ---------------------------------------------------------------------------
// DspEq - band count fixed at construction; owned by the audio thread
// ---------------------------------------------------------------------------
class DspEq {
public:
    static constexpr size_t kDefaultBands = 7;

    explicit DspEq(size_t num_bands = kDefaultBands);

    void set_sample_rate(int sr);
    int  sample_rate() const { return sample_rate_; }

    // Returns false when index >= band_count().
    bool set_band(size_t index, const EqBandConfig& cfg);
    const EqBandConfig& get_band(size_t index) const { return bands_[index]; }
    size_t band_count() const { return bands_.size(); }

    void set_enabled(bool on) { enabled_ = on; }
    bool is_enabled()   const { return enabled_; }

    // Process interleaved PCM in-place (1 or 2 channels)
    void process(float* pcm, size_t frames, int channels);

    void reset();

    // Coefficients for inspection in tests
    const Biquad& filter(size_t index) const { return filters_[index]; }

private:
    int  sample_rate_ = 48000;
    bool enabled_     = true;

    std::vector<EqBandConfig> bands_;
    std::vector<Biquad>       filters_;

    void recompute(size_t index);
};

// True when the band leaves the signal untouched and can be skipped.
bool eq_band_is_identity(const EqBandConfig& cfg);

} // namespace hldsp
