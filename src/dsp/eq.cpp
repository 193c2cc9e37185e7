// dsp/eq.cpp - Multi-band EQ implementation
// HearLoop v1.0.0
//
// Coefficient formulas from the RBJ Audio EQ Cookbook (Robert Bristow-Johnson):
//   https://www.musicdsp.org/files/Audio-EQ-Cookbook.txt
#include "eq.h"

#include <cmath>
#include <algorithm>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace hldsp {

static constexpr float kMinGainDb    = -96.0f;
static constexpr float kMaxGainDb    =  30.0f;
static constexpr float kMinBandwidth =   0.05f;
static constexpr float kMaxBandwidth =   5.0f;
static constexpr float kMinFreqHz    =  10.0f;
static constexpr float kMaxFreqHz    = 24000.0f;
static constexpr float kButterworthQ =   0.70710678f;

const char* eq_filter_type_to_string(EqFilterType t)
{
    switch (t) {
    case EqFilterType::PARAMETRIC: return "parametric";
    case EqFilterType::HIGH_PASS:  return "high_pass";
    case EqFilterType::LOW_PASS:   return "low_pass";
    }
    return "unknown";
}

bool operator==(const EqBandConfig& a, const EqBandConfig& b)
{
    return a.type == b.type && a.freq_hz == b.freq_hz && a.gain_db == b.gain_db
        && a.bandwidth == b.bandwidth && a.bypass == b.bypass;
}

static float clamp_or(float v, float lo, float hi, float fallback)
{
    if (std::isnan(v)) return fallback;
    return std::min(std::max(v, lo), hi);
}

EqBandConfig eq_sanitize_band(const EqBandConfig& cfg)
{
    EqBandConfig out = cfg;
    out.freq_hz   = clamp_or(cfg.freq_hz,   kMinFreqHz,    kMaxFreqHz,    1000.0f);
    out.gain_db   = clamp_or(cfg.gain_db,   kMinGainDb,    kMaxGainDb,    0.0f);
    out.bandwidth = clamp_or(cfg.bandwidth, kMinBandwidth, kMaxBandwidth, 0.5f);
    return out;
}

std::vector<EqBandConfig> eq_default_bands(size_t num_bands)
{
    std::vector<EqBandConfig> bands(num_bands);
    float f = 125.0f;
    for (auto& b : bands) {
        b.type      = EqFilterType::PARAMETRIC;
        b.freq_hz   = std::min(f, 16000.0f);
        b.gain_db   = 0.0f;
        b.bandwidth = 0.5f;
        b.bypass    = false;
        f *= 2.0f;
    }
    return bands;
}

bool eq_band_is_identity(const EqBandConfig& cfg)
{
    return cfg.bypass || (cfg.type == EqFilterType::PARAMETRIC && cfg.gain_db == 0.0f);
}

DspEq::DspEq(size_t num_bands)
    : bands_(eq_default_bands(num_bands))
    , filters_(num_bands)
{
    for (size_t i = 0; i < bands_.size(); i++) recompute(i);
}

void DspEq::set_sample_rate(int sr)
{
    sample_rate_ = (sr > 0) ? sr : 48000;
    for (size_t i = 0; i < bands_.size(); i++) recompute(i);
    reset();
}

bool DspEq::set_band(size_t index, const EqBandConfig& cfg)
{
    if (index >= bands_.size()) return false;

    const EqBandConfig next = eq_sanitize_band(cfg);
    const EqBandConfig& prev = bands_[index];

    // Stale delay-line state from a skipped or differently-shaped filter
    // would ring into the first samples of the new response.
    const bool restart = prev.type != next.type
                      || (eq_band_is_identity(prev) && !eq_band_is_identity(next));

    bands_[index] = next;
    recompute(index);
    if (restart) filters_[index].reset();
    return true;
}

void DspEq::reset()
{
    for (auto& f : filters_) f.reset();
}

void DspEq::process(float* pcm, size_t frames, int channels)
{
    if (!enabled_ || channels < 1 || channels > 2) return;

    for (size_t bi = 0; bi < bands_.size(); bi++) {
        if (eq_band_is_identity(bands_[bi])) continue;
        auto& filt = filters_[bi];
        const int ch = channels;
        for (size_t i = 0; i < frames; i++) {
            pcm[i * ch + 0] = filt.process(pcm[i * ch + 0], 0);
            if (ch == 2)
                pcm[i * ch + 1] = filt.process(pcm[i * ch + 1], 1);
        }
    }
}

// ── RBJ biquad coefficient computation ───────────────────────────────────
void DspEq::recompute(size_t index)
{
    const auto& cfg  = bands_[index];
    auto&       filt = filters_[index];

    const float sr    = static_cast<float>(sample_rate_);
    const float freq  = std::min(cfg.freq_hz, 0.49f * sr);
    const float omega = 2.0f * static_cast<float>(M_PI) * freq / sr;
    const float sin_w = sinf(omega);
    const float cos_w = cosf(omega);

    float b0, b1, b2, a0, a1, a2, alpha;

    switch (cfg.type) {

    case EqFilterType::PARAMETRIC: {
        const float A = powf(10.0f, cfg.gain_db / 40.0f);
        alpha = sin_w * sinhf(logf(2.0f) / 2.0f * cfg.bandwidth * omega / sin_w);
        b0 =  1.0f + alpha * A;
        b1 = -2.0f * cos_w;
        b2 =  1.0f - alpha * A;
        a0 =  1.0f + alpha / A;
        a1 = -2.0f * cos_w;
        a2 =  1.0f - alpha / A;
        break;
    }

    case EqFilterType::HIGH_PASS:
        alpha = sin_w / (2.0f * kButterworthQ);
        b0 =  (1.0f + cos_w) / 2.0f;
        b1 = -(1.0f + cos_w);
        b2 =  (1.0f + cos_w) / 2.0f;
        a0 =   1.0f + alpha;
        a1 =  -2.0f * cos_w;
        a2 =   1.0f - alpha;
        break;

    case EqFilterType::LOW_PASS:
        alpha = sin_w / (2.0f * kButterworthQ);
        b0 =  (1.0f - cos_w) / 2.0f;
        b1 =   1.0f - cos_w;
        b2 =  (1.0f - cos_w) / 2.0f;
        a0 =   1.0f + alpha;
        a1 =  -2.0f * cos_w;
        a2 =   1.0f - alpha;
        break;

    default:
        // Identity
        filt.b0 = 1.0f; filt.b1 = 0.0f; filt.b2 = 0.0f;
        filt.a1 = 0.0f; filt.a2 = 0.0f;
        return;
    }

    // Normalize by a0
    filt.b0 = b0 / a0;
    filt.b1 = b1 / a0;
    filt.b2 = b2 / a0;
    filt.a1 = a1 / a0;
    filt.a2 = a2 / a0;
}

} // namespace hldsp
