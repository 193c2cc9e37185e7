// dsp/dynamics.cpp - Compressor / expander / limiter implementation
// HearLoop v1.0.0
//
// Algorithm: feedforward peak detection, static curve (expander below
// expansion threshold, compressor above threshold, makeup gain), gain
// smoothing with separate attack/release envelopes, hard ceiling at
// min(threshold + headroom, 0) dBFS.
#include "dynamics.h"

#include <cmath>
#include <algorithm>

namespace hldsp {

// Time constant: 1 - exp(-2.2 / (time_s * sample_rate))
// This gives -60 dB in time_s seconds.
static float time_const(float time_s, float sr)
{
    if (time_s <= 0.0f || sr <= 0.0f) return 1.0f;
    return 1.0f - expf(-2.2f / (time_s * sr));
}

static float clamp_or(float v, float lo, float hi, float fallback)
{
    if (std::isnan(v)) return fallback;
    return std::min(std::max(v, lo), hi);
}

bool operator==(const DynamicsConfig& a, const DynamicsConfig& b)
{
    return a.threshold_db == b.threshold_db
        && a.headroom_db == b.headroom_db
        && a.attack_sec == b.attack_sec
        && a.release_sec == b.release_sec
        && a.compression_ratio == b.compression_ratio
        && a.master_gain_db == b.master_gain_db
        && a.expansion_ratio == b.expansion_ratio
        && a.expansion_threshold_db == b.expansion_threshold_db;
}

DynamicsConfig dynamics_sanitize(const DynamicsConfig& cfg)
{
    const DynamicsConfig d;
    DynamicsConfig out;
    out.threshold_db           = clamp_or(cfg.threshold_db,           -40.0f,   20.0f, d.threshold_db);
    out.headroom_db            = clamp_or(cfg.headroom_db,              0.1f,   40.0f, d.headroom_db);
    out.attack_sec             = clamp_or(cfg.attack_sec,            0.0001f,    0.2f, d.attack_sec);
    out.release_sec            = clamp_or(cfg.release_sec,             0.01f,    3.0f, d.release_sec);
    out.compression_ratio      = clamp_or(cfg.compression_ratio,        1.0f,   50.0f, d.compression_ratio);
    out.master_gain_db         = clamp_or(cfg.master_gain_db,         -90.0f,   20.0f, d.master_gain_db);
    out.expansion_ratio        = clamp_or(cfg.expansion_ratio,          1.0f,   50.0f, d.expansion_ratio);
    out.expansion_threshold_db = clamp_or(cfg.expansion_threshold_db, -120.0f,    0.0f, d.expansion_threshold_db);
    return out;
}

void DspDynamics::update_coeffs()
{
    const float sr = static_cast<float>(sample_rate_);
    attack_coeff_  = time_const(cfg_.attack_sec,  sr);
    release_coeff_ = time_const(cfg_.release_sec, sr);
    const float ceiling_db = std::min(cfg_.threshold_db + cfg_.headroom_db, 0.0f);
    ceiling_lin_   = powf(10.0f, ceiling_db / 20.0f);
}

float DspDynamics::static_gain_db(float level_db) const
{
    float gain_db = cfg_.master_gain_db;

    if (level_db > cfg_.threshold_db) {
        const float over_db = level_db - cfg_.threshold_db;
        gain_db -= over_db * (1.0f - 1.0f / cfg_.compression_ratio);
    } else if (level_db < cfg_.expansion_threshold_db && cfg_.expansion_ratio > 1.0f) {
        const float under_db = cfg_.expansion_threshold_db - level_db;
        gain_db -= under_db * (cfg_.expansion_ratio - 1.0f);
    }
    return gain_db;
}

void DspDynamics::process(float* pcm, size_t frames, int channels)
{
    if (!enabled_ || channels < 1 || channels > 2) return;

    const int   ch       = channels;
    const float makeup   = powf(10.0f, cfg_.master_gain_db / 20.0f);

    for (size_t i = 0; i < frames; i++) {
        // Peak detect across all channels for this sample frame
        float peak = 0.0f;
        for (int c = 0; c < ch; c++) {
            float s = fabsf(pcm[i * ch + c]);
            if (s > peak) peak = s;
        }

        // Silence: hold makeup only, the expander has nothing to act on
        const float desired = (peak < 1e-9f)
                            ? makeup
                            : powf(10.0f, static_gain_db(20.0f * log10f(peak)) / 20.0f);

        // Smooth with attack (gain falling) or release (gain rising)
        const float coeff = (desired < gain_lin_) ? attack_coeff_ : release_coeff_;
        gain_lin_ += coeff * (desired - gain_lin_);

        // Apply gain + hard ceiling
        for (int c = 0; c < ch; c++) {
            float s = pcm[i * ch + c] * gain_lin_;
            if (s >  ceiling_lin_) s =  ceiling_lin_;
            if (s < -ceiling_lin_) s = -ceiling_lin_;
            pcm[i * ch + c] = s;
        }
    }

    // Metering value: reduction relative to the makeup level
    gain_reduction_db_.store(20.0f * log10f(makeup / (gain_lin_ + 1e-9f)),
                             std::memory_order_relaxed);
}

} // namespace hldsp
