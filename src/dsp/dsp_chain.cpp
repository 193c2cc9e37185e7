// dsp/dsp_chain.cpp - Master DSP chain orchestrator
// HearLoop v1.0.0
#include "dsp_chain.h"
#include "profile_mapper.h"

#include <algorithm>
#include <utility>

namespace hldsp {

const char* audio_profile_to_string(AudioProfile p)
{
    switch (p) {
    case AudioProfile::STANDARD:        return "standard";
    case AudioProfile::VOICE_ISOLATION: return "voice_isolation";
    case AudioProfile::WIDE_SPECTRUM:   return "wide_spectrum";
    }
    return "unknown";
}

bool audio_profile_from_string(const std::string& name, AudioProfile& out)
{
    if (name == "standard")                          { out = AudioProfile::STANDARD;        return true; }
    if (name == "voice_isolation" || name == "voice") { out = AudioProfile::VOICE_ISOLATION; return true; }
    if (name == "wide_spectrum"   || name == "wide")  { out = AudioProfile::WIDE_SPECTRUM;   return true; }
    return false;
}

static ChainSettings initial_settings(size_t num_bands)
{
    ChainSettings s;
    s.bands = eq_default_bands(num_bands);
    return s;
}

DspChain::DspChain(size_t num_bands)
    : num_bands_(num_bands)
    , staging_(initial_settings(num_bands))
    , shared_(staging_)
    , eq_(num_bands)
{
    adopt(staging_);
}

void DspChain::configure(const DspChainConfig& cfg)
{
    cfg_ = cfg;
    cfg_.channels = std::min(std::max(cfg.channels, 1), 2);

    eq_.set_sample_rate(cfg_.sample_rate);
    dynamics_.set_sample_rate(cfg_.sample_rate);
    dynamics_.reset();
}

// ---------------------------------------------------------------------------
// Control thread
// ---------------------------------------------------------------------------
HlStatus DspChain::set_band(size_t index, const EqBandConfig& band)
{
    if (index >= num_bands_) return HlStatus::INDEX_OUT_OF_RANGE;

    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.bands[index] = eq_sanitize_band(band);
    publish_locked();
    return HlStatus::OK;
}

void DspChain::set_dynamics(const DynamicsConfig& params)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.dynamics = dynamics_sanitize(params);
    publish_locked();
}

void DspChain::apply_preset(AudioProfile profile)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_ = preset_settings(profile, staging_);
    publish_locked();
}

void DspChain::bypass_all(bool bypass)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    for (auto& b : staging_.bands) b.bypass = bypass;
    publish_locked();
}

void DspChain::update_settings(const std::function<void(ChainSettings&)>& fn)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    ChainSettings next = staging_;
    fn(next);
    next.bands.resize(num_bands_, EqBandConfig{});
    for (auto& b : next.bands) b = eq_sanitize_band(b);
    next.dynamics = dynamics_sanitize(next.dynamics);
    staging_ = std::move(next);
    publish_locked();
}

void DspChain::set_eq_enabled(bool on)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.eq_enabled = on;
    publish_locked();
}

void DspChain::set_dynamics_enabled(bool on)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.dynamics_enabled = on;
    publish_locked();
}

EqBandConfig DspChain::band(size_t index) const
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    return index < num_bands_ ? staging_.bands[index] : EqBandConfig{};
}

DynamicsConfig DspChain::dynamics() const
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    return staging_.dynamics;
}

ChainSettings DspChain::settings() const
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    return staging_;
}

void DspChain::publish_locked()
{
    // Same-length vector assignment: no reallocation on either side
    shared_.write_buffer() = staging_;
    shared_.publish();
}

// ---------------------------------------------------------------------------
// Audio thread
// ---------------------------------------------------------------------------
void DspChain::adopt(const ChainSettings& s)
{
    for (size_t i = 0; i < num_bands_; i++) {
        if (eq_.get_band(i) != s.bands[i])
            eq_.set_band(i, s.bands[i]);
    }
    if (dynamics_.config() != s.dynamics)
        dynamics_.set_config(s.dynamics);

    eq_.set_enabled(s.eq_enabled);
    dynamics_.set_enabled(s.dynamics_enabled);
}

void DspChain::process(float* pcm, size_t frames)
{
    if (shared_.update())
        adopt(shared_.read_buffer());

    // Dynamics -> EQ
    dynamics_.process(pcm, frames, cfg_.channels);
    eq_.process(pcm, frames, cfg_.channels);
}

void DspChain::reset()
{
    eq_.reset();
    dynamics_.reset();
}

} // namespace hldsp
