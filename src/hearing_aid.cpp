// hearing_aid.cpp - Control facade implementation
// HearLoop v1.0.0
#include "hearing_aid.h"
#include "hl_logger.h"
#include "dsp/profile_mapper.h"

#include <algorithm>
#include <cmath>

using hldsp::AudioProfile;

static float clamp_volume(float v)
{
    if (std::isnan(v)) return 0.0f;
    return std::min(std::max(v, 0.0f), 1.0f);
}

// ---------------------------------------------------------------------------
// HearingAid - constructor / destructor
// ---------------------------------------------------------------------------
HearingAid::HearingAid(std::unique_ptr<AudioDevice> device, const HearingAidConfig& cfg)
    : cfg_(cfg)
    , device_(std::move(device))
    , chain_(cfg.eq_bands)
    , test_(*this)
    , output_volume_(clamp_volume(cfg.output_volume))
{
    test_.set_on_complete([this](const HearingProfile& results) {
        on_test_complete(results);
    });
}

HearingAid::~HearingAid()
{
    stop_audio();
}

// ---------------------------------------------------------------------------
// Audio device
// ---------------------------------------------------------------------------
HlStatus HearingAid::start_audio()
{
    if (!device_) {
        HL_ERR("[aid] No audio device configured");
        return HlStatus::ENGINE_UNAVAILABLE;
    }
    if (device_->is_running()) return HlStatus::OK;

    hldsp::DspChainConfig cc;
    cc.sample_rate  = device_->sample_rate();
    cc.channels     = std::min(std::max(device_->output_channels(), 1), 2);
    chain_.configure(cc);
    chain_.reset();
    tone_.set_sample_rate(device_->sample_rate());

    chain_channels_ = cc.channels;
    work_.assign(kMaxBlockFrames * static_cast<size_t>(cc.channels), 0.0f);

    const bool ok = device_->start([this](const float* in, int in_ch,
                                          float* out, int out_ch, size_t frames) {
        render(in, in_ch, out, out_ch, frames);
    });
    if (!ok) {
        HL_ERR("[aid] Audio device failed to start: " + device_->name());
        return HlStatus::ENGINE_UNAVAILABLE;
    }

    HL_LOG(info, "[aid] Audio active: " << device_->name() << " "
                 << device_->sample_rate() << " Hz, "
                 << chain_.band_count() << " EQ bands");
    return HlStatus::OK;
}

void HearingAid::stop_audio()
{
    if (!device_ || !device_->is_running()) return;

    // The tone sink is going away; a running test cannot continue
    if (test_.cancel() == HlStatus::OK)
        HL_WARN("[aid] Hearing test cancelled: audio stopped");

    device_->stop();
    HL_INFO("[aid] Audio stopped");
}

bool HearingAid::is_audio_active() const
{
    return device_ && device_->is_running();
}

// ---------------------------------------------------------------------------
// Hearing test
// ---------------------------------------------------------------------------
HlStatus HearingAid::start_test()
{
    return test_.start();
}

HlStatus HearingAid::record_response(bool heard)
{
    return test_.record_response(heard);
}

HlStatus HearingAid::cancel_test()
{
    return test_.cancel();
}

void HearingAid::on_test_complete(const HearingProfile& results)
{
    save_hearing_profile(results);
    if (cfg_.auto_apply_profile) {
        map_profile(results);
        HL_INFO("[aid] Hearing profile applied to EQ");
    }
}

// Audiogram -> EQ in one publish; an active low-band cut stays on top
void HearingAid::map_profile(const HearingProfile& profile)
{
    const bool nr = noise_reduction();
    chain_.update_settings([&profile, nr](hldsp::ChainSettings& s) {
        s.bands = hldsp::eq_bands_for_profile(profile, s.bands);
        if (nr && !s.bands.empty())
            s.bands[0].gain_db = hldsp::kNoiseReductionGainDb;
    });
}

// ---------------------------------------------------------------------------
// Test tone
// ---------------------------------------------------------------------------
HlStatus HearingAid::play_test_tone(float frequency_hz, float level_db_hl)
{
    if (!is_audio_active()) {
        HL_WARN("[aid] Cannot play tone: audio not running");
        return HlStatus::ENGINE_UNAVAILABLE;
    }
    start_tone(frequency_hz, level_db_hl);
    return HlStatus::OK;
}

HlStatus HearingAid::stop_test_tone()
{
    silence_tone();
    test_.tone_interrupted();
    return HlStatus::OK;
}

void HearingAid::start_tone(float frequency_hz, float level_db_hl)
{
    const float amp = hldsp::dbhl_to_amplitude(level_db_hl);

    std::lock_guard<std::mutex> lk(tone_mtx_);
    // Restart the sine at zero phase only when the pitch changes; level
    // steps at the same frequency stay phase-continuous.
    const bool new_pitch = frequency_hz != last_tone_hz_;
    tone_.set_tone(frequency_hz, amp, new_pitch);
    last_tone_hz_ = frequency_hz;

    HL_LOG(debug, "[aid] Tone " << frequency_hz << " Hz, " << level_db_hl
                  << " dB HL, amplitude " << amp);
}

bool HearingAid::tone_available() const
{
    return is_audio_active();
}

void HearingAid::present_tone(int frequency_hz, float level_db_hl)
{
    start_tone(static_cast<float>(frequency_hz), level_db_hl);
}

void HearingAid::silence_tone()
{
    tone_.set_amplitude(0.0f);
}

// ---------------------------------------------------------------------------
// Effect chain
// ---------------------------------------------------------------------------
HlStatus HearingAid::apply_profile(const HearingProfile& profile)
{
    if (!is_audio_active()) return HlStatus::ENGINE_UNAVAILABLE;

    save_hearing_profile(profile);
    map_profile(profile);
    HL_INFO("[aid] Applied hearing profile: " + hearing_profile_to_string(profile));
    return HlStatus::OK;
}

HlStatus HearingAid::apply_hearing_profile()
{
    HearingProfile p = hearing_profile();
    if (p.empty()) {
        HL_WARN("[aid] No hearing profile stored");
        return HlStatus::INVALID_STATE;
    }
    return apply_profile(p);
}

HlStatus HearingAid::apply_preset(AudioProfile profile)
{
    if (!is_audio_active()) return HlStatus::ENGINE_UNAVAILABLE;

    chain_.apply_preset(profile);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        preset_ = profile;
    }
    HL_INFO(std::string("[aid] Audio profile set to ") + hldsp::audio_profile_to_string(profile));
    hllog.session("PRESET", hldsp::audio_profile_to_string(profile));
    return HlStatus::OK;
}

void HearingAid::set_master_gain(float gain_db)
{
    hldsp::apply_master_gain(chain_, gain_db);
}

float HearingAid::master_gain() const
{
    return chain_.dynamics().master_gain_db;
}

void HearingAid::set_noise_reduction(bool enabled)
{
    hldsp::apply_noise_reduction(chain_, enabled);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        noise_reduction_ = enabled;
    }
    HL_LOG(info, "[aid] Noise reduction " << (enabled ? "enabled" : "disabled")
                 << ", low band gain " << chain_.band(0).gain_db << " dB");
}

bool HearingAid::noise_reduction() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return noise_reduction_;
}

void HearingAid::set_output_volume(float volume)
{
    output_volume_.store(clamp_volume(volume), std::memory_order_relaxed);
}

AudioProfile HearingAid::selected_preset() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return preset_;
}

// ---------------------------------------------------------------------------
// Session profile
// ---------------------------------------------------------------------------
HearingProfile HearingAid::hearing_profile() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return profile_;
}

void HearingAid::save_hearing_profile(const HearingProfile& profile)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        profile_ = profile;
    }
    hllog.session("PROFILE", hearing_profile_to_string(profile));
}

// ---------------------------------------------------------------------------
// render - audio thread
// ---------------------------------------------------------------------------
void HearingAid::render(const float* in, int in_channels,
                        float* out, int out_channels, size_t frames)
{
    if (!out || out_channels < 1) return;

    const int   cch  = chain_channels_;
    const float vol  = output_volume_.load(std::memory_order_relaxed);
    size_t      done = 0;

    while (done < frames) {
        const size_t n = std::min(frames - done, kMaxBlockFrames);

        // Fan capture channels out to the chain's channel layout
        for (size_t i = 0; i < n; i++) {
            for (int c = 0; c < cch; c++) {
                float s = 0.0f;
                if (in && in_channels > 0) {
                    const int src = std::min(c, in_channels - 1);
                    s = in[(done + i) * in_channels + src];
                }
                work_[i * cch + c] = s;
            }
        }

        chain_.process(work_.data(), n);
        tone_.render_mix(work_.data(), n, cch);

        for (size_t i = 0; i < n; i++) {
            for (int c = 0; c < out_channels; c++) {
                const int src = std::min(c, cch - 1);
                float s = work_[i * cch + src] * vol;
                if (s >  1.0f) s =  1.0f;
                if (s < -1.0f) s = -1.0f;
                out[(done + i) * out_channels + c] = s;
            }
        }
        done += n;
    }
}
