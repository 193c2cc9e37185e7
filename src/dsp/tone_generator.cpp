// dsp/tone_generator.cpp - Continuous-phase sine source
// HearLoop v1.0.0
#include "tone_generator.h"

#include <cmath>
#include <algorithm>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace hldsp {

static constexpr double kTwoPi    = 2.0 * M_PI;
static constexpr float  kMinToneHz = 1.0f;

DspToneGenerator::DspToneGenerator(int sample_rate)
    : sample_rate_(sample_rate > 0 ? sample_rate : 48000)
{
}

void DspToneGenerator::set_sample_rate(int sr)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    sample_rate_ = (sr > 0) ? sr : 48000;
    staging_.frequency_hz = clamp_frequency(staging_.frequency_hz);
    publish_locked();
}

float DspToneGenerator::clamp_frequency(float hz) const
{
    const float nyquist = 0.5f * static_cast<float>(sample_rate_);
    if (std::isnan(hz)) return kMinToneHz;
    return std::min(std::max(hz, kMinToneHz), nyquist);
}

static float clamp_amplitude(float a)
{
    if (std::isnan(a)) return 0.0f;
    return std::min(std::max(a, 0.0f), 1.0f);
}

void DspToneGenerator::set_frequency(float hz)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.frequency_hz = clamp_frequency(hz);
    publish_locked();
}

void DspToneGenerator::set_amplitude(float linear)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.amplitude = clamp_amplitude(linear);
    publish_locked();
}

void DspToneGenerator::set_tone(float hz, float linear, bool reset_phase)
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.frequency_hz = clamp_frequency(hz);
    staging_.amplitude    = clamp_amplitude(linear);
    if (reset_phase) staging_.reset_seq++;
    publish_locked();
}

void DspToneGenerator::reset()
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    staging_.reset_seq++;
    publish_locked();
}

ToneParams DspToneGenerator::params() const
{
    std::lock_guard<std::mutex> lk(ctl_mtx_);
    return staging_;
}

void DspToneGenerator::publish_locked()
{
    shared_.write_buffer() = staging_;
    shared_.publish();
}

const ToneParams& DspToneGenerator::begin_block()
{
    shared_.update();
    const ToneParams& p = shared_.read_buffer();
    if (p.reset_seq != seen_reset_) {
        seen_reset_ = p.reset_seq;
        phase_      = 0.0;
    }
    return p;
}

void DspToneGenerator::render(float* out, size_t frames)
{
    const ToneParams& p   = begin_block();
    const double      inc = kTwoPi * p.frequency_hz / static_cast<double>(sample_rate_);

    for (size_t i = 0; i < frames; i++) {
        out[i] = p.amplitude * static_cast<float>(std::sin(phase_));
        phase_ += inc;
        if (phase_ >= kTwoPi) phase_ -= kTwoPi;
    }
}

void DspToneGenerator::render_mix(float* pcm, size_t frames, int channels)
{
    const ToneParams& p   = begin_block();
    const double      inc = kTwoPi * p.frequency_hz / static_cast<double>(sample_rate_);
    const int         ch  = channels;

    for (size_t i = 0; i < frames; i++) {
        const float s = p.amplitude * static_cast<float>(std::sin(phase_));
        for (int c = 0; c < ch; c++) pcm[i * ch + c] += s;
        phase_ += inc;
        if (phase_ >= kTwoPi) phase_ -= kTwoPi;
    }
}

} // namespace hldsp
