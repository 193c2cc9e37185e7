// dsp/tone_generator.h - Continuous-phase sine source for the hearing test
// HearLoop v1.0.0
//
// Control thread: set_frequency / set_amplitude / set_tone / reset.
// Audio thread:   render / render_mix, once per block.
//
// Frequency and amplitude travel together in one snapshot, so the audio
// thread never sees a half-updated pair. Phase belongs to the audio thread;
// reset() only bumps a sequence number that the next block picks up.
#pragma once

#include "triple_buffer.h"

#include <cstddef>
#include <cstdint>
#include <mutex>

namespace hldsp {

struct ToneParams {
    float    frequency_hz = 1000.0f;
    float    amplitude    = 0.0f;      // linear, 0..1
    uint32_t reset_seq    = 0;         // phase reset request counter
};

class DspToneGenerator {
public:
    explicit DspToneGenerator(int sample_rate = 48000);

    // Must not be called while render() is running on another thread.
    void set_sample_rate(int sr);
    int  sample_rate() const { return sample_rate_; }

    // ── Control thread ─────────────────────────────────────────────────────
    void set_frequency(float hz);
    void set_amplitude(float linear);
    // Frequency + amplitude (+ optional phase reset) in one snapshot
    void set_tone(float hz, float linear, bool reset_phase = false);
    void reset();

    ToneParams params() const;

    // ── Audio thread ───────────────────────────────────────────────────────
    // Overwrite out[0..frames) with the mono tone.
    void render(float* out, size_t frames);

    // Add the tone to every channel of an interleaved buffer.
    void render_mix(float* pcm, size_t frames, int channels);

    // Current phase in radians; only meaningful on the audio thread.
    double phase() const { return phase_; }

private:
    int sample_rate_;

    mutable std::mutex      ctl_mtx_;     // control-side writers only
    ToneParams              staging_;
    TripleBuffer<ToneParams> shared_;

    // Audio-thread state
    double   phase_        = 0.0;
    uint32_t seen_reset_   = 0;

    float clamp_frequency(float hz) const;
    void  publish_locked();
    const ToneParams& begin_block();
};

} // namespace hldsp
