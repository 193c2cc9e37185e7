// hearing_aid.h - Control facade: audio device, effect chain, hearing test
// HearLoop v1.0.0
//
// Live path (audio thread):
//   [mic] -> Dynamics -> EQ -> (+ test tone) -> output volume -> [speaker]
//
// Every public method runs on a control thread. render() is the only entry
// point used by the audio thread and is wired to the device in start_audio().
#pragma once

#include "audio_device.h"
#include "hearing_profile.h"
#include "hearing_test.h"
#include "hl_status.h"
#include "dsp/dsp_chain.h"
#include "dsp/tone_generator.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

struct HearingAidConfig {
    size_t eq_bands           = hldsp::DspEq::kDefaultBands;
    float  output_volume      = 0.5f;    // mixer level, 0..1
    bool   auto_apply_profile = true;    // map the audiogram when a test completes
};

class HearingAid : private ToneSink {
public:
    // Largest sub-block processed per pass of render()
    static constexpr size_t kMaxBlockFrames = 1024;

    explicit HearingAid(std::unique_ptr<AudioDevice> device,
                        const HearingAidConfig& cfg = HearingAidConfig());
    ~HearingAid() override;

    HearingAid(const HearingAid&) = delete;
    HearingAid& operator=(const HearingAid&) = delete;

    // ── Audio device ───────────────────────────────────────────────────────
    HlStatus start_audio();
    void     stop_audio();
    bool     is_audio_active() const;

    // ── Hearing test ───────────────────────────────────────────────────────
    HlStatus            start_test();
    HlStatus            record_response(bool heard);
    HlStatus            cancel_test();
    HearingTest::Status test_status()  const { return test_.status(); }
    HearingProfile      test_results() const { return test_.results(); }

    // ── Test tone (manual) ─────────────────────────────────────────────────
    HlStatus play_test_tone(float frequency_hz, float level_db_hl);
    HlStatus stop_test_tone();

    // ── Effect chain ───────────────────────────────────────────────────────
    // Stores the profile as the session profile and maps it onto the EQ.
    HlStatus apply_profile(const HearingProfile& profile);
    // Maps the stored session profile; INVALID_STATE when none is stored.
    HlStatus apply_hearing_profile();
    HlStatus apply_preset(hldsp::AudioProfile profile);

    void  set_master_gain(float gain_db);
    float master_gain() const;
    void  set_noise_reduction(bool enabled);
    bool  noise_reduction() const;
    void  set_output_volume(float volume);
    float output_volume() const { return output_volume_.load(std::memory_order_relaxed); }

    hldsp::AudioProfile selected_preset() const;

    // ── Session profile ────────────────────────────────────────────────────
    HearingProfile hearing_profile() const;
    void           save_hearing_profile(const HearingProfile& profile);

    hldsp::DspChain&               chain()       { return chain_; }
    const hldsp::DspChain&         chain() const { return chain_; }
    const hldsp::DspToneGenerator& tone()  const { return tone_; }
    const HearingAidConfig&        config() const { return cfg_; }

    // ── Audio thread ───────────────────────────────────────────────────────
    void render(const float* in, int in_channels,
                float* out, int out_channels, size_t frames);

private:
    HearingAidConfig             cfg_;
    std::unique_ptr<AudioDevice> device_;

    hldsp::DspChain         chain_;
    hldsp::DspToneGenerator tone_;
    HearingTest             test_;

    std::atomic<float> output_volume_;

    // Session state; never held while calling into test_
    mutable std::mutex  mtx_;
    HearingProfile      profile_;
    hldsp::AudioProfile preset_          = hldsp::AudioProfile::STANDARD;
    bool                noise_reduction_ = false;

    // Test tone bookkeeping (present_tone runs under the test lock)
    mutable std::mutex tone_mtx_;
    float              last_tone_hz_ = 0.0f;

    // Render scratch, sized in start_audio()
    int                chain_channels_ = 2;
    std::vector<float> work_;

    void start_tone(float frequency_hz, float level_db_hl);
    void on_test_complete(const HearingProfile& results);
    void map_profile(const HearingProfile& profile);

    // ToneSink
    bool tone_available() const override;
    void present_tone(int frequency_hz, float level_db_hl) override;
    void silence_tone() override;
};
