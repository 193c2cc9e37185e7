// test_portaudio_device.cpp - PortAudio device setup, with or without hardware
#include <gtest/gtest.h>
#include "portaudio_device.h"

#include <atomic>

namespace {

TEST(PortAudioDevice, ReportsConfiguredFormat) {
    PortAudioDevice dev(-1, -1, 44100, 1, 2, 128);
    EXPECT_EQ(dev.sample_rate(),       44100);
    EXPECT_EQ(dev.input_channels(),    1);
    EXPECT_EQ(dev.output_channels(),   2);
    EXPECT_EQ(dev.frames_per_buffer(), 128);
    EXPECT_FALSE(dev.is_running());
}

// Whatever the host offers (no device, output only, full duplex), a start /
// stop cycle leaves the configured capture width alone.
TEST(PortAudioDevice, StartStopKeepsConfiguredInputChannels) {
    PortAudioDevice dev(-1, -1, 48000, 1, 2, 256);

    std::atomic<int> max_in_ch{0};
    for (int run = 0; run < 2; run++) {
        const bool started = dev.start([&max_in_ch](const float*, int in_ch,
                                                    float* out, int out_ch,
                                                    size_t frames) {
            if (in_ch > max_in_ch.load()) max_in_ch.store(in_ch);
            for (size_t i = 0; i < frames * static_cast<size_t>(out_ch); i++) out[i] = 0.0f;
        });
        EXPECT_EQ(dev.is_running(), started);
        dev.stop();
        EXPECT_FALSE(dev.is_running());
        EXPECT_EQ(dev.input_channels(), 1) << "run " << run;
    }
    EXPECT_LE(max_in_ch.load(), 1);
}

TEST(PortAudioDevice, StopWithoutStartIsHarmless) {
    PortAudioDevice dev;
    dev.stop();
    EXPECT_FALSE(dev.is_running());
    EXPECT_EQ(dev.input_channels(), 1);
}

} // namespace
