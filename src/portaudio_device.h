// portaudio_device.h - Live duplex capture/playback via PortAudio
// HearLoop v1.0.0
#pragma once

#include "audio_device.h"

#include <portaudio.h>

#include <atomic>
#include <string>
#include <vector>

class PortAudioDevice : public AudioDevice {
public:
    struct DeviceInfo {
        int         index;
        std::string name;
        int         max_input_channels;
        int         max_output_channels;
        double      default_sample_rate;
        bool        is_default_input;
        bool        is_default_output;
    };

    // Enumerate all PortAudio devices.
    // Returns empty vector if PortAudio fails to initialize.
    static std::vector<DeviceInfo> enumerate_devices();

    // input_device / output_device : PortAudio index, or -1 for the default
    // input_channels               : 0 disables capture (tone-only output)
    explicit PortAudioDevice(int input_device    = -1,
                             int output_device   = -1,
                             int sample_rate     = 48000,
                             int input_channels  = 1,
                             int output_channels = 2,
                             int frames_per_buf  = 256);
    ~PortAudioDevice() override;

    bool start(AudioCallback cb) override;
    void stop()                  override;
    bool is_running() const      override { return running_.load(); }

    int         sample_rate()       const override { return sample_rate_;     }
    int         input_channels()    const override { return input_channels_;  }
    int         output_channels()   const override { return output_channels_; }
    int         frames_per_buffer() const override { return frames_per_buf_;  }
    std::string name()              const override { return device_name_;     }

private:
    int         input_device_;
    int         output_device_;
    int         sample_rate_;
    int         input_channels_;
    int         output_channels_;
    int         frames_per_buf_;
    int         active_in_channels_ = 0;   // this stream's capture width
    std::string device_name_;

    PaStream*         pa_stream_ = nullptr;
    AudioCallback     callback_;
    std::atomic<bool> running_{false};

    static int pa_callback_trampoline(const void*                     input,
                                      void*                           output,
                                      unsigned long                   frame_count,
                                      const PaStreamCallbackTimeInfo* time_info,
                                      PaStreamCallbackFlags           status_flags,
                                      void*                           user_data);
};
