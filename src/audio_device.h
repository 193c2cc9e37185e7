// audio_device.h - Abstract duplex audio device
// HearLoop v1.0.0
#pragma once

#include <cstddef>
#include <functional>
#include <string>

// ---------------------------------------------------------------------------
// AudioCallback - called from the device's audio thread for every buffer.
//   in          : interleaved float32 capture samples (may be nullptr)
//   in_channels : channels in `in`
//   out         : interleaved float32 playback buffer to fill
//   out_channels: channels in `out`
//   frames      : sample frames in both buffers
// Must not block, allocate or throw.
// ---------------------------------------------------------------------------
using AudioCallback = std::function<void(const float* in,  int in_channels,
                                         float*       out, int out_channels,
                                         size_t       frames)>;

// ---------------------------------------------------------------------------
// AudioDevice - pure virtual base class
// ---------------------------------------------------------------------------
class AudioDevice {
public:
    virtual ~AudioDevice() = default;

    // Start the stream; cb is called from an audio thread.
    virtual bool start(AudioCallback cb) = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    virtual int  sample_rate()       const = 0;
    virtual int  input_channels()    const = 0;
    virtual int  output_channels()   const = 0;
    virtual int  frames_per_buffer() const = 0;
    virtual std::string name()       const = 0;
};
