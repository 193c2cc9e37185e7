// portaudio_device.cpp - PortAudio duplex stream implementation
// HearLoop v1.0.0
#include "portaudio_device.h"
#include "hl_logger.h"

#include <cstring>

// ---------------------------------------------------------------------------
// PortAudioDevice - enumerate devices
// ---------------------------------------------------------------------------
std::vector<PortAudioDevice::DeviceInfo> PortAudioDevice::enumerate_devices()
{
    std::vector<DeviceInfo> result;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        HL_ERR(std::string("[PortAudio] Init failed: ") + Pa_GetErrorText(err));
        return result;
    }

    const int count   = Pa_GetDeviceCount();
    const int def_in  = Pa_GetDefaultInputDevice();
    const int def_out = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;

        DeviceInfo di;
        di.index               = i;
        di.name                = info->name ? info->name : "(unknown)";
        di.max_input_channels  = info->maxInputChannels;
        di.max_output_channels = info->maxOutputChannels;
        di.default_sample_rate = info->defaultSampleRate;
        di.is_default_input    = (i == def_in);
        di.is_default_output   = (i == def_out);
        result.push_back(di);
    }

    Pa_Terminate();
    return result;
}

// ---------------------------------------------------------------------------
// PortAudioDevice - constructor / destructor
// ---------------------------------------------------------------------------
PortAudioDevice::PortAudioDevice(int input_device, int output_device,
                                 int sample_rate, int input_channels,
                                 int output_channels, int frames_per_buf)
    : input_device_(input_device)
    , output_device_(output_device)
    , sample_rate_(sample_rate)
    , input_channels_(input_channels)
    , output_channels_(output_channels)
    , frames_per_buf_(frames_per_buf)
{
}

PortAudioDevice::~PortAudioDevice()
{
    stop();
}

// ---------------------------------------------------------------------------
// PortAudioDevice::start
// ---------------------------------------------------------------------------
bool PortAudioDevice::start(AudioCallback cb)
{
    if (running_.load()) return true;

    callback_ = std::move(cb);

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        HL_ERR(std::string("[PortAudio] Pa_Initialize: ") + Pa_GetErrorText(err));
        return false;
    }

    PaDeviceIndex out_dev = (output_device_ < 0)
                          ? Pa_GetDefaultOutputDevice()
                          : static_cast<PaDeviceIndex>(output_device_);
    if (out_dev == paNoDevice) {
        HL_ERR("[PortAudio] No output device available.");
        Pa_Terminate();
        return false;
    }
    const PaDeviceInfo* out_info = Pa_GetDeviceInfo(out_dev);

    PaStreamParameters out_params{};
    out_params.device                    = out_dev;
    out_params.channelCount              = output_channels_;
    out_params.sampleFormat              = paFloat32;
    out_params.suggestedLatency          = out_info ? out_info->defaultLowOutputLatency : 0.05;
    out_params.hostApiSpecificStreamInfo = nullptr;

    PaStreamParameters  in_params{};
    PaStreamParameters* in_ptr = nullptr;
    std::string         in_name;
    int                 in_channels = input_channels_;

    if (in_channels > 0) {
        PaDeviceIndex in_dev = (input_device_ < 0)
                             ? Pa_GetDefaultInputDevice()
                             : static_cast<PaDeviceIndex>(input_device_);
        if (in_dev == paNoDevice) {
            HL_WARN("[PortAudio] No input device; running output only.");
            in_channels = 0;
        } else {
            const PaDeviceInfo* in_info = Pa_GetDeviceInfo(in_dev);
            in_name = in_info && in_info->name ? in_info->name : "Unknown";
            in_params.device                    = in_dev;
            in_params.channelCount              = in_channels;
            in_params.sampleFormat              = paFloat32;
            in_params.suggestedLatency          = in_info ? in_info->defaultLowInputLatency : 0.05;
            in_params.hostApiSpecificStreamInfo = nullptr;
            in_ptr = &in_params;
        }
    }

    device_name_ = out_info && out_info->name ? out_info->name : "Unknown";
    if (!in_name.empty()) device_name_ = in_name + " -> " + device_name_;

    active_in_channels_ = in_channels;

    PaStream* stream = nullptr;
    err = Pa_OpenStream(&stream,
                        in_ptr,
                        &out_params,
                        static_cast<double>(sample_rate_),
                        static_cast<unsigned long>(frames_per_buf_),
                        paClipOff,
                        pa_callback_trampoline,
                        this);
    if (err != paNoError) {
        HL_ERR(std::string("[PortAudio] Pa_OpenStream: ") + Pa_GetErrorText(err));
        Pa_Terminate();
        return false;
    }

    pa_stream_ = stream;
    running_.store(true);
    err = Pa_StartStream(stream);
    if (err != paNoError) {
        HL_ERR(std::string("[PortAudio] Pa_StartStream: ") + Pa_GetErrorText(err));
        running_.store(false);
        Pa_CloseStream(stream);
        pa_stream_ = nullptr;
        Pa_Terminate();
        return false;
    }

    HL_LOG(info, "[PortAudio] Stream started: " << device_name_ << "  "
                 << sample_rate_ << " Hz  in=" << in_channels
                 << "ch out=" << output_channels_ << "ch");
    return true;
}

// ---------------------------------------------------------------------------
// PortAudioDevice::stop
// ---------------------------------------------------------------------------
void PortAudioDevice::stop()
{
    if (!running_.load()) return;
    running_.store(false);

    if (pa_stream_) {
        Pa_StopStream(pa_stream_);
        Pa_CloseStream(pa_stream_);
        pa_stream_ = nullptr;
    }
    Pa_Terminate();
    HL_INFO("[PortAudio] Stream stopped.");
}

// ---------------------------------------------------------------------------
// PortAudioDevice::pa_callback_trampoline (static)
// ---------------------------------------------------------------------------
int PortAudioDevice::pa_callback_trampoline(const void*                     input,
                                            void*                           output,
                                            unsigned long                   frame_count,
                                            const PaStreamCallbackTimeInfo* /*time_info*/,
                                            PaStreamCallbackFlags           /*status_flags*/,
                                            void*                           user_data)
{
    auto* self = static_cast<PortAudioDevice*>(user_data);
    auto* out  = static_cast<float*>(output);

    if (!self->running_.load() || !self->callback_) {
        if (out)
            std::memset(out, 0, frame_count * self->output_channels_ * sizeof(float));
        return self->running_.load() ? paContinue : paAbort;
    }

    self->callback_(static_cast<const float*>(input), self->active_in_channels_,
                    out, self->output_channels_,
                    frame_count);
    return paContinue;
}
