// config_loader.h - Startup YAML -> HlConfig
// HearLoop v1.0.0
//
// Sections:
//   audio:  input/output device, sample rate, channels, buffer, output volume
//   dsp:    EQ band count, startup preset, noise reduction, auto-apply,
//           dynamics: { threshold, headroom, attack, release, ratio, ... }
//   log:    dir, level
//
// Keys missing from the file keep the values already in cfg, so callers fill
// cfg with defaults first. CLI flags always override YAML: apply them after
// hl_load_config().
#pragma once

#include "dsp/dsp_chain.h"
#include "dsp/dynamics.h"

#include <cstddef>
#include <string>

struct HlConfig {
    // audio:
    int         input_device      = -1;       // -1 = system default
    int         output_device     = -1;
    int         sample_rate       = 48000;
    int         input_channels    = 1;
    int         output_channels   = 2;
    int         frames_per_buffer = 256;
    float       output_volume     = 0.5f;

    // dsp:
    size_t               eq_bands           = hldsp::DspEq::kDefaultBands;
    hldsp::AudioProfile  preset             = hldsp::AudioProfile::STANDARD;
    bool                 noise_reduction    = false;
    bool                 auto_apply_profile = true;
    hldsp::DynamicsConfig dynamics;
    bool                 dynamics_set       = false;   // dsp.dynamics present

    // log:
    std::string log_dir   = "/var/log/hearloop";
    int         log_level = 4;
};

// ---------------------------------------------------------------------------
// hl_load_config
//
// Parses the YAML file at path into cfg. Unknown keys are ignored, bad values
// are logged and skipped. Returns false when the file cannot be opened or is
// not a YAML mapping; cfg is left untouched in that case.
// ---------------------------------------------------------------------------
bool hl_load_config(const char* path, HlConfig& cfg);
