// main_cli.cpp - hearloop CLI entry point (Linux)
// HearLoop v1.0.0
//
// Precedence (highest wins):
//   1. CLI flags (--sample-rate, --preset, --log-level, ...)
//   2. YAML config file (-c / --config)
//   3. Compiled-in defaults
//
// Workflow:
//   1. Parse CLI flags into local "cli_*" variables; record which were set
//   2. If -c was given: hl_load_config() fills HlConfig
//   3. Re-apply explicitly-set CLI flags on top of YAML values
//   4. Open the PortAudio device, start the live path
//   5. Read interactive commands from stdin until "quit" or SIGINT/SIGTERM

#include "config_loader.h"
#include "hearing_aid.h"
#include "hearing_profile.h"
#include "hl_logger.h"
#include "portaudio_device.h"
#include "dsp/profile_mapper.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>
#include <getopt.h>
#include <poll.h>
#include <unistd.h>
#include <exception>
#include <execinfo.h>
#include <memory>
#include <sstream>
#include <string>
#include <typeinfo>

/* ── Terminate handler - prints backtrace on std::terminate ───────────────── */

static void hl_terminate_handler()
{
    std::exception_ptr ep = std::current_exception();
    if (ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            fprintf(stderr, "\n[hearloop FATAL] std::terminate: %s: %s\n",
                    typeid(e).name(), e.what());
        } catch (...) {
            fprintf(stderr, "\n[hearloop FATAL] std::terminate: unknown exception\n");
        }
    } else {
        fprintf(stderr, "\n[hearloop FATAL] std::terminate without active exception\n");
    }

    void* frames[64];
    int   n = backtrace(frames, 64);
    char** syms = backtrace_symbols(frames, n);
    fprintf(stderr, "[hearloop BACKTRACE] %d frames:\n", n);
    for (int i = 0; i < n; i++)
        fprintf(stderr, "  #%02d  %s\n", i, syms ? syms[i] : "?");
    if (syms) free(syms);
    fflush(stderr);

    abort();
}

/* ── Signal handling ──────────────────────────────────────────────────────── */

static volatile sig_atomic_t g_running = 1;

static void sig_handler(int sig)
{
    (void)sig;
    g_running = 0;
}

/* ── Usage ────────────────────────────────────────────────────────────────── */

static void print_usage(const char* prog)
{
    fprintf(stdout,
"HearLoop v1.0.0 - personal hearing amplifier\n"
"\n"
"Usage:\n"
"  %s -c <config.yaml>               # YAML config, CLI flags override\n"
"  %s --list-devices                 # show PortAudio devices and exit\n"
"\n"
"Options:\n"
"  -c, --config <file>        YAML config file\n"
"  -l, --list-devices         List audio devices and exit\n"
"  --input-device  <index>    PortAudio input device  (default: system)\n"
"  --output-device <index>    PortAudio output device (default: system)\n"
"  --sample-rate   <hz>       Stream sample rate      (default: 48000)\n"
"  --preset <name>            standard | voice_isolation | wide_spectrum\n"
"  --log-level <1-5>          1=critical .. 5=debug   (default: 4)\n"
"  --log-dir <dir>            Log directory; \"\" logs to stderr only\n"
"  -v, --verbose              Debug logging\n"
"  -h, --help                 Show this help\n"
"\n",
    prog, prog);
}

static void print_commands()
{
    fprintf(stdout,
"Commands:\n"
"  start              begin the hearing test\n"
"  y | n              heard / not heard the current tone\n"
"  cancel             abort the hearing test\n"
"  status             test phase, frequency, level\n"
"  results            print the recorded thresholds\n"
"  apply              map the stored profile onto the EQ\n"
"  preset <name>      standard | voice_isolation | wide_spectrum\n"
"  tone <hz> <dBHL>   play a manual test tone\n"
"  stop               silence the test tone\n"
"  gain <dB>          master gain (-90..20)\n"
"  nr on|off          noise reduction (low band cut)\n"
"  bypass on|off      bypass every EQ band\n"
"  eq on|off          enable / disable the whole EQ stage\n"
"  volume <0-1>       output volume\n"
"  help               this list\n"
"  quit               exit\n"
"\n");
}

static void print_devices()
{
    auto devs = PortAudioDevice::enumerate_devices();
    if (devs.empty()) {
        fprintf(stderr, "[hearloop] No audio devices (PortAudio init failed?)\n");
        return;
    }
    for (const auto& d : devs) {
        fprintf(stdout, "  %3d  %-40s  in:%-2d out:%-2d  %.0f Hz%s%s\n",
                d.index, d.name.c_str(),
                d.max_input_channels, d.max_output_channels,
                d.default_sample_rate,
                d.is_default_input  ? "  [default in]"  : "",
                d.is_default_output ? "  [default out]" : "");
    }
}

/* ── Interactive commands ─────────────────────────────────────────────────── */

static void report(const char* what, HlStatus st)
{
    if (st == HlStatus::OK) return;
    fprintf(stdout, "  %s: %s\n", what, hl_status_to_string(st));
}

static void print_status(const HearingAid& aid)
{
    HearingTest::Status st = aid.test_status();
    fprintf(stdout, "  test   : %s", HearingTest::phase_to_string(st.phase));
    if (st.phase == HearingTest::Phase::PLAYING_TONE ||
        st.phase == HearingTest::Phase::AWAITING_RESPONSE)
        fprintf(stdout, "  %d Hz @ %.0f dB HL  (%zu/%zu done)",
                st.frequency_hz, st.level_db, st.completed, kTestFrequencies.size());
    fprintf(stdout, "\n");
    fprintf(stdout, "  preset : %s\n", hldsp::audio_profile_to_string(aid.selected_preset()));
    fprintf(stdout, "  gain   : %.1f dB   volume: %.2f   nr: %s   GR: %.1f dB\n",
            aid.master_gain(), aid.output_volume(),
            aid.noise_reduction() ? "on" : "off",
            aid.chain().gain_reduction_db());
}

static bool parse_on_off(const std::string& s, bool& out)
{
    if (s == "on"  || s == "1" || s == "true")  { out = true;  return true; }
    if (s == "off" || s == "0" || s == "false") { out = false; return true; }
    return false;
}

// Returns false when the user asked to quit.
static bool run_command(HearingAid& aid, const std::string& line)
{
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd)) return true;

    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        return false;
    } else if (cmd == "help" || cmd == "?") {
        print_commands();
    } else if (cmd == "start") {
        report("start", aid.start_test());
        print_status(aid);
    } else if (cmd == "y" || cmd == "n") {
        report("response", aid.record_response(cmd == "y"));
        if (aid.test_status().phase == HearingTest::Phase::COMPLETE)
            fprintf(stdout, "  complete: %s\n",
                    hearing_profile_to_string(aid.test_results()).c_str());
        else
            print_status(aid);
    } else if (cmd == "cancel") {
        report("cancel", aid.cancel_test());
    } else if (cmd == "status") {
        print_status(aid);
    } else if (cmd == "results") {
        fprintf(stdout, "  test   : %s\n",
                hearing_profile_to_string(aid.test_results()).c_str());
        fprintf(stdout, "  stored : %s\n",
                hearing_profile_to_string(aid.hearing_profile()).c_str());
    } else if (cmd == "apply") {
        report("apply", aid.apply_hearing_profile());
    } else if (cmd == "preset") {
        std::string name;
        hldsp::AudioProfile p;
        if (!(in >> name) || !hldsp::audio_profile_from_string(name, p))
            fprintf(stdout, "  usage: preset standard|voice_isolation|wide_spectrum\n");
        else
            report("preset", aid.apply_preset(p));
    } else if (cmd == "tone") {
        float hz = 0.0f, db = 0.0f;
        if (!(in >> hz >> db))
            fprintf(stdout, "  usage: tone <hz> <dBHL>\n");
        else
            report("tone", aid.play_test_tone(hz, db));
    } else if (cmd == "stop") {
        report("stop", aid.stop_test_tone());
    } else if (cmd == "gain") {
        float db = 0.0f;
        if (!(in >> db)) fprintf(stdout, "  usage: gain <dB>\n");
        else             aid.set_master_gain(db);
    } else if (cmd == "nr") {
        std::string arg; bool on = false;
        if (!(in >> arg) || !parse_on_off(arg, on)) fprintf(stdout, "  usage: nr on|off\n");
        else                                         aid.set_noise_reduction(on);
    } else if (cmd == "bypass") {
        std::string arg; bool on = false;
        if (!(in >> arg) || !parse_on_off(arg, on)) fprintf(stdout, "  usage: bypass on|off\n");
        else                                         aid.chain().bypass_all(on);
    } else if (cmd == "eq") {
        std::string arg; bool on = false;
        if (!(in >> arg) || !parse_on_off(arg, on)) fprintf(stdout, "  usage: eq on|off\n");
        else                                         aid.chain().set_eq_enabled(on);
    } else if (cmd == "volume") {
        float v = 0.0f;
        if (!(in >> v)) fprintf(stdout, "  usage: volume <0-1>\n");
        else            aid.set_output_volume(v);
    } else {
        fprintf(stdout, "  unknown command '%s' (try help)\n", cmd.c_str());
    }
    return true;
}

/* ── Long option table ────────────────────────────────────────────────────── */

static const struct option long_opts[] = {
    { "config",        required_argument, 0, 'c' },
    { "list-devices",  no_argument,       0, 'l' },
    { "verbose",       no_argument,       0, 'v' },
    { "input-device",  required_argument, 0,  1  },
    { "output-device", required_argument, 0,  2  },
    { "sample-rate",   required_argument, 0,  3  },
    { "preset",        required_argument, 0,  4  },
    { "log-level",     required_argument, 0,  5  },
    { "log-dir",       required_argument, 0,  6  },
    { "help",          no_argument,       0, 'h' },
    { 0, 0, 0, 0 }
};

/* ── main ─────────────────────────────────────────────────────────────────── */

int main(int argc, char* argv[])
{
    std::set_terminate(hl_terminate_handler);
    signal(SIGINT,  sig_handler);
    signal(SIGTERM, sig_handler);

    const char* config_file  = nullptr;
    bool        list_devices = false;

    // CLI override tracking - only applied after YAML load
    bool cli_in_set     = false;  int         cli_in     = -1;
    bool cli_out_set    = false;  int         cli_out    = -1;
    bool cli_sr_set     = false;  int         cli_sr     = 48000;
    bool cli_preset_set = false;  std::string cli_preset;
    bool cli_level_set  = false;  int         cli_level  = 4;
    bool cli_logdir_set = false;  std::string cli_logdir;

    int opt, idx = 0;
    while ((opt = getopt_long(argc, argv, "c:lvh", long_opts, &idx)) != -1) {
        switch (opt) {
        case 'c': config_file  = optarg;                              break;
        case 'l': list_devices = true;                                break;
        case 'v': cli_level_set  = true; cli_level  = 5;              break;
        case  1:  cli_in_set     = true; cli_in     = atoi(optarg);   break;
        case  2:  cli_out_set    = true; cli_out    = atoi(optarg);   break;
        case  3:  cli_sr_set     = true; cli_sr     = atoi(optarg);   break;
        case  4:  cli_preset_set = true; cli_preset = optarg;         break;
        case  5:  cli_level_set  = true; cli_level  = atoi(optarg);   break;
        case  6:  cli_logdir_set = true; cli_logdir = optarg;         break;
        case 'h': print_usage(argv[0]); return 0;
        default:  print_usage(argv[0]); return 1;
        }
    }

    if (list_devices) {
        print_devices();
        return 0;
    }

    /* Load YAML, then CLI overrides */
    HlConfig cfg;
    if (config_file && !hl_load_config(config_file, cfg)) {
        fprintf(stderr, "[hearloop] Fatal: config load failed: %s\n", config_file);
        return 1;
    }

    if (cli_in_set)     cfg.input_device  = cli_in;
    if (cli_out_set)    cfg.output_device = cli_out;
    if (cli_sr_set)     cfg.sample_rate   = cli_sr;
    if (cli_level_set)  cfg.log_level     = cli_level;
    if (cli_logdir_set) cfg.log_dir       = cli_logdir;
    if (cli_preset_set && !hldsp::audio_profile_from_string(cli_preset, cfg.preset)) {
        fprintf(stderr, "[hearloop] Unknown preset: %s\n", cli_preset.c_str());
        return 1;
    }

    hllog.init(cfg.log_dir, cfg.log_level, true);

    /* Build the live path */
    std::unique_ptr<AudioDevice> device = std::make_unique<PortAudioDevice>(
        cfg.input_device, cfg.output_device, cfg.sample_rate,
        cfg.input_channels, cfg.output_channels, cfg.frames_per_buffer);

    HearingAidConfig acfg;
    acfg.eq_bands           = cfg.eq_bands;
    acfg.output_volume      = cfg.output_volume;
    acfg.auto_apply_profile = cfg.auto_apply_profile;

    HearingAid aid(std::move(device), acfg);

    if (aid.start_audio() != HlStatus::OK) {
        fprintf(stderr, "[hearloop] Fatal: audio device did not start "
                        "(try --list-devices)\n");
        return 1;
    }

    report("preset", aid.apply_preset(cfg.preset));
    if (cfg.dynamics_set) {
        aid.chain().set_dynamics(cfg.dynamics);
    }
    if (cfg.noise_reduction) aid.set_noise_reduction(true);

    fprintf(stdout,
        "\n"
        "  HearLoop v1.0.0 (Linux)\n"
        "  ──────────────────────────────────────────────────────\n"
        "  Rate   : %d Hz, %d frames/buffer\n"
        "  Preset : %s\n"
        "  Log    : %s (level %d)\n"
        "  Type 'help' for commands, Ctrl+C to stop.\n\n",
        cfg.sample_rate, cfg.frames_per_buffer,
        hldsp::audio_profile_to_string(aid.selected_preset()),
        cfg.log_dir.empty() ? "stderr" : cfg.log_dir.c_str(), cfg.log_level);

    /* Command loop; poll so SIGINT is noticed between lines */
    char buf[256];
    while (g_running) {
        fprintf(stdout, "> ");
        fflush(stdout);

        bool got_line = false;
        while (g_running && !got_line) {
            struct pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
            int r = poll(&pfd, 1, 500);
            if (r > 0) got_line = true;
        }
        if (!got_line) break;

        if (!fgets(buf, sizeof(buf), stdin)) break;   // EOF
        if (!run_command(aid, buf)) break;
    }

    fprintf(stdout, "\n[hearloop] Shutdown\n");
    aid.stop_audio();
    return 0;
}
