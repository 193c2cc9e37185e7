// config_loader.cpp - Startup YAML -> HlConfig (libyaml document API)
// HearLoop v1.0.0

#include "config_loader.h"
#include "hl_logger.h"

#include <yaml.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>
#include <string>

// ---------------------------------------------------------------------------
// Internal YAML helpers
// ---------------------------------------------------------------------------

static const char* node_scalar(yaml_node_t* node)
{
    if (!node || node->type != YAML_SCALAR_NODE) return "";
    return reinterpret_cast<const char*>(node->data.scalar.value);
}

static yaml_node_t* map_get(yaml_document_t* doc,
                             yaml_node_t*     map,
                             const char*      key)
{
    if (!map || map->type != YAML_MAPPING_NODE) return nullptr;
    for (auto* pair = map->data.mapping.pairs.start;
         pair < map->data.mapping.pairs.top; ++pair)
    {
        yaml_node_t* k = yaml_document_get_node(doc, pair->key);
        if (k && k->type == YAML_SCALAR_NODE &&
            strcmp(reinterpret_cast<const char*>(k->data.scalar.value), key) == 0)
        {
            return yaml_document_get_node(doc, pair->value);
        }
    }
    return nullptr;
}

static bool yaml_bool(const char* v)
{
    return v && (strcmp(v,"true")==0 || strcmp(v,"yes")==0 ||
                 strcmp(v,"on")==0   || strcmp(v,"1")==0);
}

// Numeric scalars: the whole string must parse, otherwise the key is skipped
static bool yaml_int(yaml_node_t* node, const char* key, int& out)
{
    const char* s = node_scalar(node);
    char* end = nullptr;
    long v = strtol(s, &end, 10);
    if (!s[0] || (end && *end)) {
        HL_WARN(std::string("[config] Not an integer: ") + key + "=" + s);
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

static bool yaml_float(yaml_node_t* node, const char* key, float& out)
{
    const char* s = node_scalar(node);
    char* end = nullptr;
    float v = strtof(s, &end);
    if (!s[0] || (end && *end)) {
        HL_WARN(std::string("[config] Not a number: ") + key + "=" + s);
        return false;
    }
    out = v;
    return true;
}

// ---------------------------------------------------------------------------
// audio: section
// ---------------------------------------------------------------------------

static void parse_audio(yaml_document_t* doc, yaml_node_t* node, HlConfig& cfg)
{
    if (!node || node->type != YAML_MAPPING_NODE) return;

    yaml_node_t* v;
    int i;

    if ((v = map_get(doc, node, "input-device"))  && yaml_int(v, "input-device", i))
        cfg.input_device = i;
    if ((v = map_get(doc, node, "output-device")) && yaml_int(v, "output-device", i))
        cfg.output_device = i;

    if ((v = map_get(doc, node, "sample-rate")) && yaml_int(v, "sample-rate", i)) {
        if (i >= 8000 && i <= 192000) cfg.sample_rate = i;
        else HL_WARN("[config] sample-rate out of range, keeping " +
                     std::to_string(cfg.sample_rate));
    }

    if ((v = map_get(doc, node, "input-channels")) && yaml_int(v, "input-channels", i))
        cfg.input_channels = std::min(std::max(i, 0), 2);
    if ((v = map_get(doc, node, "output-channels")) && yaml_int(v, "output-channels", i))
        cfg.output_channels = std::min(std::max(i, 1), 2);
    if ((v = map_get(doc, node, "frames-per-buffer")) && yaml_int(v, "frames-per-buffer", i))
        cfg.frames_per_buffer = std::max(i, 16);

    float f;
    if ((v = map_get(doc, node, "output-volume")) && yaml_float(v, "output-volume", f))
        cfg.output_volume = std::min(std::max(f, 0.0f), 1.0f);
}

// ---------------------------------------------------------------------------
// dsp: section (+ nested dynamics:)
// ---------------------------------------------------------------------------

static void parse_dynamics(yaml_document_t* doc, yaml_node_t* node,
                           hldsp::DynamicsConfig& d)
{
    if (!node || node->type != YAML_MAPPING_NODE) return;

    struct { const char* key; float* dst; } fields[] = {
        { "threshold-db",           &d.threshold_db           },
        { "headroom-db",            &d.headroom_db            },
        { "attack-sec",             &d.attack_sec             },
        { "release-sec",            &d.release_sec            },
        { "ratio",                  &d.compression_ratio      },
        { "master-gain-db",         &d.master_gain_db         },
        { "expansion-ratio",        &d.expansion_ratio        },
        { "expansion-threshold-db", &d.expansion_threshold_db },
    };

    for (auto& fld : fields) {
        yaml_node_t* v = map_get(doc, node, fld.key);
        float f;
        if (v && yaml_float(v, fld.key, f)) *fld.dst = f;
    }
    d = hldsp::dynamics_sanitize(d);
}

static void parse_dsp(yaml_document_t* doc, yaml_node_t* node, HlConfig& cfg)
{
    if (!node || node->type != YAML_MAPPING_NODE) return;

    yaml_node_t* v;
    int i;

    if ((v = map_get(doc, node, "eq-bands")) && yaml_int(v, "eq-bands", i)) {
        if (i >= 1 && i <= 32) cfg.eq_bands = static_cast<size_t>(i);
        else HL_WARN("[config] eq-bands must be 1..32, keeping " +
                     std::to_string(cfg.eq_bands));
    }

    if ((v = map_get(doc, node, "preset"))) {
        const char* name = node_scalar(v);
        if (!hldsp::audio_profile_from_string(name, cfg.preset))
            HL_WARN(std::string("[config] Unknown preset '") + name + "', keeping " +
                    hldsp::audio_profile_to_string(cfg.preset));
    }

    if ((v = map_get(doc, node, "noise-reduction")))
        cfg.noise_reduction = yaml_bool(node_scalar(v));
    if ((v = map_get(doc, node, "auto-apply-profile")))
        cfg.auto_apply_profile = yaml_bool(node_scalar(v));

    yaml_node_t* dyn = map_get(doc, node, "dynamics");
    if (dyn && dyn->type == YAML_MAPPING_NODE) {
        parse_dynamics(doc, dyn, cfg.dynamics);
        cfg.dynamics_set = true;
    }
}

// ---------------------------------------------------------------------------
// log: section
// ---------------------------------------------------------------------------

static void parse_log(yaml_document_t* doc, yaml_node_t* node, HlConfig& cfg)
{
    if (!node || node->type != YAML_MAPPING_NODE) return;

    yaml_node_t* v;
    int i;

    if ((v = map_get(doc, node, "dir")))
        cfg.log_dir = node_scalar(v);
    if ((v = map_get(doc, node, "level")) && yaml_int(v, "level", i))
        cfg.log_level = std::min(std::max(i, 1), 5);
}

// ---------------------------------------------------------------------------
// hl_load_config
// ---------------------------------------------------------------------------

bool hl_load_config(const char* path, HlConfig& cfg)
{
    if (!path || !path[0]) {
        HL_ERR("[config] No config file specified");
        return false;
    }

    FILE* f = fopen(path, "r");
    if (!f) {
        HL_ERR(std::string("[config] Cannot open: ") + path);
        return false;
    }

    yaml_parser_t   parser;
    yaml_document_t doc;
    yaml_parser_initialize(&parser);
    yaml_parser_set_input_file(&parser, f);

    if (!yaml_parser_load(&parser, &doc)) {
        HL_LOG(error, "[config] YAML parse error in " << path << ": "
               << (parser.problem ? parser.problem : "unknown")
               << " (line " << parser.problem_mark.line + 1 << ")");
        yaml_parser_delete(&parser);
        fclose(f);
        return false;
    }

    yaml_node_t* root = yaml_document_get_root_node(&doc);
    if (!root || root->type != YAML_MAPPING_NODE) {
        HL_ERR(std::string("[config] YAML root is not a mapping: ") + path);
        yaml_document_delete(&doc);
        yaml_parser_delete(&parser);
        fclose(f);
        return false;
    }

    // Parse into a copy so a rejected file leaves cfg as it was
    HlConfig out = cfg;
    yaml_node_t* n;

    if ((n = map_get(&doc, root, "audio")))
        parse_audio(&doc, n, out);
    else
        HL_WARN(std::string("[config] No audio section in ") + path + ", using defaults");

    if ((n = map_get(&doc, root, "dsp")))
        parse_dsp(&doc, n, out);

    if ((n = map_get(&doc, root, "log")))
        parse_log(&doc, n, out);

    yaml_document_delete(&doc);
    yaml_parser_delete(&parser);
    fclose(f);

    cfg = out;
    HL_LOG(info, "[config] Loaded " << path << ": " << cfg.sample_rate << " Hz, "
           << cfg.eq_bands << " EQ bands, preset "
           << hldsp::audio_profile_to_string(cfg.preset));
    return true;
}
