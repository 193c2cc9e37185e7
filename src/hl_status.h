// hl_status.h - Result codes returned by the HearLoop control API
//
// Every status is recoverable. Numeric parameters outside their valid range
// are clamped by the callee and never produce a status other than OK.
#pragma once

enum class HlStatus {
    OK,
    INVALID_STATE,       // operation called outside its valid state
    INDEX_OUT_OF_RANGE,  // EQ band index >= band count
    ENGINE_UNAVAILABLE   // audio device / tone sink not running
};

inline const char* hl_status_to_string(HlStatus s)
{
    switch (s) {
    case HlStatus::OK:                 return "ok";
    case HlStatus::INVALID_STATE:      return "invalid_state";
    case HlStatus::INDEX_OUT_OF_RANGE: return "index_out_of_range";
    case HlStatus::ENGINE_UNAVAILABLE: return "engine_unavailable";
    }
    return "unknown";
}
