// hearing_profile.h - Audiogram data shared by the test engine and the mapper
// HearLoop v1.0.0
#pragma once

#include <array>
#include <map>
#include <sstream>
#include <string>

// Frequency (Hz) -> threshold (dB HL). Absent key = no data / flat response.
using HearingProfile = std::map<int, float>;

// Fixed audiometric test frequencies. Order matters: band i of the EQ is
// bound to frequency i.
constexpr std::array<int, 7> kTestFrequencies = { 125, 250, 500, 1000, 2000, 4000, 8000 };

// Recorded when a frequency was not heard up to the maximum level.
constexpr float kNotHeardThreshold = 999.0f;

inline bool hl_threshold_not_heard(float db_hl) { return db_hl == kNotHeardThreshold; }

// "125:45 250:30 500:N/A" - for logs and the CLI
inline std::string hearing_profile_to_string(const HearingProfile& p)
{
    if (p.empty()) return "(empty)";
    std::ostringstream ss;
    bool first = true;
    for (const auto& kv : p) {
        if (!first) ss << ' ';
        first = false;
        ss << kv.first << ':';
        if (hl_threshold_not_heard(kv.second)) ss << "N/A";
        else                                   ss << kv.second;
    }
    return ss.str();
}
