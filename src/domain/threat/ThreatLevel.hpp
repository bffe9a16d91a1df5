/**
 * @file ThreatLevel.hpp
 * @brief Value Objects for threat severity and defense mode.
 */

#pragma once

#include <string>

namespace mindshield::domain::threat {

/**
 * @enum ThreatLevel
 * @brief Ordinal severity derived from the highest detection score.
 */
enum class ThreatLevel {
    None,       ///< Nothing scored above 20.
    Low,
    Medium,
    High,
    Critical    ///< Highest score above 80.
};

/**
 * @enum DefenseMode
 * @brief Caller preference for how hard the response should push back.
 */
enum class DefenseMode {
    Aggressive,
    Passive,
    Auto
};

/**
 * @brief Helper to convert level to string for display/logging.
 */
inline std::string ThreatLevelToString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::None: return "none";
        case ThreatLevel::Low: return "low";
        case ThreatLevel::Medium: return "medium";
        case ThreatLevel::High: return "high";
        case ThreatLevel::Critical: return "critical";
        default: return "none";
    }
}

inline std::string DefenseModeToString(DefenseMode mode) {
    switch (mode) {
        case DefenseMode::Aggressive: return "aggressive";
        case DefenseMode::Passive: return "passive";
        case DefenseMode::Auto: return "auto";
        default: return "auto";
    }
}

/**
 * @brief Parses a mode string. Unrecognized values resolve to Auto.
 */
inline DefenseMode DefenseModeFromString(const std::string& value) {
    if (value == "aggressive") return DefenseMode::Aggressive;
    if (value == "passive") return DefenseMode::Passive;
    return DefenseMode::Auto;
}

/**
 * @brief Maps a maximum detection score onto the fixed severity thresholds.
 */
inline ThreatLevel ThreatLevelFromScore(int maxScore) {
    if (maxScore > 80) return ThreatLevel::Critical;
    if (maxScore > 60) return ThreatLevel::High;
    if (maxScore > 40) return ThreatLevel::Medium;
    if (maxScore > 20) return ThreatLevel::Low;
    return ThreatLevel::None;
}

} // namespace mindshield::domain::threat
