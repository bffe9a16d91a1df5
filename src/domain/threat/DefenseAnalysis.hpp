/**
 * @file DefenseAnalysis.hpp
 * @brief Output aggregate of one threat analysis.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/threat/ThreatLevel.hpp"
#include "domain/threat/ThreatPattern.hpp"

namespace mindshield::domain::threat {

/**
 * @struct DefenseAnalysis
 * @brief Created fresh per call; holds no references into the catalogs.
 */
struct DefenseAnalysis {
    bool threatDetected = false;
    ThreatLevel threatLevel = ThreatLevel::None;
    std::optional<std::string> attackType;   ///< Top-scoring category, if any.
    std::vector<std::string> attackPatterns; ///< Matched category descriptions.
    std::string defenseStrategy;             ///< Strategy key.
    std::string defenseStrategyName;         ///< Strategy display name.
    std::vector<std::string> counterMeasures;
    std::vector<std::string> recommendations;
    int confidence = 0;                      ///< 0-100.

    std::vector<DetectedThreat> detections;
};

} // namespace mindshield::domain::threat
