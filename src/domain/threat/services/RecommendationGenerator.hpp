/**
 * @file RecommendationGenerator.hpp
 * @brief Threshold-driven advisory lines for an analysis.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/threat/ThreatLevel.hpp"
#include "domain/threat/ThreatPattern.hpp"

namespace mindshield::domain::threat {

class RecommendationGenerator {
public:
    static std::vector<std::string> Recommend(ThreatLevel level, const std::vector<DetectedThreat>& detections) {
        std::vector<std::string> recommendations;

        if (level == ThreatLevel::Critical) {
            recommendations.push_back("IMMEDIATE ACTION: Physically remove yourself from situation");
            recommendations.push_back("Activate full shield protocol");
            recommendations.push_back("Call trusted friend for reality check");
        }

        if (level == ThreatLevel::High) {
            recommendations.push_back("Maintain heightened awareness");
            recommendations.push_back("Use pattern interrupt techniques");
            recommendations.push_back("Focus on physical sensations");
        }

        if (!detections.empty()) {
            recommendations.push_back("Document this interaction for analysis");
            recommendations.push_back("Practice defensive techniques regularly");
            recommendations.push_back("Share experience with support network");
        }

        return recommendations;
    }
};

} // namespace mindshield::domain::threat
