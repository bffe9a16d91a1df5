/**
 * @file LearningProfile.hpp
 * @brief Per-agent ledger of technique exposure.
 */

#pragma once

#include <map>
#include <string>

namespace mindshield::domain::agent {

struct TechniqueStats {
    int count = 0;
    double totalEffectiveness = 0.0;

    double mean() const { return count > 0 ? totalEffectiveness / count : 0.0; }
};

struct LearningProfile {
    int totalInteractions = 0;
    std::map<std::string, TechniqueStats> techniqueEffectiveness;
    int adaptationLevel = 0;   ///< Only ever increases.
};

} // namespace mindshield::domain::agent
