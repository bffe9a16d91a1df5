/**
 * @file ThreatPattern.hpp
 * @brief Attack categories and per-analysis detection results.
 */

#pragma once

#include <string>
#include <vector>

namespace mindshield::domain::threat {

/**
 * @struct ThreatPattern
 * @brief A named category of manipulative language.
 *
 * Indicators name structural tests evaluated by the ThreatDetector;
 * keywords are matched as lower-case substrings.
 */
struct ThreatPattern {
    std::string id;                       ///< Stable key, e.g. "embedded_commands".
    std::vector<std::string> indicators;
    std::vector<std::string> keywords;
    std::string description;
};

/**
 * @struct DetectedThreat
 * @brief Result of scoring one ThreatPattern against one input.
 */
struct DetectedThreat {
    std::string category;
    std::string description;
    int score = 0;
    double confidence = 0.0;   ///< min(score / 100, 1).
};

/**
 * @class ThreatPatternCatalog
 * @brief Read-only table of the known attack categories.
 */
class ThreatPatternCatalog {
public:
    /** @brief All categories in declaration order. */
    static const std::vector<ThreatPattern>& All();

    /** @brief Lookup by id. Returns nullptr for unknown ids. */
    static const ThreatPattern* Find(const std::string& id);
};

} // namespace mindshield::domain::threat
