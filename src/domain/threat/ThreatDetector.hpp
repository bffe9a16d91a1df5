/**
 * @file ThreatDetector.hpp
 * @brief Keyword/indicator scoring of an utterance against the pattern catalog.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/threat/ThreatLevel.hpp"
#include "domain/threat/ThreatPattern.hpp"

namespace mindshield::domain::threat {

/**
 * @class ThreatDetector
 * @brief Stateless scorer. Every method is a pure function of its arguments
 * and the immutable catalog, so it may be called from any thread.
 */
class ThreatDetector {
public:
    static constexpr int kKeywordWeight = 10;
    static constexpr int kIndicatorWeight = 20;
    static constexpr int kReportThreshold = 30;

    /**
     * @brief Scores the input against every category.
     * @param input Raw utterance; matching is case-insensitive.
     * @return Categories scoring above the report threshold, highest score
     *         first, ties in catalog order. Empty for blank input.
     */
    static std::vector<DetectedThreat> Detect(const std::string& input);

    /**
     * @brief Scores a single category. Exposed for diagnostics and tests.
     * @param normalizedInput Input already lower-cased.
     */
    static int Score(const ThreatPattern& pattern, const std::string& normalizedInput);

    /**
     * @brief Evaluates a named indicator. Indicators without a structural
     * test never match.
     */
    static bool MatchesIndicator(const std::string& indicator, const std::string& normalizedInput);

    /** @brief Severity from the highest score; None when nothing was detected. */
    static ThreatLevel Classify(const std::vector<DetectedThreat>& detections);

    /** @brief Rounded mean confidence scaled to 0-100; 0 when empty. */
    static int Confidence(const std::vector<DetectedThreat>& detections);
};

} // namespace mindshield::domain::threat
