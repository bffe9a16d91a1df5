/**
 * @file EmergencyProtocol.hpp
 * @brief Fixed extraction sequence and grounding bundle.
 */

#pragma once

#include <string>
#include <vector>

namespace mindshield::domain::emergency {

struct GroundingResponse {
    std::string affirmation;
    std::vector<std::string> anchorPoints;   ///< 5 entries.
    std::vector<std::string> realityChecks;  ///< 5 entries, the first carries today's date.
    std::string breathingPattern;
    std::vector<std::string> physicalActions; ///< 5 entries.
};

struct EmergencyProtocol {
    std::string status = "activated";
    std::vector<std::string> extractionSteps; ///< STOP .. RECOVER, 7 entries.
    GroundingResponse groundingSequence;
    bool shieldActivated = true;
    bool counterAttackReady = true;
    std::string safeWord;
};

} // namespace mindshield::domain::emergency
