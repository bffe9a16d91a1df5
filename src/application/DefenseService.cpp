/**
 * @file DefenseService.cpp
 * @brief Implementation of DefenseService.
 */

#include "application/DefenseService.hpp"

#include "domain/threat/ThreatDetector.hpp"
#include "domain/threat/services/CounterMeasureGenerator.hpp"
#include "domain/threat/services/RecommendationGenerator.hpp"
#include "domain/threat/services/StrategySelector.hpp"

namespace mindshield::application {

using namespace mindshield::domain::threat;
using namespace mindshield::domain::emergency;

DefenseService::DefenseService(DefenseMode defaultMode,
                               StatusCallback statusCallback,
                               EmergencyProtocolController emergency)
    : m_defaultMode(defaultMode),
      m_statusCallback(std::move(statusCallback)),
      m_emergency(std::move(emergency)) {}

void DefenseService::report(const std::string& message) const {
    if (m_statusCallback) m_statusCallback("[DefenseService] " + message);
}

DefenseAnalysis DefenseService::analyzeThreat(const std::string& input) const {
    return analyzeThreat(input, m_defaultMode);
}

DefenseAnalysis DefenseService::analyzeThreat(const std::string& input, DefenseMode mode) const {
    DefenseAnalysis analysis;
    analysis.detections = ThreatDetector::Detect(input);
    analysis.threatLevel = ThreatDetector::Classify(analysis.detections);
    analysis.threatDetected = !analysis.detections.empty();

    const DefenseStrategy& strategy = StrategySelector::Select(analysis.threatLevel, mode);
    analysis.defenseStrategy = strategy.key;
    analysis.defenseStrategyName = strategy.name;

    // An empty analysis carries no counter-measures at all, not even the
    // strategy's default actions.
    if (analysis.threatDetected) {
        analysis.attackType = analysis.detections.front().category;
        for (const auto& d : analysis.detections) {
            analysis.attackPatterns.push_back(d.description);
        }
        analysis.counterMeasures = CounterMeasureGenerator::Generate(analysis.detections, strategy);
    }

    analysis.recommendations = RecommendationGenerator::Recommend(analysis.threatLevel, analysis.detections);
    analysis.confidence = ThreatDetector::Confidence(analysis.detections);

    if (analysis.threatDetected) {
        report("Threat " + ThreatLevelToString(analysis.threatLevel) +
               " (" + *analysis.attackType + "), strategy " + strategy.key +
               ", mode " + DefenseModeToString(mode));
    }
    return analysis;
}

EmergencyProtocol DefenseService::activateEmergencyProtocol() const {
    report("Emergency protocol activated");
    return m_emergency.activate();
}

GroundingResponse DefenseService::groundingProtocol() const {
    return m_emergency.grounding();
}

} // namespace mindshield::application
