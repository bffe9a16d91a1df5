/**
 * @file JsonMapper.cpp
 * @brief Implementation of JsonMapper.
 */

#include "infrastructure/JsonMapper.hpp"

namespace mindshield::infrastructure {

using json = nlohmann::json;
using namespace mindshield::domain;

long long JsonMapper::ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

json JsonMapper::ToJson(const threat::DetectedThreat& threat) {
    return {
        {"type", threat.category},
        {"pattern", threat.description},
        {"score", threat.score},
        {"confidence", threat.confidence}
    };
}

json JsonMapper::ToJson(const threat::DefenseAnalysis& analysis) {
    json j = {
        {"threatDetected", analysis.threatDetected},
        {"threatLevel", threat::ThreatLevelToString(analysis.threatLevel)},
        {"attackPatterns", analysis.attackPatterns},
        {"defenseStrategy", analysis.defenseStrategy},
        {"defenseStrategyName", analysis.defenseStrategyName},
        {"counterMeasures", analysis.counterMeasures},
        {"recommendations", analysis.recommendations},
        {"confidence", analysis.confidence},
        {"detections", json::array()}
    };
    j["attackType"] = analysis.attackType ? json(*analysis.attackType) : json(nullptr);
    for (const auto& d : analysis.detections) {
        j["detections"].push_back(ToJson(d));
    }
    return j;
}

json JsonMapper::ToJson(const threat::DefenseStrategy& strategy) {
    return {
        {"key", strategy.key},
        {"name", strategy.name},
        {"description", strategy.description},
        {"execution", strategy.execution},
        {"effectiveness", strategy.effectiveness}
    };
}

json JsonMapper::ToJson(const threat::ThreatPattern& pattern) {
    return {
        {"id", pattern.id},
        {"indicators", pattern.indicators},
        {"keywords", pattern.keywords},
        {"description", pattern.description}
    };
}

json JsonMapper::ToJson(const emergency::GroundingResponse& grounding) {
    return {
        {"affirmation", grounding.affirmation},
        {"anchorPoints", grounding.anchorPoints},
        {"realityChecks", grounding.realityChecks},
        {"breathingPattern", grounding.breathingPattern},
        {"physicalActions", grounding.physicalActions}
    };
}

json JsonMapper::ToJson(const emergency::EmergencyProtocol& protocol) {
    return {
        {"status", protocol.status},
        {"extractionSteps", protocol.extractionSteps},
        {"groundingSequence", ToJson(protocol.groundingSequence)},
        {"shieldActivated", protocol.shieldActivated},
        {"counterAttackReady", protocol.counterAttackReady},
        {"safeWord", protocol.safeWord}
    };
}

json JsonMapper::ToJson(const agent::AgentProfile& profile) {
    json history = json::array();
    for (const auto& h : profile.state.history) {
        history.push_back({
            {"technique", h.technique},
            {"effectiveness", h.effectiveness},
            {"response", h.response},
            {"ts", ToEpochMillis(h.timestamp)}
        });
    }

    return {
        {"id", profile.id},
        {"name", profile.name},
        {"type", agent::ArchetypeToString(profile.archetype)},
        {"difficulty", agent::DifficultyToString(profile.difficulty)},
        {"personality", profile.personality},
        {"skillLevel", profile.skillLevel},
        {"adaptability", profile.adaptability},
        {"specialties", profile.specialties},
        {"weaknesses", profile.weaknesses},
        {"resistancePatterns", profile.resistancePatterns},
        {"adaptiveLearning", profile.adaptiveLearning},
        {"currentState", {
            {"tranceDepth", profile.state.tranceDepth},
            {"resistance", profile.state.resistance},
            {"suggestibility", profile.state.suggestibility},
            {"awareness", profile.state.awareness},
            {"emotional", profile.state.emotional},
            {"history", history}
        }}
    };
}

json JsonMapper::ToJson(const agent::AgentResponse& response) {
    return {
        {"verbal", response.verbal},
        {"physical", response.physical},
        {"cognitive", response.cognitive},
        {"effectiveness", response.effectiveness}
    };
}

json JsonMapper::ToJson(const agent::LearningProfile& learning) {
    json techniques = json::object();
    for (const auto& entry : learning.techniqueEffectiveness) {
        techniques[entry.first] = {
            {"count", entry.second.count},
            {"totalEffectiveness", entry.second.totalEffectiveness},
            {"averageEffectiveness", entry.second.mean()}
        };
    }
    return {
        {"totalInteractions", learning.totalInteractions},
        {"adaptationLevel", learning.adaptationLevel},
        {"techniqueEffectiveness", techniques}
    };
}

} // namespace mindshield::infrastructure
