/**
 * @file JsonMapper.hpp
 * @brief nlohmann::json views of the core's result types.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/agent/AgentProfile.hpp"
#include "domain/agent/LearningProfile.hpp"
#include "domain/emergency/EmergencyProtocol.hpp"
#include "domain/threat/DefenseAnalysis.hpp"
#include "domain/threat/DefenseStrategy.hpp"
#include "domain/threat/ThreatPattern.hpp"

namespace mindshield::infrastructure {

class JsonMapper {
public:
    static nlohmann::json ToJson(const domain::threat::DefenseAnalysis& analysis);
    static nlohmann::json ToJson(const domain::threat::DetectedThreat& threat);
    static nlohmann::json ToJson(const domain::threat::DefenseStrategy& strategy);
    static nlohmann::json ToJson(const domain::threat::ThreatPattern& pattern);
    static nlohmann::json ToJson(const domain::emergency::EmergencyProtocol& protocol);
    static nlohmann::json ToJson(const domain::emergency::GroundingResponse& grounding);
    static nlohmann::json ToJson(const domain::agent::AgentProfile& profile);
    static nlohmann::json ToJson(const domain::agent::AgentResponse& response);
    static nlohmann::json ToJson(const domain::agent::LearningProfile& learning);

    /** @brief Milliseconds since epoch, as stored in event logs. */
    static long long ToEpochMillis(std::chrono::system_clock::time_point tp);
};

} // namespace mindshield::infrastructure
