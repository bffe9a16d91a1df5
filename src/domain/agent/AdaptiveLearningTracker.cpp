/**
 * @file AdaptiveLearningTracker.cpp
 * @brief Implementation of AdaptiveLearningTracker.
 */

#include "domain/agent/AdaptiveLearningTracker.hpp"

#include <algorithm>

namespace mindshield::domain::agent {

void AdaptiveLearningTracker::registerAgent(const std::string& agentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_profiles.count(agentId) == 0) {
        m_profiles.emplace(agentId, std::make_unique<LearningProfile>());
    }
}

bool AdaptiveLearningTracker::isRegistered(const std::string& agentId) const {
    return find(agentId) != nullptr;
}

bool AdaptiveLearningTracker::forget(const std::string& agentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profiles.erase(agentId) > 0;
}

LearningProfile* AdaptiveLearningTracker::find(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_profiles.find(agentId);
    return it != m_profiles.end() ? it->second.get() : nullptr;
}

std::optional<LearningProfile> AdaptiveLearningTracker::profile(const std::string& agentId) const {
    LearningProfile* learning = find(agentId);
    if (!learning) return std::nullopt;
    return *learning;
}

bool AdaptiveLearningTracker::recordInteraction(AgentProfile& agent, const std::string& technique, double effectiveness) {
    LearningProfile* learning = find(agent.id);
    if (!learning) {
        throw AgentNotFoundError(agent.id);
    }

    learning->totalInteractions++;
    TechniqueStats& stats = learning->techniqueEffectiveness[technique];
    stats.count++;
    stats.totalEffectiveness += effectiveness;

    if (learning->totalInteractions % kAdaptationInterval == 0) {
        adapt(agent, *learning);
        return true;
    }
    return false;
}

void AdaptiveLearningTracker::adapt(AgentProfile& agent, LearningProfile& learning) {
    learning.adaptationLevel++;

    for (const auto& entry : learning.techniqueEffectiveness) {
        if (entry.second.mean() > kEffectiveThreshold) {
            agent.state.resistance = std::min(kResistanceCap, agent.state.resistance + kResistanceStep);
            agent.resistancePatterns.insert(entry.first);
        }
    }
}

} // namespace mindshield::domain::agent
