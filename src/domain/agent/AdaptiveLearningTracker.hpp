/**
 * @file AdaptiveLearningTracker.hpp
 * @brief Feedback loop from repeated effective exposure to learned resistance.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "domain/agent/AgentProfile.hpp"
#include "domain/agent/LearningProfile.hpp"

namespace mindshield::domain::agent {

/**
 * @class AdaptiveLearningTracker
 * @brief Owns one LearningProfile per agent id.
 *
 * The internal mutex only guards the id -> ledger map. A ledger entry is
 * mutated by recordInteraction() and must be accessed under the same
 * per-agent exclusion that protects the AgentProfile passed in, so that
 * "count -> maybe adapt -> raise resistance" is observed as one unit.
 */
class AdaptiveLearningTracker {
public:
    static constexpr int kAdaptationInterval = 5;
    static constexpr double kEffectiveThreshold = 70.0;
    static constexpr double kResistanceStep = 5.0;
    static constexpr double kResistanceCap = 95.0;

    /** @brief Creates an empty ledger. Re-registering an id is a no-op. */
    void registerAgent(const std::string& agentId);

    bool isRegistered(const std::string& agentId) const;

    /** @brief Drops the ledger. Returns false for unknown ids. */
    bool forget(const std::string& agentId);

    /**
     * @brief Adds one interaction to the agent's ledger; every fifth one
     * triggers adapt().
     * @return True when this call ran an adaptation cycle.
     * @throws AgentNotFoundError if agent.id was never registered.
     */
    bool recordInteraction(AgentProfile& agent, const std::string& technique, double effectiveness);

    /** @brief Snapshot of the ledger, nullopt for unknown ids. */
    std::optional<LearningProfile> profile(const std::string& agentId) const;

private:
    void adapt(AgentProfile& agent, LearningProfile& learning);
    LearningProfile* find(const std::string& agentId) const;

    mutable std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<LearningProfile>> m_profiles;
};

} // namespace mindshield::domain::agent
