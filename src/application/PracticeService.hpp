/**
 * @file PracticeService.hpp
 * @brief Application Service owning practice agents and their learning ledgers.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "domain/agent/AdaptiveLearningTracker.hpp"
#include "domain/agent/AgentProfile.hpp"
#include "domain/agent/AgentStateSimulator.hpp"
#include "domain/agent/RandomSource.hpp"

namespace mindshield::application {

/**
 * @class PracticeService
 * @brief Registry of live agents with per-agent serialization.
 *
 * Calls against the same agent id block on that agent's mutex, so
 * "simulate -> record -> maybe adapt" is atomic for any later reader.
 * Calls against different ids run in parallel. All operations taking an
 * agent id throw domain::agent::AgentNotFoundError for unknown ids.
 */
class PracticeService {
public:
    using StatusCallback = std::function<void(const std::string&)>;

    explicit PracticeService(std::shared_ptr<domain::agent::RandomSource> random,
                             StatusCallback statusCallback = nullptr);

    domain::agent::AgentProfile createAgent(domain::agent::Archetype archetype,
                                            domain::agent::Difficulty difficulty,
                                            bool adaptiveLearning);

    domain::agent::AgentProfile createAgent(const std::string& archetype,
                                            const std::string& difficulty,
                                            bool adaptiveLearning);

    /**
     * @brief Applies a technique to the agent and, when adaptive learning is
     * enabled for it, feeds the result into the learning ledger.
     */
    domain::agent::AgentResponse respondToTechnique(const std::string& agentId,
                                                    const std::string& technique,
                                                    const std::string& content);

    /**
     * @brief Records an interaction directly (replay). Always records,
     * regardless of the agent's adaptive-learning flag.
     * @return The ledger after the update.
     * @throws std::invalid_argument if effectiveness is outside [0, 100].
     */
    domain::agent::LearningProfile recordLearning(const std::string& agentId,
                                                  const std::string& technique,
                                                  double effectiveness);

    /**
     * @brief Drops the agent and its ledger. Waits for in-flight calls on
     * the agent; later calls with this id raise AgentNotFoundError.
     */
    void removeAgent(const std::string& agentId);

    // Retrieval (snapshots, taken under the agent's lock)
    domain::agent::AgentProfile getAgent(const std::string& agentId) const;
    domain::agent::LearningProfile getLearningProfile(const std::string& agentId) const;
    std::string getBriefing(const std::string& agentId) const;
    size_t agentCount() const;

private:
    struct AgentSession {
        std::mutex mutex;
        domain::agent::AgentProfile profile;
    };

    std::shared_ptr<AgentSession> findSession(const std::string& agentId) const;
    void record(domain::agent::AgentProfile& profile, const std::string& technique, double effectiveness);
    void report(const std::string& message) const;

    mutable std::mutex m_registryMutex;
    std::map<std::string, std::shared_ptr<AgentSession>> m_sessions;

    domain::agent::AgentStateSimulator m_simulator;
    domain::agent::AdaptiveLearningTracker m_tracker;
    StatusCallback m_statusCallback;
};

} // namespace mindshield::application
