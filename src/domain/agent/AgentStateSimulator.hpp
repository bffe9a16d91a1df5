/**
 * @file AgentStateSimulator.hpp
 * @brief Scores a technique against an agent and evolves its state.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "domain/agent/AgentProfile.hpp"
#include "domain/agent/RandomSource.hpp"

namespace mindshield::domain::agent {

/**
 * @class AgentStateSimulator
 * @brief The only writer of AgentState besides the adaptation step.
 *
 * Not synchronized: callers serialize respond() per agent.
 */
class AgentStateSimulator {
public:
    struct ResponsePool {
        std::vector<std::string> verbal;
        std::vector<std::string> physical;
        std::vector<std::string> cognitive;
    };

    explicit AgentStateSimulator(std::shared_ptr<RandomSource> random);

    /**
     * @brief Applies a technique: computes effectiveness, picks the response,
     * updates state and appends the interaction to the history.
     */
    AgentResponse respond(AgentProfile& agent, const std::string& technique, const std::string& content);

    /** @brief Effectiveness in [0, 100] for the agent's current state. */
    static double ComputeEffectiveness(const AgentProfile& agent, const std::string& technique);

    /** @brief Steps 1-4 of the state update (history is appended by respond). */
    static void ApplyEffect(AgentState& state, double effectiveness);

    /** @brief Tier pools: >70 high, >40 medium, otherwise low. */
    static const ResponsePool& PoolFor(double effectiveness);

private:
    std::shared_ptr<RandomSource> m_random;
};

} // namespace mindshield::domain::agent
