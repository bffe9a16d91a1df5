/**
 * @file AgentProfileFactory.hpp
 * @brief Builds agents from the fixed preset table.
 */

#pragma once

#include <string>

#include "domain/agent/AgentProfile.hpp"

namespace mindshield::domain::agent {

/**
 * @class AgentProfileFactory
 * @brief Presets are keyed "<archetype>_<difficulty>". Combinations outside
 * the table (e.g. resistant/easy) use the susceptible_easy preset; the
 * returned profile still records the archetype and difficulty requested.
 */
class AgentProfileFactory {
public:
    static AgentProfile Create(Archetype archetype, Difficulty difficulty, bool adaptiveLearning);

    /** @brief True when the combination has its own preset. */
    static bool HasPreset(Archetype archetype, Difficulty difficulty);

    /** @brief Unique per call, e.g. "agent_1760900000000_3_k2f9x0qa1". */
    static std::string GenerateId();
};

} // namespace mindshield::domain::agent
