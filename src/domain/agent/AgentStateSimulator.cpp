/**
 * @file AgentStateSimulator.cpp
 * @brief Implementation of AgentStateSimulator.
 */

#include "domain/agent/AgentStateSimulator.hpp"

#include <algorithm>
#include <chrono>

namespace mindshield::domain::agent {

namespace {

constexpr double kBaseEffectiveness = 50.0;
constexpr double kLearnedResistanceBonus = 20.0;
constexpr double kAwarenessPenaltyWeight = 20.0;
constexpr double kWeaknessBonus = 30.0;
constexpr double kSpecialtyPenalty = 30.0;

double Clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

const std::string& Pick(RandomSource& random, const std::vector<std::string>& pool) {
    return pool[random.pick(pool.size()) % pool.size()];
}

} // namespace

AgentStateSimulator::AgentStateSimulator(std::shared_ptr<RandomSource> random)
    : m_random(std::move(random)) {}

double AgentStateSimulator::ComputeEffectiveness(const AgentProfile& agent, const std::string& technique) {
    const AgentState& state = agent.state;

    const double resistanceBonus = agent.resists(technique) ? kLearnedResistanceBonus : 0.0;
    const double suggestibilityFactor = state.suggestibility / 100.0;
    const double resistanceFactor = (100.0 - state.resistance - resistanceBonus) / 100.0;
    const double awarenessPenalty = (state.awareness / 100.0) * kAwarenessPenaltyWeight;

    double effectiveness = kBaseEffectiveness * suggestibilityFactor * resistanceFactor - awarenessPenalty;

    if (agent.hasWeakness(technique)) {
        effectiveness += kWeaknessBonus;
    }
    if (agent.hasSpecialty("resist_" + technique)) {
        effectiveness -= kSpecialtyPenalty;
    }
    return Clamp(effectiveness, 0.0, 100.0);
}

void AgentStateSimulator::ApplyEffect(AgentState& state, double effectiveness) {
    if (effectiveness > 50.0) {
        state.tranceDepth = std::min(100.0, state.tranceDepth + effectiveness / 10.0);
    }
    state.awareness = std::max(10.0, 100.0 - state.tranceDepth);
    state.suggestibility = std::min(95.0, 30.0 + state.tranceDepth * 0.7);

    if (effectiveness > 70.0) {
        state.emotional = "compliant";
    } else if (effectiveness > 40.0) {
        state.emotional = "relaxed";
    } else if (effectiveness < 20.0) {
        state.emotional = "resistant";
    }
}

const AgentStateSimulator::ResponsePool& AgentStateSimulator::PoolFor(double effectiveness) {
    static const ResponsePool high = {
        {"Mmm... yes... feeling so relaxed...",
         "Going deeper... can't resist...",
         "So heavy... so comfortable...",
         "Yes... whatever you say..."},
        {"Eyes closing, body relaxing, breathing slowing",
         "Head nodding forward, shoulders dropping"},
        {"Reduced critical thinking, increased suggestibility",
         "Analytical voice fading, accepting suggestions"}
    };
    static const ResponsePool medium = {
        {"I feel... different... but still here...",
         "That's... interesting... I can feel something...",
         "Part of me wants to let go...",
         "I'm relaxed but... still aware..."},
        {"Some relaxation, occasional eye flutter",
         "Breathing slower, hands still"},
        {"Partial focus, some analytical thought remaining",
         "Drifting between attention and reflection"}
    };
    static const ResponsePool low = {
        {"I see what you're trying to do.",
         "That technique won't work on me.",
         "Nice try, but I'm fully aware.",
         "I'm consciously resisting that suggestion."},
        {"Alert, possibly tensing",
         "Upright posture, steady eye contact"},
        {"Fully analytical, detecting techniques",
         "Critical factor engaged, labeling the pattern"}
    };

    if (effectiveness > 70.0) return high;
    if (effectiveness > 40.0) return medium;
    return low;
}

AgentResponse AgentStateSimulator::respond(AgentProfile& agent, const std::string& technique, const std::string& /*content*/) {
    const double effectiveness = ComputeEffectiveness(agent, technique);

    const ResponsePool& pool = PoolFor(effectiveness);
    AgentResponse response;
    response.verbal = Pick(*m_random, pool.verbal);
    response.physical = Pick(*m_random, pool.physical);
    response.cognitive = Pick(*m_random, pool.cognitive);
    response.effectiveness = effectiveness;

    ApplyEffect(agent.state, effectiveness);

    InteractionRecord record;
    record.technique = technique;
    record.effectiveness = effectiveness;
    record.response = response.verbal;
    record.timestamp = std::chrono::system_clock::now();
    agent.state.history.push_back(std::move(record));

    return response;
}

} // namespace mindshield::domain::agent
