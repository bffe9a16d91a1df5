/**
 * @file AgentProfile.hpp
 * @brief Simulated interlocutor: static traits plus owned mutable state.
 */

#pragma once

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace mindshield::domain::agent {

enum class Archetype {
    Susceptible,
    Resistant,
    Adversarial
};

enum class Difficulty {
    Easy,
    Medium,
    Hard,
    Expert
};

inline std::string ArchetypeToString(Archetype archetype) {
    switch (archetype) {
        case Archetype::Susceptible: return "susceptible";
        case Archetype::Resistant: return "resistant";
        case Archetype::Adversarial: return "adversarial";
        default: return "susceptible";
    }
}

/**
 * @brief "offensive" is accepted as a synonym for adversarial; anything
 * unrecognized resolves to Susceptible.
 */
inline Archetype ArchetypeFromString(const std::string& value) {
    if (value == "resistant") return Archetype::Resistant;
    if (value == "adversarial" || value == "offensive") return Archetype::Adversarial;
    return Archetype::Susceptible;
}

inline std::string DifficultyToString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
        case Difficulty::Expert: return "expert";
        default: return "easy";
    }
}

inline Difficulty DifficultyFromString(const std::string& value) {
    if (value == "medium") return Difficulty::Medium;
    if (value == "hard") return Difficulty::Hard;
    if (value == "expert") return Difficulty::Expert;
    return Difficulty::Easy;
}

struct InteractionRecord {
    std::string technique;
    double effectiveness = 0.0;
    std::string response;   ///< Verbal response text.
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct AgentState
 * @brief Mutated only by AgentStateSimulator (and the resistance step of
 * AdaptiveLearningTracker).
 *
 * Invariant: the four numeric fields stay within [0, 100].
 */
struct AgentState {
    double tranceDepth = 0.0;
    double resistance = 0.0;
    double suggestibility = 0.0;
    double awareness = 0.0;
    std::string emotional;
    std::vector<InteractionRecord> history;   ///< Append-only.
};

struct AgentProfile {
    std::string id;
    std::string name;
    Archetype archetype = Archetype::Susceptible;
    Difficulty difficulty = Difficulty::Easy;
    std::string personality;
    int skillLevel = 1;      ///< 1-10
    int adaptability = 1;    ///< 1-10
    std::vector<std::string> specialties;
    std::vector<std::string> weaknesses;
    std::set<std::string> resistancePatterns;  ///< Techniques learned through adaptation.
    bool adaptiveLearning = true;
    AgentState state;

    bool hasWeakness(const std::string& technique) const {
        for (const auto& w : weaknesses) {
            if (w == technique) return true;
        }
        return false;
    }

    bool hasSpecialty(const std::string& tag) const {
        for (const auto& s : specialties) {
            if (s == tag) return true;
        }
        return false;
    }

    bool resists(const std::string& technique) const {
        return resistancePatterns.count(technique) > 0;
    }
};

struct AgentResponse {
    std::string verbal;
    std::string physical;
    std::string cognitive;
    double effectiveness = 0.0;
};

/**
 * @brief Raised by any operation that references an agent id nobody created.
 */
class AgentNotFoundError : public std::runtime_error {
public:
    explicit AgentNotFoundError(const std::string& agentId)
        : std::runtime_error("Agent not found: " + agentId), m_agentId(agentId) {}

    const std::string& agentId() const { return m_agentId; }

private:
    std::string m_agentId;
};

} // namespace mindshield::domain::agent
