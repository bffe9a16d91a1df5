/**
 * @file AgentProfileFactory.cpp
 * @brief Implementation of AgentProfileFactory.
 */

#include "domain/agent/AgentProfileFactory.hpp"

#include <atomic>
#include <map>
#include <random>

namespace mindshield::domain::agent {

namespace {

struct Preset {
    std::string name;
    std::string personality;
    int skillLevel;
    int adaptability;
    std::vector<std::string> specialties;
    std::vector<std::string> weaknesses;
    double resistance;
    double suggestibility;
    double awareness;
    std::string emotional;
};

const std::map<std::string, Preset>& Presets() {
    static const std::map<std::string, Preset> presets = {
        {"susceptible_easy", {
            "Alex (Highly Susceptible)",
            "Trusting, imaginative, and eager to experience hypnosis",
            2, 3,
            {},
            {"visualization", "relaxation", "trust"},
            10, 90, 50, "curious"
        }},
        {"susceptible_medium", {
            "Jordan (Moderately Susceptible)",
            "Open-minded but occasionally analytical",
            4, 5,
            {"pattern_recognition"},
            {"confusion", "fractionation"},
            30, 70, 60, "neutral"
        }},
        {"resistant_hard", {
            "Morgan (Highly Resistant)",
            "Skeptical, analytical, and consciously resistant",
            7, 8,
            {"critical_thinking", "pattern_detection", "conscious_resistance"},
            {"overload", "double_binds"},
            80, 20, 90, "skeptical"
        }},
        {"adversarial_expert", {
            "Dr. Shadow (Master Hypnotist)",
            "Cunning, adaptive, uses advanced techniques",
            10, 10,
            {"rapid_induction", "covert_hypnosis", "nlp_mastery", "confusion_techniques"},
            {},
            95, 5, 100, "focused"
        }}
    };
    return presets;
}

std::string PresetKey(Archetype archetype, Difficulty difficulty) {
    return ArchetypeToString(archetype) + "_" + DifficultyToString(difficulty);
}

std::string RandomSuffix() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);

    std::string s;
    s.reserve(9);
    for (int i = 0; i < 9; ++i) {
        s += alphabet[dist(engine)];
    }
    return s;
}

} // namespace

bool AgentProfileFactory::HasPreset(Archetype archetype, Difficulty difficulty) {
    return Presets().count(PresetKey(archetype, difficulty)) > 0;
}

std::string AgentProfileFactory::GenerateId() {
    static std::atomic<unsigned long long> sequence{0};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "agent_" + std::to_string(ms) + "_" + std::to_string(++sequence) + "_" + RandomSuffix();
}

AgentProfile AgentProfileFactory::Create(Archetype archetype, Difficulty difficulty, bool adaptiveLearning) {
    const auto& presets = Presets();
    auto it = presets.find(PresetKey(archetype, difficulty));
    const Preset& preset = (it != presets.end()) ? it->second : presets.at("susceptible_easy");

    AgentProfile profile;
    profile.id = GenerateId();
    profile.name = preset.name;
    profile.archetype = archetype;
    profile.difficulty = difficulty;
    profile.personality = preset.personality;
    profile.skillLevel = preset.skillLevel;
    profile.adaptability = preset.adaptability;
    profile.specialties = preset.specialties;
    profile.weaknesses = preset.weaknesses;
    profile.adaptiveLearning = adaptiveLearning;

    profile.state.tranceDepth = 0;
    profile.state.resistance = preset.resistance;
    profile.state.suggestibility = preset.suggestibility;
    profile.state.awareness = preset.awareness;
    profile.state.emotional = preset.emotional;
    return profile;
}

} // namespace mindshield::domain::agent
