/**
 * @file AgentBriefing.hpp
 * @brief Practice-session instructions shown for an agent.
 */

#pragma once

#include <sstream>
#include <string>
#include <vector>

#include "domain/agent/AgentProfile.hpp"

namespace mindshield::domain::agent {

class AgentBriefing {
public:
    static std::string Render(const AgentProfile& profile) {
        std::ostringstream out;
        switch (profile.archetype) {
            case Archetype::Resistant:
                out << "This practice partner is " << profile.name << ".\n"
                    << "They are " << profile.personality << ".\n\n"
                    << "Current Defense Level: " << Percent(profile.state.resistance) << "\n"
                    << "Specialties: " << Join(profile.specialties) << "\n\n"
                    << "This is a challenging subject. They will actively resist your attempts.\n"
                    << "Look for their weaknesses: " << Join(profile.weaknesses) << "\n\n"
                    << "The agent learns from your techniques and becomes more resistant over time.\n";
                break;
            case Archetype::Adversarial:
                out << "WARNING: This is " << profile.name << ".\n"
                    << "They are " << profile.personality << ".\n\n"
                    << "Skills: " << Join(profile.specialties) << "\n"
                    << "Threat Level: " << profile.skillLevel << "/10\n\n"
                    << "They will attempt to hypnotize YOU. Practice your defensive techniques.\n"
                    << "Stay aware and use the defense protocols when needed.\n\n"
                    << "Say \"They got me\" if you need emergency extraction.\n";
                break;
            case Archetype::Susceptible:
            default:
                out << "This practice partner is " << profile.name << ".\n"
                    << "They are " << profile.personality << ".\n\n"
                    << "Current State:\n"
                    << "- Trance Depth: " << Percent(profile.state.tranceDepth) << "\n"
                    << "- Resistance: " << Percent(profile.state.resistance) << "\n"
                    << "- Suggestibility: " << Percent(profile.state.suggestibility) << "\n\n"
                    << "Weaknesses: " << Join(profile.weaknesses) << "\n\n"
                    << "Try different induction techniques and observe their responses.\n"
                    << "The agent will adapt to your techniques over time, becoming more challenging.\n";
                break;
        }
        return out.str();
    }

private:
    static std::string Percent(double value) {
        return std::to_string(static_cast<int>(value + 0.5)) + "%";
    }

    static std::string Join(const std::vector<std::string>& items) {
        if (items.empty()) return "none";
        std::string joined;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) joined += ", ";
            joined += items[i];
        }
        return joined;
    }
};

} // namespace mindshield::domain::agent
