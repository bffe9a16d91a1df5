/**
 * @file DefenseStrategyCatalog.cpp
 * @brief Fixed strategy table.
 */

#include "domain/threat/DefenseStrategy.hpp"

#include <stdexcept>

namespace mindshield::domain::threat {

namespace {

std::vector<DefenseStrategy> BuildStrategies() {
    return {
        {
            "pattern_interrupt",
            "Pattern Interrupt",
            "Break the hypnotic pattern with unexpected response",
            {"Suddenly change topic", "Ask unexpected question", "Physical movement", "Laugh or make joke"},
            85
        },
        {
            "conscious_analysis",
            "Conscious Analysis",
            "Actively analyze and deconstruct the technique",
            {"Identify technique being used", "Call out the pattern", "Explain what they're doing", "Maintain analytical mindset"},
            75
        },
        {
            "reality_anchor",
            "Reality Anchor",
            "Ground yourself in physical reality",
            {"Focus on physical sensations", "Count objects in room", "State current facts", "Touch physical anchor"},
            80
        },
        {
            "counter_suggestion",
            "Counter Suggestion",
            "Override with your own suggestions",
            {"Create opposite suggestion", "Affirm your control", "Set your own mental state", "Reverse the suggestion"},
            70
        },
        {
            "shield_protocol",
            "Mental Shield",
            "Visualize protective barrier",
            {"Imagine protective shield", "Deflect suggestions", "Maintain boundaries", "Strengthen mental walls"},
            65
        }
    };
}

} // namespace

const std::vector<DefenseStrategy>& DefenseStrategyCatalog::All() {
    static const std::vector<DefenseStrategy> strategies = BuildStrategies();
    return strategies;
}

const DefenseStrategy* DefenseStrategyCatalog::Find(const std::string& key) {
    for (const auto& strategy : All()) {
        if (strategy.key == key) return &strategy;
    }
    return nullptr;
}

const DefenseStrategy& DefenseStrategyCatalog::Get(const std::string& key) {
    const DefenseStrategy* strategy = Find(key);
    if (!strategy) {
        throw std::out_of_range("Unknown defense strategy: " + key);
    }
    return *strategy;
}

} // namespace mindshield::domain::threat
