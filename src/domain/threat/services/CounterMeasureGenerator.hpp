/**
 * @file CounterMeasureGenerator.hpp
 * @brief Merges strategy actions with category-specific counters.
 */

#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "domain/threat/DefenseStrategy.hpp"
#include "domain/threat/ThreatPattern.hpp"

namespace mindshield::domain::threat {

class CounterMeasureGenerator {
public:
    /**
     * @brief Strategy actions first, then two counters per detected category.
     * Duplicates are dropped, keeping the first occurrence.
     */
    static std::vector<std::string> Generate(const std::vector<DetectedThreat>& detections,
                                             const DefenseStrategy& strategy) {
        std::vector<std::string> measures;
        auto append = [&measures](const std::string& measure) {
            if (std::find(measures.begin(), measures.end(), measure) == measures.end()) {
                measures.push_back(measure);
            }
        };

        for (const auto& action : strategy.execution) {
            append(action);
        }

        const auto& counters = CategoryCounters();
        for (const auto& threat : detections) {
            auto it = counters.find(threat.category);
            if (it == counters.end()) continue;
            for (const auto& measure : it->second) {
                append(measure);
            }
        }
        return measures;
    }

    static const std::map<std::string, std::vector<std::string>>& CategoryCounters() {
        static const std::map<std::string, std::vector<std::string>> counters = {
            {"embedded_commands", {"Consciously reject embedded suggestions", "Repeat \"I choose my own thoughts\""}},
            {"confusion_technique", {"Focus on one simple fact", "Count backwards from 10"}},
            {"rapid_induction", {"Keep eyes open and focused", "Tense muscles deliberately"}},
            {"covert_hypnosis", {"Interrupt the story", "Ask direct questions"}},
            {"nlp_manipulation", {"Break rapport deliberately", "Use different sensory language"}}
        };
        return counters;
    }
};

} // namespace mindshield::domain::threat
