/**
 * @file StrategySelector.hpp
 * @brief Picks a defense strategy from threat level and requested mode.
 */

#pragma once

#include <map>
#include <string>

#include "domain/threat/DefenseStrategy.hpp"
#include "domain/threat/ThreatLevel.hpp"

namespace mindshield::domain::threat {

/**
 * @class StrategySelector
 * @brief First matching rule wins:
 *  1. Aggressive mode or Critical level -> pattern_interrupt.
 *  2. Passive mode or Low level         -> shield_protocol.
 *  3. Auto table by level, reality_anchor when unmapped.
 *
 * Rule 1 is evaluated before rule 2, so a Critical threat overrides a
 * Passive request. Critical never reaches the auto table, which is why the
 * table has no entry for it.
 */
class StrategySelector {
public:
    static const DefenseStrategy& Select(ThreatLevel level, DefenseMode mode) {
        return DefenseStrategyCatalog::Get(SelectKey(level, mode));
    }

    static std::string SelectKey(ThreatLevel level, DefenseMode mode) {
        if (mode == DefenseMode::Aggressive || level == ThreatLevel::Critical) {
            return "pattern_interrupt";
        }
        if (mode == DefenseMode::Passive || level == ThreatLevel::Low) {
            return "shield_protocol";
        }

        static const std::map<ThreatLevel, std::string> autoTable = {
            {ThreatLevel::High, "conscious_analysis"},
            {ThreatLevel::Medium, "reality_anchor"},
            {ThreatLevel::Low, "shield_protocol"},
            {ThreatLevel::None, "shield_protocol"}
        };
        auto it = autoTable.find(level);
        return it != autoTable.end() ? it->second : "reality_anchor";
    }
};

} // namespace mindshield::domain::threat
