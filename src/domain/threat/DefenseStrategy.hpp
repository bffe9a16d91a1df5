/**
 * @file DefenseStrategy.hpp
 * @brief Countermeasure templates and the strategy catalog.
 */

#pragma once

#include <string>
#include <vector>

namespace mindshield::domain::threat {

/**
 * @struct DefenseStrategy
 * @brief A named bundle of recommended countermeasure actions.
 */
struct DefenseStrategy {
    std::string key;                     ///< E.g. "pattern_interrupt".
    std::string name;                    ///< Display name.
    std::string description;
    std::vector<std::string> execution;  ///< Ordered actions.
    int effectiveness = 0;               ///< 0-100, informational only.
};

/**
 * @class DefenseStrategyCatalog
 * @brief Read-only table of strategies, keyed by strategy key.
 */
class DefenseStrategyCatalog {
public:
    static const std::vector<DefenseStrategy>& All();

    /** @brief Lookup by key. Returns nullptr for unknown keys. */
    static const DefenseStrategy* Find(const std::string& key);

    /**
     * @brief Lookup for keys that are known to exist.
     * @throws std::out_of_range if the key is not in the catalog.
     */
    static const DefenseStrategy& Get(const std::string& key);
};

} // namespace mindshield::domain::threat
