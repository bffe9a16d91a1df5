/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of settings out of the services; they receive a plain
 * ShieldSettings value.
 */

#pragma once

#include <cstdint>
#include <string>

#include "domain/threat/ThreatLevel.hpp"

namespace mindshield::infrastructure {

struct ShieldSettings {
    std::string host = "0.0.0.0";
    int port = 8787;
    domain::threat::DefenseMode defaultMode = domain::threat::DefenseMode::Auto;
    std::uint32_t seed = 0;     ///< 0 = seed from std::random_device.
    bool logRequests = true;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Defaults for any missing key; full defaults if the file is
     *         absent or malformed (errors are reported on stderr).
     */
    static ShieldSettings Load(const std::string& configPath);

    /**
     * @brief Parses settings from JSON text. Throws nlohmann::json::exception
     * on malformed input.
     */
    static ShieldSettings Parse(const std::string& jsonText);
};

} // namespace mindshield::infrastructure
