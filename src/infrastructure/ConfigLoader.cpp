/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace mindshield::infrastructure {

namespace {

ShieldSettings FromJson(const nlohmann::json& j) {
    ShieldSettings settings;

    if (j.contains("server") && j["server"].is_object()) {
        const auto& server = j["server"];
        settings.host = server.value("host", settings.host);
        settings.port = server.value("port", settings.port);
    }
    if (j.contains("defense") && j["defense"].is_object()) {
        settings.defaultMode = domain::threat::DefenseModeFromString(
            j["defense"].value("default_mode", std::string("auto")));
    }
    if (j.contains("simulation") && j["simulation"].is_object()) {
        settings.seed = j["simulation"].value("seed", settings.seed);
    }
    settings.logRequests = j.value("log_requests", settings.logRequests);
    return settings;
}

} // namespace

ShieldSettings ConfigLoader::Parse(const std::string& jsonText) {
    return FromJson(nlohmann::json::parse(jsonText));
}

ShieldSettings ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << configPath << " not found, using defaults." << std::endl;
        return ShieldSettings{};
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    return ShieldSettings{};
}

} // namespace mindshield::infrastructure
