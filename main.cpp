#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "application/AppServices.hpp"
#include "app/HttpHost.hpp"
#include "domain/agent/RandomSource.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace mindshield;

namespace {

app::HttpHost* g_host = nullptr;

void HandleSignal(int) {
    if (g_host) g_host->stop();
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = (argc > 1) ? argv[1] : "settings.json";
    infrastructure::ShieldSettings settings = infrastructure::ConfigLoader::Load(configPath);

    std::mutex logMutex;
    auto statusCallback = [&logMutex](const std::string& message) {
        std::lock_guard<std::mutex> lock(logMutex);
        std::cout << message << std::endl;
    };

    application::AppServices services;
    services.defenseService = std::make_unique<application::DefenseService>(settings.defaultMode, statusCallback);
    services.practiceService = std::make_unique<application::PracticeService>(
        std::make_shared<domain::agent::Mt19937RandomSource>(settings.seed), statusCallback);

    std::cout << "MindShield v0.1.0 - threat analysis core initialized." << std::endl;

    app::HttpHost host(services, settings);
    g_host = &host;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const bool ok = host.run();
    g_host = nullptr;
    return ok ? 0 : 1;
}
