/**
 * @file HttpHost.cpp
 * @brief Implementation of HttpHost.
 */

#include "app/HttpHost.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

#include "domain/threat/DefenseStrategy.hpp"
#include "domain/threat/ThreatPattern.hpp"
#include "infrastructure/JsonMapper.hpp"

namespace mindshield::app {

using json = nlohmann::json;
using infrastructure::JsonMapper;

namespace {

void Reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

json ParseBody(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body);
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return body;
}

std::string RequireString(const json& body, const char* key) {
    if (!body.contains(key) || !body[key].is_string()) {
        throw std::invalid_argument(std::string("Missing string field: ") + key);
    }
    return body[key].get<std::string>();
}

double RequireNumber(const json& body, const char* key) {
    if (!body.contains(key) || !body[key].is_number()) {
        throw std::invalid_argument(std::string("Missing numeric field: ") + key);
    }
    return body[key].get<double>();
}

// Runs a handler and maps domain/parse failures onto HTTP statuses.
template <typename Handler>
void Guarded(httplib::Response& res, Handler&& handler) {
    try {
        Reply(res, 200, handler());
    } catch (const domain::agent::AgentNotFoundError& e) {
        Reply(res, 404, {{"error", e.what()}});
    } catch (const json::exception& e) {
        Reply(res, 400, {{"error", std::string("Invalid JSON: ") + e.what()}});
    } catch (const std::invalid_argument& e) {
        Reply(res, 400, {{"error", e.what()}});
    } catch (const std::exception& e) {
        std::cerr << "[HttpHost] Handler failed: " << e.what() << std::endl;
        Reply(res, 500, {{"error", "Internal error"}});
    }
}

} // namespace

HttpHost::HttpHost(application::AppServices& services, infrastructure::ShieldSettings settings)
    : m_services(services), m_settings(std::move(settings)), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpHost::~HttpHost() {
    stop();
}

void HttpHost::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

int HttpHost::bind() {
    if (m_boundPort >= 0) return m_boundPort;

    if (m_settings.port == 0) {
        m_boundPort = m_server->bind_to_any_port(m_settings.host);
    } else if (m_server->bind_to_port(m_settings.host, m_settings.port)) {
        m_boundPort = m_settings.port;
    }

    if (m_boundPort < 0) {
        std::cerr << "[HttpHost] Failed to bind " << m_settings.host << ":" << m_settings.port << std::endl;
    }
    return m_boundPort;
}

bool HttpHost::run() {
    if (bind() < 0) return false;
    std::cout << "[HttpHost] Listening on " << m_settings.host << ":" << m_boundPort << std::endl;
    return m_server->listen_after_bind();
}

void HttpHost::registerRoutes() {
    auto& defense = *m_services.defenseService;
    auto& practice = *m_services.practiceService;

    if (m_settings.logRequests) {
        m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            std::cout << "[HttpHost] " << req.method << " " << req.path << " -> " << res.status << std::endl;
        });
    }

    m_server->Get("/api/health", [&practice](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [&] {
            return json{{"status", "ok"}, {"agents", practice.agentCount()}};
        });
    });

    // --- Defense ---
    m_server->Post("/api/defense/analyze", [&defense](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json body = ParseBody(req);
            std::string input = RequireString(body, "input");
            if (body.contains("mode") && body["mode"].is_string()) {
                auto mode = domain::threat::DefenseModeFromString(body["mode"].get<std::string>());
                return JsonMapper::ToJson(defense.analyzeThreat(input, mode));
            }
            return JsonMapper::ToJson(defense.analyzeThreat(input));
        });
    });

    m_server->Post("/api/defense/emergency", [&defense](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [&] { return JsonMapper::ToJson(defense.activateEmergencyProtocol()); });
    });

    m_server->Get("/api/defense/grounding", [&defense](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [&] { return JsonMapper::ToJson(defense.groundingProtocol()); });
    });

    m_server->Get("/api/defense/strategies", [](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [] {
            json list = json::array();
            for (const auto& s : domain::threat::DefenseStrategyCatalog::All()) {
                list.push_back(JsonMapper::ToJson(s));
            }
            return list;
        });
    });

    m_server->Get("/api/defense/patterns", [](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [] {
            json list = json::array();
            for (const auto& p : domain::threat::ThreatPatternCatalog::All()) {
                list.push_back(JsonMapper::ToJson(p));
            }
            return list;
        });
    });

    // --- Practice agents ---
    m_server->Post("/api/practice/agents", [&practice](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json body = ParseBody(req);
            auto profile = practice.createAgent(RequireString(body, "archetype"),
                                                body.value("difficulty", std::string("medium")),
                                                body.value("adaptiveLearning", true));
            return json{
                {"agent", JsonMapper::ToJson(profile)},
                {"instructions", practice.getBriefing(profile.id)}
            };
        });
    });

    m_server->Get(R"(/api/practice/agents/([^/]+))", [&practice](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] { return JsonMapper::ToJson(practice.getAgent(req.matches[1])); });
    });

    m_server->Delete(R"(/api/practice/agents/([^/]+))", [&practice](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            const std::string agentId = req.matches[1];
            practice.removeAgent(agentId);
            return json{{"removed", agentId}};
        });
    });

    m_server->Post(R"(/api/practice/agents/([^/]+)/respond)", [&practice](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json body = ParseBody(req);
            auto response = practice.respondToTechnique(req.matches[1],
                                                        RequireString(body, "technique"),
                                                        body.value("content", std::string()));
            return JsonMapper::ToJson(response);
        });
    });

    m_server->Post(R"(/api/practice/agents/([^/]+)/learning)", [&practice](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            json body = ParseBody(req);
            auto learning = practice.recordLearning(req.matches[1],
                                                    RequireString(body, "technique"),
                                                    RequireNumber(body, "effectiveness"));
            return JsonMapper::ToJson(learning);
        });
    });

    m_server->Get(R"(/api/practice/agents/([^/]+)/learning)", [&practice](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] { return JsonMapper::ToJson(practice.getLearningProfile(req.matches[1])); });
    });
}

} // namespace mindshield::app
