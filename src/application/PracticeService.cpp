/**
 * @file PracticeService.cpp
 * @brief Implementation of PracticeService.
 */

#include "application/PracticeService.hpp"

#include "domain/agent/AgentBriefing.hpp"
#include "domain/agent/AgentProfileFactory.hpp"

#include <stdexcept>

namespace mindshield::application {

using namespace mindshield::domain::agent;

PracticeService::PracticeService(std::shared_ptr<RandomSource> random, StatusCallback statusCallback)
    : m_simulator(std::move(random)), m_statusCallback(std::move(statusCallback)) {}

void PracticeService::report(const std::string& message) const {
    if (m_statusCallback) m_statusCallback("[PracticeService] " + message);
}

AgentProfile PracticeService::createAgent(const std::string& archetype,
                                          const std::string& difficulty,
                                          bool adaptiveLearning) {
    return createAgent(ArchetypeFromString(archetype), DifficultyFromString(difficulty), adaptiveLearning);
}

AgentProfile PracticeService::createAgent(Archetype archetype, Difficulty difficulty, bool adaptiveLearning) {
    auto session = std::make_shared<AgentSession>();
    session->profile = AgentProfileFactory::Create(archetype, difficulty, adaptiveLearning);
    const AgentProfile snapshot = session->profile;

    // Ledger first: once the session is visible, respond may record into it.
    m_tracker.registerAgent(snapshot.id);
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        m_sessions.emplace(snapshot.id, std::move(session));
    }

    if (!AgentProfileFactory::HasPreset(archetype, difficulty)) {
        report("No preset for " + ArchetypeToString(archetype) + "/" + DifficultyToString(difficulty) +
               ", using susceptible/easy");
    }
    report("Created agent " + snapshot.id + " (" + snapshot.name + ")");
    return snapshot;
}

std::shared_ptr<PracticeService::AgentSession> PracticeService::findSession(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto it = m_sessions.find(agentId);
    if (it == m_sessions.end()) {
        throw AgentNotFoundError(agentId);
    }
    return it->second;
}

void PracticeService::record(AgentProfile& profile, const std::string& technique, double effectiveness) {
    const double before = profile.state.resistance;
    if (m_tracker.recordInteraction(profile, technique, effectiveness)) {
        report("Agent " + profile.id + " adapted: resistance " +
               std::to_string(static_cast<int>(before)) + " -> " +
               std::to_string(static_cast<int>(profile.state.resistance)));
    }
}

AgentResponse PracticeService::respondToTechnique(const std::string& agentId,
                                                  const std::string& technique,
                                                  const std::string& content) {
    auto session = findSession(agentId);
    std::lock_guard<std::mutex> lock(session->mutex);

    AgentResponse response = m_simulator.respond(session->profile, technique, content);
    if (session->profile.adaptiveLearning) {
        record(session->profile, technique, response.effectiveness);
    }
    return response;
}

LearningProfile PracticeService::recordLearning(const std::string& agentId,
                                                const std::string& technique,
                                                double effectiveness) {
    if (!(effectiveness >= 0.0 && effectiveness <= 100.0)) {
        throw std::invalid_argument("effectiveness must be within [0, 100]");
    }
    auto session = findSession(agentId);
    std::lock_guard<std::mutex> lock(session->mutex);

    record(session->profile, technique, effectiveness);
    auto learning = m_tracker.profile(agentId);
    if (!learning) {
        throw AgentNotFoundError(agentId);
    }
    return *learning;
}

void PracticeService::removeAgent(const std::string& agentId) {
    std::shared_ptr<AgentSession> session;
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        auto it = m_sessions.find(agentId);
        if (it == m_sessions.end()) {
            throw AgentNotFoundError(agentId);
        }
        session = std::move(it->second);
        m_sessions.erase(it);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    m_tracker.forget(agentId);
    report("Removed agent " + agentId);
}

AgentProfile PracticeService::getAgent(const std::string& agentId) const {
    auto session = findSession(agentId);
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->profile;
}

LearningProfile PracticeService::getLearningProfile(const std::string& agentId) const {
    auto session = findSession(agentId);
    std::lock_guard<std::mutex> lock(session->mutex);
    auto learning = m_tracker.profile(agentId);
    if (!learning) {
        throw AgentNotFoundError(agentId);
    }
    return *learning;
}

std::string PracticeService::getBriefing(const std::string& agentId) const {
    auto session = findSession(agentId);
    std::lock_guard<std::mutex> lock(session->mutex);
    return AgentBriefing::Render(session->profile);
}

size_t PracticeService::agentCount() const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return m_sessions.size();
}

} // namespace mindshield::application
