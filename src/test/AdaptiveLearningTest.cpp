#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/PracticeService.hpp"
#include "domain/agent/AdaptiveLearningTracker.hpp"
#include "domain/agent/AgentProfileFactory.hpp"
#include "domain/agent/AgentStateSimulator.hpp"

using namespace mindshield::domain::agent;
using mindshield::application::PracticeService;

template <typename Fn>
static bool ThrowsNotFound(Fn fn) {
    try {
        fn();
    } catch (const AgentNotFoundError&) {
        return true;
    }
    return false;
}

static void TestAdaptationCycle() {
    AdaptiveLearningTracker tracker;
    auto agent = AgentProfileFactory::Create(Archetype::Resistant, Difficulty::Hard, true);
    tracker.registerAgent(agent.id);

    for (int i = 0; i < 4; ++i) {
        assert(!tracker.recordInteraction(agent, "rapid_induction", 85));
    }
    assert(agent.state.resistance == 80);
    assert(agent.resistancePatterns.empty());
    assert(tracker.profile(agent.id)->adaptationLevel == 0);

    assert(tracker.recordInteraction(agent, "rapid_induction", 85));
    assert(agent.state.resistance == 85);
    assert(agent.resists("rapid_induction"));

    auto learning = tracker.profile(agent.id);
    assert(learning.has_value());
    assert(learning->totalInteractions == 5);
    assert(learning->adaptationLevel == 1);
    assert(learning->techniqueEffectiveness.at("rapid_induction").count == 5);
    assert(learning->techniqueEffectiveness.at("rapid_induction").mean() == 85);
    std::cout << "[PASS] Fifth interaction adapts." << std::endl;
}

static void TestThresholdIsStrict() {
    AdaptiveLearningTracker tracker;
    auto agent = AgentProfileFactory::Create(Archetype::Resistant, Difficulty::Hard, true);
    tracker.registerAgent(agent.id);

    for (int i = 0; i < 5; ++i) {
        tracker.recordInteraction(agent, "overload", 70);
    }
    assert(agent.state.resistance == 80);
    assert(agent.resistancePatterns.empty());
    assert(tracker.profile(agent.id)->adaptationLevel == 1);
    std::cout << "[PASS] Mean of exactly 70 is not effective." << std::endl;
}

static void TestEachEffectiveTechniqueSteps() {
    AdaptiveLearningTracker tracker;
    auto agent = AgentProfileFactory::Create(Archetype::Susceptible, Difficulty::Easy, true);
    tracker.registerAgent(agent.id);

    tracker.recordInteraction(agent, "trust", 90);
    tracker.recordInteraction(agent, "trust", 90);
    tracker.recordInteraction(agent, "visualization", 80);
    tracker.recordInteraction(agent, "relaxation", 10);
    tracker.recordInteraction(agent, "visualization", 75);

    assert(agent.state.resistance == 20);
    assert(agent.resists("trust") && agent.resists("visualization"));
    assert(!agent.resists("relaxation"));

    // Already-learned techniques keep counting on later cycles.
    for (int i = 0; i < 5; ++i) {
        tracker.recordInteraction(agent, "relaxation", 10);
    }
    assert(agent.state.resistance == 30);
    assert(tracker.profile(agent.id)->adaptationLevel == 2);
    std::cout << "[PASS] Every effective technique raises resistance." << std::endl;
}

static void TestResistanceCap() {
    AdaptiveLearningTracker tracker;
    auto agent = AgentProfileFactory::Create(Archetype::Adversarial, Difficulty::Expert, true);
    tracker.registerAgent(agent.id);

    for (int i = 0; i < 20; ++i) {
        tracker.recordInteraction(agent, "covert_hypnosis", 90);
    }
    assert(agent.state.resistance == 95);
    assert(agent.resists("covert_hypnosis"));
    assert(tracker.profile(agent.id)->adaptationLevel == 4);
    std::cout << "[PASS] Resistance never exceeds 95." << std::endl;
}

static void TestUnregistered() {
    AdaptiveLearningTracker tracker;
    auto agent = AgentProfileFactory::Create(Archetype::Susceptible, Difficulty::Easy, true);
    assert(!tracker.isRegistered(agent.id));
    assert(!tracker.profile(agent.id).has_value());
    assert(ThrowsNotFound([&] { tracker.recordInteraction(agent, "trust", 50); }));

    tracker.registerAgent(agent.id);
    tracker.recordInteraction(agent, "trust", 50);
    tracker.registerAgent(agent.id);
    assert(tracker.profile(agent.id)->totalInteractions == 1);
    std::cout << "[PASS] Unknown agents are rejected." << std::endl;
}

static void TestLearnedResistanceBonus() {
    AdaptiveLearningTracker tracker;
    AgentProfile agent;
    agent.id = "learner";
    agent.state.suggestibility = 100;
    agent.state.resistance = 0;
    agent.state.awareness = 0;
    tracker.registerAgent(agent.id);

    for (int i = 0; i < 5; ++i) {
        tracker.recordInteraction(agent, "anchoring", 90);
    }
    assert(agent.state.resistance == 5);
    assert(std::fabs(AgentStateSimulator::ComputeEffectiveness(agent, "anchoring") - 37.5) < 1e-9);
    assert(std::fabs(AgentStateSimulator::ComputeEffectiveness(agent, "visualization") - 47.5) < 1e-9);
    std::cout << "[PASS] Learned patterns reduce effectiveness." << std::endl;
}

static void TestPracticeServiceLedger() {
    std::vector<std::string> messages;
    PracticeService service(std::make_shared<Mt19937RandomSource>(11),
                            [&](const std::string& msg) { messages.push_back(msg); });

    auto hard = service.createAgent(Archetype::Resistant, Difficulty::Hard, true);
    assert(service.agentCount() == 1);
    for (int i = 0; i < 10; ++i) {
        service.recordLearning(hard.id, "double_binds", 90);
    }
    auto stored = service.getAgent(hard.id);
    assert(stored.state.resistance == 90);
    assert(stored.resists("double_binds"));
    assert(service.getLearningProfile(hard.id).adaptationLevel == 2);

    bool reportedAdaptation = false;
    for (const auto& m : messages) {
        if (m.find("adapted: resistance 80 -> 85") != std::string::npos) reportedAdaptation = true;
    }
    assert(reportedAdaptation);

    auto easy = service.createAgent("susceptible", "easy", true);
    for (int i = 0; i < 10; ++i) {
        service.respondToTechnique(easy.id, "visualization", "Picture a staircase");
    }
    auto learning = service.getLearningProfile(easy.id);
    assert(learning.totalInteractions == 10);
    assert(learning.adaptationLevel == 2);
    assert(learning.techniqueEffectiveness.at("visualization").count == 10);
    assert(service.getAgent(easy.id).state.history.size() == 10);

    auto passive = service.createAgent("resistant", "hard", false);
    for (int i = 0; i < 3; ++i) {
        service.respondToTechnique(passive.id, "overload", "");
    }
    assert(service.getLearningProfile(passive.id).totalInteractions == 0);
    assert(service.getAgent(passive.id).state.history.size() == 3);

    // Explicit replay records even when adaptive learning is off.
    assert(service.recordLearning(passive.id, "overload", 20).totalInteractions == 1);

    auto fallback = service.createAgent("resistant", "easy", true);
    assert(fallback.name == "Alex (Highly Susceptible)");
    bool reportedFallback = false;
    for (const auto& m : messages) {
        if (m.find("No preset for resistant/easy") != std::string::npos) reportedFallback = true;
    }
    assert(reportedFallback);
    assert(service.getBriefing(fallback.id).find("Alex (Highly Susceptible)") != std::string::npos);
    std::cout << "[PASS] PracticeService keeps agent and ledger in step." << std::endl;
}

static void TestPracticeServiceUnknownIds() {
    PracticeService service(std::make_shared<Mt19937RandomSource>(3));
    service.createAgent(Archetype::Susceptible, Difficulty::Easy, true);

    assert(ThrowsNotFound([&] { service.respondToTechnique("ghost", "trust", ""); }));
    assert(ThrowsNotFound([&] { service.getAgent("ghost"); }));
    assert(ThrowsNotFound([&] { service.recordLearning("ghost", "trust", 90); }));
    assert(ThrowsNotFound([&] { service.getLearningProfile("ghost"); }));
    assert(ThrowsNotFound([&] { service.getBriefing("ghost"); }));

    try {
        service.getAgent("ghost");
    } catch (const AgentNotFoundError& e) {
        assert(std::string(e.what()) == "Agent not found: ghost");
        assert(e.agentId() == "ghost");
    }
    std::cout << "[PASS] Unknown ids raise AgentNotFoundError." << std::endl;
}

static void TestEffectivenessRangeChecked() {
    PracticeService service(std::make_shared<Mt19937RandomSource>(9));
    auto agent = service.createAgent(Archetype::Resistant, Difficulty::Hard, true);

    auto rejects = [&](double value) {
        try {
            service.recordLearning(agent.id, "trust", value);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    assert(rejects(1e308));
    assert(rejects(-0.5));
    assert(rejects(100.5));
    assert(rejects(std::numeric_limits<double>::quiet_NaN()));
    assert(rejects(std::numeric_limits<double>::infinity()));
    assert(service.getLearningProfile(agent.id).totalInteractions == 0);

    assert(service.recordLearning(agent.id, "trust", 0).totalInteractions == 1);
    auto ledger = service.recordLearning(agent.id, "trust", 100);
    assert(ledger.totalInteractions == 2);
    assert(ledger.techniqueEffectiveness.at("trust").mean() == 50);
    std::cout << "[PASS] Replayed effectiveness must lie in [0, 100]." << std::endl;
}

static void TestRemoveAgent() {
    PracticeService service(std::make_shared<Mt19937RandomSource>(4));
    auto keep = service.createAgent(Archetype::Susceptible, Difficulty::Easy, true);
    auto drop = service.createAgent(Archetype::Adversarial, Difficulty::Expert, true);
    service.recordLearning(drop.id, "anchoring", 90);
    assert(service.agentCount() == 2);

    service.removeAgent(drop.id);
    assert(service.agentCount() == 1);
    assert(ThrowsNotFound([&] { service.getAgent(drop.id); }));
    assert(ThrowsNotFound([&] { service.getLearningProfile(drop.id); }));
    assert(ThrowsNotFound([&] { service.respondToTechnique(drop.id, "trust", ""); }));
    assert(ThrowsNotFound([&] { service.removeAgent(drop.id); }));
    assert(service.getAgent(keep.id).id == keep.id);

    AdaptiveLearningTracker tracker;
    tracker.registerAgent("a");
    assert(tracker.forget("a"));
    assert(!tracker.forget("a"));
    assert(!tracker.isRegistered("a"));
    std::cout << "[PASS] Removed agents release their ledger." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Adaptive Learning Test..." << std::endl;

    TestAdaptationCycle();
    TestThresholdIsStrict();
    TestEachEffectiveTechniqueSteps();
    TestResistanceCap();
    TestUnregistered();
    TestLearnedResistanceBonus();
    TestPracticeServiceLedger();
    TestPracticeServiceUnknownIds();
    TestEffectivenessRangeChecked();
    TestRemoveAgent();

    std::cout << "[PASS] Adaptive Learning Test." << std::endl;
    return 0;
}
