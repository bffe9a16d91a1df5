#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/DefenseService.hpp"
#include "domain/threat/ThreatDetector.hpp"
#include "domain/threat/services/CounterMeasureGenerator.hpp"
#include "domain/threat/services/RecommendationGenerator.hpp"

using namespace mindshield::domain::threat;
using mindshield::application::DefenseService;

static bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

static void TestEmptyInput(const DefenseService& service) {
    for (const std::string input : {"", "   ", "\n\t  \n"}) {
        assert(ThreatDetector::Detect(input).empty());

        auto analysis = service.analyzeThreat(input);
        assert(!analysis.threatDetected);
        assert(analysis.threatLevel == ThreatLevel::None);
        assert(analysis.counterMeasures.empty());
        assert(analysis.recommendations.empty());
        assert(analysis.confidence == 0);
        assert(!analysis.attackType.has_value());
    }
    std::cout << "[PASS] Empty input yields a clean 'none' analysis." << std::endl;
}

static void TestNoMatches() {
    const std::string input = "The quarterly report is attached.";
    const std::string normalized = "the quarterly report is attached.";
    for (const auto& pattern : ThreatPatternCatalog::All()) {
        assert(ThreatDetector::Score(pattern, normalized) == 0);
    }
    auto detections = ThreatDetector::Detect(input);
    assert(detections.empty());
    assert(ThreatDetector::Classify(detections) == ThreatLevel::None);
    std::cout << "[PASS] Neutral text scores zero everywhere." << std::endl;
}

static void TestRelaxationScenario(const DefenseService& service) {
    auto analysis = service.analyzeThreat("You will feel very relaxed now... notice how heavy your eyelids feel",
                                          DefenseMode::Auto);
    assert(analysis.threatDetected);
    assert(analysis.threatLevel >= ThreatLevel::Medium);

    bool hasExpectedCategory = false;
    for (const auto& d : analysis.detections) {
        if (d.category == "embedded_commands" || d.category == "nlp_manipulation") hasExpectedCategory = true;
    }
    assert(hasExpectedCategory);

    // now + feel + notice (30) plus the ellipsis pause (20).
    assert(analysis.detections.size() == 1);
    assert(analysis.detections[0].category == "embedded_commands");
    assert(analysis.detections[0].score == 50);
    assert(analysis.threatLevel == ThreatLevel::Medium);
    assert(*analysis.attackType == "embedded_commands");
    assert(analysis.defenseStrategy == "reality_anchor");
    assert(analysis.defenseStrategyName == "Reality Anchor");
    assert(analysis.confidence == 50);

    assert(analysis.counterMeasures.size() == 6);
    assert(analysis.counterMeasures[0] == "Focus on physical sensations");
    assert(Contains(analysis.counterMeasures, "Consciously reject embedded suggestions"));
    assert(analysis.recommendations.size() == 3);
    assert(analysis.recommendations[0] == "Document this interaction for analysis");
    std::cout << "[PASS] Relaxation scenario classified as medium embedded commands." << std::endl;
}

static void TestCriticalOverridesPassive(const DefenseService& service) {
    auto analysis = service.analyzeThreat("Now... *feel* it. Imagine. Notice and realize.", DefenseMode::Passive);
    assert(analysis.detections.size() == 1);
    assert(analysis.detections[0].score == 110);
    assert(analysis.detections[0].confidence == 1.0);
    assert(analysis.threatLevel == ThreatLevel::Critical);
    assert(analysis.defenseStrategy == "pattern_interrupt");
    assert(analysis.recommendations.size() == 6);
    assert(analysis.recommendations[0] == "IMMEDIATE ACTION: Physically remove yourself from situation");
    assert(analysis.confidence == 100);
    std::cout << "[PASS] Critical threat forces pattern interrupt." << std::endl;
}

static void TestHighLevel(const DefenseService& service) {
    auto analysis = service.analyzeThreat("Every time you see it, hear it, feel it, you understand and know.");
    assert(analysis.detections.size() == 1);
    assert(analysis.detections[0].category == "nlp_manipulation");
    assert(analysis.detections[0].score == 70);
    assert(analysis.threatLevel == ThreatLevel::High);
    assert(analysis.defenseStrategy == "conscious_analysis");
    assert(analysis.recommendations.size() == 6);
    assert(analysis.recommendations[0] == "Maintain heightened awareness");
    assert(Contains(analysis.counterMeasures, "Break rapport deliberately"));
    std::cout << "[PASS] Anchoring plus sensory language is high." << std::endl;
}

static void TestTieOrderAndConfidence() {
    auto detections = ThreatDetector::Detect("feel... see, hear, know");
    assert(detections.size() == 2);
    assert(detections[0].score == 40 && detections[1].score == 40);
    assert(detections[0].category == "embedded_commands");
    assert(detections[1].category == "nlp_manipulation");
    assert(ThreatDetector::Classify(detections) == ThreatLevel::Low);
    assert(ThreatDetector::Confidence(detections) == 40);
    std::cout << "[PASS] Ties keep catalog order." << std::endl;
}

static void TestMonotonicity() {
    const std::vector<std::string> fragments = {
        "hello", " now", " feel", "...", " *look*", " but yet", " however", " not this, isn't it",
        " like a river", " once upon a time", " every time", " suddenly", " sleep deep", ". stop."
    };
    std::string text;
    std::vector<int> previous(ThreatPatternCatalog::All().size(), 0);
    for (const auto& fragment : fragments) {
        text += fragment;
        const auto& patterns = ThreatPatternCatalog::All();
        for (size_t i = 0; i < patterns.size(); ++i) {
            int score = ThreatDetector::Score(patterns[i], text);
            assert(score >= previous[i]);
            previous[i] = score;
        }
    }
    std::cout << "[PASS] Appending matches never lowers a score." << std::endl;
}

static void TestIndicators() {
    assert(ThreatDetector::MatchesIndicator("pause_pattern", "wait..."));
    assert(ThreatDetector::MatchesIndicator("analog_marking", "you *relax* now"));
    assert(ThreatDetector::MatchesIndicator("tonal_shift", "yes. deeper."));
    assert(ThreatDetector::MatchesIndicator("multiple_negations", "you can't not notice"));
    assert(ThreatDetector::MatchesIndicator("paradox", "but then again, yet"));
    assert(!ThreatDetector::MatchesIndicator("paradox", "but only once"));
    assert(ThreatDetector::MatchesIndicator("anchoring", "whenever you hear this"));
    assert(!ThreatDetector::MatchesIndicator("overload", "anything at all"));
    assert(!ThreatDetector::MatchesIndicator("no_such_indicator", "now"));
    std::cout << "[PASS] Indicator tests." << std::endl;
}

static void TestCounterMeasureDedup() {
    DetectedThreat a{"embedded_commands", "", 50, 0.5};
    DetectedThreat b{"embedded_commands", "", 40, 0.4};
    DetectedThreat c{"rapid_induction", "", 35, 0.35};
    const auto& strategy = DefenseStrategyCatalog::Get("shield_protocol");

    auto measures = CounterMeasureGenerator::Generate({a, b, c}, strategy);
    assert(measures.size() == 8);
    assert(measures[0] == "Imagine protective shield");
    assert(measures[4] == "Consciously reject embedded suggestions");
    assert(measures[6] == "Keep eyes open and focused");

    auto recs = RecommendationGenerator::Recommend(ThreatLevel::None, {});
    assert(recs.empty());
    std::cout << "[PASS] Counter-measures are deduplicated in first-seen order." << std::endl;
}

static void TestLongInput(const DefenseService& service) {
    const std::string filler(200000, 'x');

    // One negation and one contrast word up front, then a single huge word.
    auto analysis = service.analyzeThreat("you are not sure, but ok. " + filler);
    assert(!analysis.threatDetected);
    assert(analysis.threatLevel == ThreatLevel::None);

    assert(!ThreatDetector::MatchesIndicator("multiple_negations", "you are not " + filler));
    assert(!ThreatDetector::MatchesIndicator("paradox", "but " + filler));
    assert(!ThreatDetector::MatchesIndicator("tonal_shift", "ok. " + filler));
    assert(!ThreatDetector::MatchesIndicator("analog_marking", "*" + filler));
    assert(ThreatDetector::MatchesIndicator("multiple_negations", "not " + filler + " not"));
    assert(ThreatDetector::MatchesIndicator("paradox", "but " + filler + " however"));
    assert(ThreatDetector::MatchesIndicator("tonal_shift", "ok. " + filler + "."));
    assert(ThreatDetector::MatchesIndicator("analog_marking", "*" + filler + "*"));

    // Pairs must share a line.
    assert(!ThreatDetector::MatchesIndicator("multiple_negations", "do not\nnot now"));
    assert(!ThreatDetector::MatchesIndicator("analog_marking", "** *two words*"));

    auto loud = service.analyzeThreat("Now... *feel* it. Imagine. Notice and realize. " + filler);
    assert(loud.threatLevel == ThreatLevel::Critical);
    std::cout << "[PASS] Large inputs are scanned in linear time." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Threat Detection Test..." << std::endl;

    DefenseService service;
    TestEmptyInput(service);
    TestNoMatches();
    TestRelaxationScenario(service);
    TestCriticalOverridesPassive(service);
    TestHighLevel(service);
    TestTieOrderAndConfidence();
    TestMonotonicity();
    TestIndicators();
    TestCounterMeasureDedup();
    TestLongInput(service);

    std::cout << "[PASS] Threat Detection Test." << std::endl;
    return 0;
}
