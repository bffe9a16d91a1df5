/**
 * @file EmergencyProtocolController.cpp
 * @brief Implementation of EmergencyProtocolController.
 */

#include "domain/emergency/EmergencyProtocolController.hpp"

#include <ctime>

namespace mindshield::domain::emergency {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

EmergencyProtocolController::EmergencyProtocolController()
    : m_clock([] { return std::chrono::system_clock::now(); }) {}

EmergencyProtocolController::EmergencyProtocolController(Clock clock)
    : m_clock(std::move(clock)) {}

std::string EmergencyProtocolController::FormatDate(std::chrono::system_clock::time_point tp) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(tp));
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return buffer;
}

GroundingResponse EmergencyProtocolController::grounding() const {
    GroundingResponse response;
    response.affirmation = "I am in control. I choose my thoughts. I am safe and grounded.";
    response.anchorPoints = {
        "Feel your feet on the ground",
        "Touch something solid",
        "Look at something blue",
        "Name 5 things you can see",
        "Name 4 things you can touch"
    };
    response.realityChecks = {
        "Today is " + FormatDate(m_clock()),
        "You are safe",
        "You control your mind",
        "This will pass",
        "You have the power"
    };
    response.breathingPattern = "4-7-8 breathing: Inhale 4, Hold 7, Exhale 8";
    response.physicalActions = {
        "Stand up and stretch",
        "Splash cold water on face",
        "Step outside for fresh air",
        "Call a trusted friend",
        "Write down your thoughts"
    };
    return response;
}

EmergencyProtocol EmergencyProtocolController::activate() const {
    EmergencyProtocol protocol;
    protocol.extractionSteps = {
        "1. STOP - Cease all current mental activity",
        "2. GROUND - Touch physical object, state your name",
        "3. ORIENT - State location, date, time",
        "4. REJECT - \"I reject all suggestions\"",
        "5. SHIELD - Visualize impenetrable barrier",
        "6. EXTRACT - Leave situation immediately",
        "7. RECOVER - Find safe space, contact support"
    };
    protocol.groundingSequence = grounding();
    protocol.shieldActivated = true;
    protocol.counterAttackReady = true;
    protocol.safeWord = kSafeWord;
    return protocol;
}

} // namespace mindshield::domain::emergency
