/**
 * @file EmergencyProtocolController.hpp
 * @brief Produces the "they got me" extraction protocol on demand.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "domain/emergency/EmergencyProtocol.hpp"

namespace mindshield::domain::emergency {

/**
 * @class EmergencyProtocolController
 * @brief IDLE -> ACTIVATED per call. Holds no session state: activating
 * again simply re-runs the sequence. The only input is the clock.
 */
class EmergencyProtocolController {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const char* kSafeWord = "BASELINE";

    EmergencyProtocolController();
    explicit EmergencyProtocolController(Clock clock);

    EmergencyProtocol activate() const;
    GroundingResponse grounding() const;

    /** @brief Local date as YYYY-MM-DD. */
    static std::string FormatDate(std::chrono::system_clock::time_point tp);

private:
    Clock m_clock;
};

} // namespace mindshield::domain::emergency
