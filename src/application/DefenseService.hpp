/**
 * @file DefenseService.hpp
 * @brief Application Service for threat analysis and emergency extraction.
 */

#pragma once

#include <functional>
#include <string>

#include "domain/emergency/EmergencyProtocolController.hpp"
#include "domain/threat/DefenseAnalysis.hpp"
#include "domain/threat/ThreatLevel.hpp"

namespace mindshield::application {

/**
 * @class DefenseService
 * @brief Runs the detect -> classify -> select -> counter pipeline.
 *
 * Stateless apart from its configuration; safe to share across threads as
 * long as the status callback is.
 */
class DefenseService {
public:
    using StatusCallback = std::function<void(const std::string&)>;

    explicit DefenseService(domain::threat::DefenseMode defaultMode = domain::threat::DefenseMode::Auto,
                            StatusCallback statusCallback = nullptr,
                            domain::emergency::EmergencyProtocolController emergency = {});

    domain::threat::DefenseAnalysis analyzeThreat(const std::string& input, domain::threat::DefenseMode mode) const;

    /** @brief Uses the configured default mode. */
    domain::threat::DefenseAnalysis analyzeThreat(const std::string& input) const;

    domain::emergency::EmergencyProtocol activateEmergencyProtocol() const;

    domain::emergency::GroundingResponse groundingProtocol() const;

    domain::threat::DefenseMode defaultMode() const { return m_defaultMode; }

private:
    void report(const std::string& message) const;

    domain::threat::DefenseMode m_defaultMode;
    StatusCallback m_statusCallback;
    domain::emergency::EmergencyProtocolController m_emergency;
};

} // namespace mindshield::application
