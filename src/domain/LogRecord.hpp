/**
 * @file LogRecord.hpp
 * @brief Immutable record of one problem (or success note) reported by a command.
 */

#pragma once

#include <string>
#include <utility>

#include "domain/Severity.hpp"

namespace geoflow::domain {

/**
 * @class LogRecord
 * @brief Phase, severity, message and recommendation. Cannot be changed after construction.
 */
class LogRecord {
public:
    LogRecord(Phase phase, Severity severity, std::string message, std::string recommendation)
        : m_phase(phase),
          m_severity(severity),
          m_message(std::move(message)),
          m_recommendation(std::move(recommendation)) {}

    Phase getPhase() const { return m_phase; }
    Severity getSeverity() const { return m_severity; }
    const std::string& getMessage() const { return m_message; }
    const std::string& getRecommendation() const { return m_recommendation; }

private:
    Phase m_phase;
    Severity m_severity;
    std::string m_message;
    std::string m_recommendation;
};

} // namespace geoflow::domain
