/**
 * @file Severity.hpp
 * @brief Ordered outcome levels and command lifecycle phases.
 */

#pragma once

#include <array>
#include <string>

namespace geoflow::domain {

/**
 * @enum Severity
 * @brief Outcome level of a log record. Declaration order is the total order.
 */
enum class Severity {
    Unknown,    ///< Phase has not run.
    Success,    ///< Phase completed without problems.
    Warning,    ///< Problem recorded, not necessarily blocking.
    Failure     ///< Problem that prevented the work from completing.
};

/**
 * @enum Phase
 * @brief Logical stage of a command's lifecycle.
 */
enum class Phase {
    Initialization, ///< Parameter syntax and type checking.
    Discovery,      ///< Light pre-run scan.
    Run             ///< Runtime checks and the effect itself.
};

inline Severity MaxSeverity(Severity a, Severity b) {
    return (a < b) ? b : a;
}

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Unknown: return "UNKNOWN";
        case Severity::Success: return "SUCCESS";
        case Severity::Warning: return "WARNING";
        case Severity::Failure: return "FAILURE";
        default: return "UNKNOWN";
    }
}

inline std::string PhaseToString(Phase phase) {
    switch (phase) {
        case Phase::Initialization: return "INITIALIZATION";
        case Phase::Discovery: return "DISCOVERY";
        case Phase::Run: return "RUN";
        default: return "RUN";
    }
}

inline constexpr std::array<Phase, 3> kAllPhases = {
    Phase::Initialization, Phase::Discovery, Phase::Run
};

} // namespace geoflow::domain
