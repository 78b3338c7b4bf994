/**
 * @file CommandStatus.hpp
 * @brief Per-command aggregation of log records across lifecycle phases.
 */

#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "domain/LogRecord.hpp"

namespace geoflow::domain {

/**
 * @class CommandStatus
 * @brief Holds the ordered records of each phase and reduces them to a worst severity.
 *
 * A phase's severity is the maximum of its records and of the floor set by
 * refreshPhaseSeverity(). A phase with neither is Unknown.
 * Owned by exactly one command; never shared.
 */
class CommandStatus {
public:
    /**
     * @brief Appends a record to the phase the record names.
     */
    void addLog(const LogRecord& record);

    /**
     * @brief Raises the phase's effective severity to at least @p floor.
     * Used to mark a phase Success once it completes without records.
     */
    void refreshPhaseSeverity(Phase phase, Severity floor);

    Severity getPhaseSeverity(Phase phase) const;

    /** @brief Worst severity over every phase. */
    Severity getOverallSeverity() const;

    const std::vector<LogRecord>& getLog(Phase phase) const;

    /** @brief Number of records in @p phase with exactly @p severity. */
    std::size_t getLogCount(Phase phase, Severity severity) const;

    /** @brief Number of records in any phase with exactly @p severity. */
    std::size_t getLogCount(Severity severity) const;

    /** @brief Drops the records of one phase and returns it to Unknown. */
    void clearLog(Phase phase);

    void clearAll();

private:
    struct PhaseLog {
        std::vector<LogRecord> records;
        Severity floor = Severity::Unknown;
    };

    PhaseLog& phaseLog(Phase phase) { return m_phases[static_cast<std::size_t>(phase)]; }
    const PhaseLog& phaseLog(Phase phase) const { return m_phases[static_cast<std::size_t>(phase)]; }

    std::array<PhaseLog, kAllPhases.size()> m_phases;
};

} // namespace geoflow::domain
