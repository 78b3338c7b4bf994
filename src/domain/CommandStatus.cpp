/**
 * @file CommandStatus.cpp
 * @brief Implementation of CommandStatus.
 */

#include "domain/CommandStatus.hpp"

namespace geoflow::domain {

void CommandStatus::addLog(const LogRecord& record) {
    phaseLog(record.getPhase()).records.push_back(record);
}

void CommandStatus::refreshPhaseSeverity(Phase phase, Severity floor) {
    PhaseLog& log = phaseLog(phase);
    log.floor = MaxSeverity(log.floor, floor);
}

Severity CommandStatus::getPhaseSeverity(Phase phase) const {
    const PhaseLog& log = phaseLog(phase);
    Severity worst = log.floor;
    for (const auto& record : log.records) {
        worst = MaxSeverity(worst, record.getSeverity());
    }
    return worst;
}

Severity CommandStatus::getOverallSeverity() const {
    Severity worst = Severity::Unknown;
    for (Phase phase : kAllPhases) {
        worst = MaxSeverity(worst, getPhaseSeverity(phase));
    }
    return worst;
}

const std::vector<LogRecord>& CommandStatus::getLog(Phase phase) const {
    return phaseLog(phase).records;
}

std::size_t CommandStatus::getLogCount(Phase phase, Severity severity) const {
    std::size_t count = 0;
    for (const auto& record : phaseLog(phase).records) {
        if (record.getSeverity() == severity) {
            ++count;
        }
    }
    return count;
}

std::size_t CommandStatus::getLogCount(Severity severity) const {
    std::size_t count = 0;
    for (Phase phase : kAllPhases) {
        count += getLogCount(phase, severity);
    }
    return count;
}

void CommandStatus::clearLog(Phase phase) {
    PhaseLog& log = phaseLog(phase);
    log.records.clear();
    log.floor = Severity::Unknown;
}

void CommandStatus::clearAll() {
    for (Phase phase : kAllPhases) {
        clearLog(phase);
    }
}

} // namespace geoflow::domain
