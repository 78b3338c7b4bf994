/**
 * @file RunLog.cpp
 * @brief Implementation of RunLog.
 */

#include "infrastructure/RunLog.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace geoflow::infrastructure {

namespace {

struct LogFileState {
    std::ofstream stream;
    std::optional<std::filesystem::path> path;
};

LogFileState& State() {
    static LogFileState state;
    return state;
}

} // namespace

void RunLog::Info(const std::string& component, const std::string& message) {
    std::cout << "[" << component << "] " << message << std::endl;
    Write("INFO", component, message);
}

void RunLog::Warn(const std::string& component, const std::string& message) {
    std::cerr << "[" << component << "] Warning: " << message << std::endl;
    Write("WARNING", component, message);
}

void RunLog::Error(const std::string& component, const std::string& message) {
    std::cerr << "[" << component << "] Error: " << message << std::endl;
    Write("ERROR", component, message);
}

void RunLog::OpenFile(const std::filesystem::path& path) {
    CloseFile();
    LogFileState& state = State();
    state.stream.open(path, std::ios::out | std::ios::trunc);
    if (!state.stream.is_open()) {
        throw std::runtime_error("Unable to open log file: " + path.string());
    }
    state.path = path;
    Info("RunLog", "Opened log file " + path.string());
}

void RunLog::CloseFile() {
    LogFileState& state = State();
    if (state.stream.is_open()) {
        state.stream.flush();
        state.stream.close();
    }
    state.path.reset();
}

std::optional<std::filesystem::path> RunLog::CurrentFile() {
    return State().path;
}

void RunLog::Write(const char* level, const std::string& component, const std::string& message) {
    LogFileState& state = State();
    if (!state.stream.is_open()) {
        return;
    }
    state.stream << level << " [" << component << "] " << message << '\n';
    state.stream.flush();
}

} // namespace geoflow::infrastructure
