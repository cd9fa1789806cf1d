#include "SimulationManager.hpp"

#include <algorithm>

#include "Logger.hpp"

namespace vellum {

SimulationManager* SimulationManager::s_pInstance = nullptr;

SimulationManager* SimulationManager::Instance() {
    if (s_pInstance == nullptr) {
        s_pInstance = new SimulationManager();
    }
    return s_pInstance;
}

// The constructor must not log: Logger::initialize() reads this instance.
SimulationManager::SimulationManager()
    : fixedTimestep(kDefaultFixedTimestep),
      maxFrameTime(kDefaultMaxFrameTime),
      maxSubdivisionLevels(kMaxSubdivisionLevels),
      logLevel("info"),
      logFilePath() {}

void SimulationManager::setFixedTimestep(double seconds) {
    if (!(seconds > 0.0)) {
        Logger::getLogger()->warn("Ignoring non-positive fixed timestep: {}", seconds);
        return;
    }
    fixedTimestep = seconds;
    Logger::getLogger()->info("Fixed timestep set to: {}", fixedTimestep);
}

void SimulationManager::setMaxFrameTime(double seconds) {
    if (!(seconds > 0.0)) {
        Logger::getLogger()->warn("Ignoring non-positive max frame time: {}", seconds);
        return;
    }
    maxFrameTime = seconds;
    Logger::getLogger()->info("Max frame time set to: {}", maxFrameTime);
}

void SimulationManager::setMaxSubdivisionLevels(int levels) {
    maxSubdivisionLevels = std::clamp(levels, 0, kMaxSubdivisionLevels);
    Logger::getLogger()->info("Max warp subdivision levels set to: {}", maxSubdivisionLevels);
}

void SimulationManager::setLogLevel(const std::string& level) {
    logLevel = level;
    if (auto& logger = Logger::getLogger()) {
        logger->set_level(spdlog::level::from_str(logLevel));
        logger->info("Log level set to: {}", logLevel);
    }
}

// Rebuilds the logger so the new file sink is used right away.
void SimulationManager::setLogFilePath(const std::string& path) {
    if (path == logFilePath) {
        return;
    }
    logFilePath = path;
    Logger::reinitialize();
    Logger::getLogger()->info("Log file path set to: '{}'", logFilePath);
}

void SimulationManager::resetDefaults() {
    fixedTimestep = kDefaultFixedTimestep;
    maxFrameTime = kDefaultMaxFrameTime;
    maxSubdivisionLevels = kMaxSubdivisionLevels;
    logLevel = "info";
    logFilePath.clear();
    Logger::reinitialize();
}

double SimulationManager::getFixedTimestep() const { return fixedTimestep; }

double SimulationManager::getMaxFrameTime() const { return maxFrameTime; }

int SimulationManager::getMaxSubdivisionLevels() const { return maxSubdivisionLevels; }

const std::string& SimulationManager::getLogLevel() const { return logLevel; }

const std::string& SimulationManager::getLogFilePath() const { return logFilePath; }

}  // namespace vellum
