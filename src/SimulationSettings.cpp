#include "SimulationSettings.hpp"

namespace vellum {

void SimulationSettings::setFixedTimestep(double seconds) {
    SimulationManager::Instance()->setFixedTimestep(seconds);
}

void SimulationSettings::setMaxFrameTime(double seconds) {
    SimulationManager::Instance()->setMaxFrameTime(seconds);
}

void SimulationSettings::setMaxSubdivisionLevels(int levels) {
    SimulationManager::Instance()->setMaxSubdivisionLevels(levels);
}

void SimulationSettings::setLogLevel(const std::string& level) {
    SimulationManager::Instance()->setLogLevel(level);
}

void SimulationSettings::setLogFilePath(const std::string& path) {
    SimulationManager::Instance()->setLogFilePath(path);
}

void SimulationSettings::resetDefaults() { SimulationManager::Instance()->resetDefaults(); }

double SimulationSettings::getFixedTimestep() const {
    return SimulationManager::Instance()->getFixedTimestep();
}

double SimulationSettings::getMaxFrameTime() const {
    return SimulationManager::Instance()->getMaxFrameTime();
}

int SimulationSettings::getMaxSubdivisionLevels() const {
    return SimulationManager::Instance()->getMaxSubdivisionLevels();
}

std::string SimulationSettings::getLogLevel() const {
    return SimulationManager::Instance()->getLogLevel();
}

std::string SimulationSettings::getLogFilePath() const {
    return SimulationManager::Instance()->getLogFilePath();
}

}  // namespace vellum
