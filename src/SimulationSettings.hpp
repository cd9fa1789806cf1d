#ifndef VELLUM_SIMULATION_SETTINGS_HPP
#define VELLUM_SIMULATION_SETTINGS_HPP

#include <string>

#include "SimulationManager.hpp"

namespace vellum {

class SimulationSettings {
   public:
    void setFixedTimestep(double seconds);
    void setMaxFrameTime(double seconds);
    void setMaxSubdivisionLevels(int levels);
    void setLogLevel(const std::string& level);
    void setLogFilePath(const std::string& path);
    void resetDefaults();

    double getFixedTimestep() const;
    double getMaxFrameTime() const;
    int getMaxSubdivisionLevels() const;
    std::string getLogLevel() const;
    std::string getLogFilePath() const;
};

}  // namespace vellum

#endif  // VELLUM_SIMULATION_SETTINGS_HPP
