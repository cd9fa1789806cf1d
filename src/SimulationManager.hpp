#ifndef VELLUM_SIMULATION_MANAGER_HPP
#define VELLUM_SIMULATION_MANAGER_HPP

#include <string>

namespace vellum {

// Process-wide defaults. GameLoop snapshots these at construction.
class SimulationManager {
   public:
    // Retrieves the singleton instance
    static SimulationManager* Instance();

    // Setters
    void setFixedTimestep(double seconds);
    void setMaxFrameTime(double seconds);
    void setMaxSubdivisionLevels(int levels);
    void setLogLevel(const std::string& level);
    void setLogFilePath(const std::string& path);

    // Restores every value to its built-in default
    void resetDefaults();

    // Getters
    double getFixedTimestep() const;
    double getMaxFrameTime() const;
    int getMaxSubdivisionLevels() const;
    const std::string& getLogLevel() const;
    const std::string& getLogFilePath() const;

    static constexpr double kDefaultFixedTimestep = 1.0 / 60.0;
    static constexpr double kDefaultMaxFrameTime = 0.25;
    static constexpr int kMaxSubdivisionLevels = 3;

   private:
    SimulationManager();
    ~SimulationManager() = default;

    SimulationManager(const SimulationManager&) = delete;
    SimulationManager& operator=(const SimulationManager&) = delete;

    static SimulationManager* s_pInstance;

    double fixedTimestep;
    double maxFrameTime;
    int maxSubdivisionLevels;
    std::string logLevel;
    std::string logFilePath;
};

}  // namespace vellum

#endif  // VELLUM_SIMULATION_MANAGER_HPP
