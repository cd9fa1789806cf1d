#ifndef VELLUM_LOGGER_HPP
#define VELLUM_LOGGER_HPP

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>

namespace vellum {

class Logger {
   public:
    // Retrieves the shared logger, initializing it on first use
    static std::shared_ptr<spdlog::logger>& getLogger();

    // Builds the sinks from SimulationManager's log settings
    static void initialize();

    // Drops the current logger so the next getLogger() rebuilds it
    static void shutdown();

    // Flushes and rebuilds the sinks from the current settings
    static void reinitialize();

    // Logging methods
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);
    void debug(const std::string& message);
    void trace(const std::string& message);

   private:
    static std::shared_ptr<spdlog::logger> logger;
};

}  // namespace vellum

#endif  // VELLUM_LOGGER_HPP
