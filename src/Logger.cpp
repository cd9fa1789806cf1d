#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>

#include <vector>

#include "SimulationManager.hpp"

namespace vellum {

namespace {

constexpr const char* kLoggerName = "vellum";
constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [vellum] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v";

}  // namespace

std::shared_ptr<spdlog::logger> Logger::logger = nullptr;

void Logger::initialize() {
    if (logger) {
        return;
    }

    const SimulationManager* settings = SimulationManager::Instance();
    spdlog::level::level_enum level = spdlog::level::from_str(settings->getLogLevel());

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    sinks.push_back(console_sink);

    const std::string& file_path = settings->getLogFilePath();
    if (!file_path.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, 1048576 * 5, 3);  // 5MB per file, 3 rotated files
            file_sink->set_pattern(kFilePattern);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log file sink unavailable (" << file_path << "): " << ex.what()
                      << std::endl;
        }
    }

    logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    logger->debug("Logger initialized at level {}", spdlog::level::to_string_view(level));
}

void Logger::shutdown() {
    if (logger) {
        logger->flush();
    }
    logger.reset();
}

void Logger::reinitialize() {
    shutdown();
    initialize();
}

std::shared_ptr<spdlog::logger>& Logger::getLogger() {
    if (!logger) {
        initialize();
    }
    return logger;
}

void Logger::info(const std::string& message) { getLogger()->info(message); }

void Logger::warn(const std::string& message) { getLogger()->warn(message); }

void Logger::error(const std::string& message) { getLogger()->error(message); }

void Logger::critical(const std::string& message) { getLogger()->critical(message); }

void Logger::debug(const std::string& message) { getLogger()->debug(message); }

void Logger::trace(const std::string& message) { getLogger()->trace(message); }

}  // namespace vellum
