// include/Kiln/Utils/Logger.hpp
#ifndef KILN_LOGGER_UTIL_HPP
#define KILN_LOGGER_UTIL_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <vector>
#include <filesystem>
#include <string>

namespace Kiln::Utils {

    class Logger {
    public:
        // Console sink plus a rotating <logDir>/<logFileName>; an empty logDir means console only
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "kiln.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Creates the logger on first use, attached to the sinks from Init()
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void Shutdown();

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
        static std::mutex s_InitMutex;
    };

} // namespace Kiln::Utils

#define KILN_LOG_TRACE(...)    if(auto& logger = ::Kiln::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define KILN_LOG_DEBUG(...)    if(auto& logger = ::Kiln::Utils::Logger::GetCoreLogger(); logger) { logger->debug(__VA_ARGS__); }
#define KILN_LOG_INFO(...)     if(auto& logger = ::Kiln::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define KILN_LOG_WARN(...)     if(auto& logger = ::Kiln::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define KILN_LOG_ERROR(...)    if(auto& logger = ::Kiln::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define KILN_LOG_CRITICAL(...) if(auto& logger = ::Kiln::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // KILN_LOGGER_UTIL_HPP
