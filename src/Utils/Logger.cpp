// src/Utils/Logger.cpp
#include <Kiln/Utils/Logger.hpp>
#include <iostream> // For errors before any logger exists

namespace Kiln {
namespace Utils {

    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;
    std::vector<spdlog::sink_ptr> Logger::s_GlobalSinks;
    std::mutex Logger::s_InitMutex;

    namespace {
        constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
        constexpr size_t LOG_FILE_COUNT = 3;

        spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(level);
            sink->set_pattern("%^[%H:%M:%S.%e] [%n] [%l] %v%$");
            return sink;
        }

        // Loggers keep every message; the sinks decide what is written.
        std::shared_ptr<spdlog::logger> makeLogger(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks) {
            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::info);
            return logger;
        }
    } // namespace

    void Logger::Init(const std::filesystem::path& logDir,
                      const std::string& logFileName,
                      spdlog::level::level_enum consoleLevel,
                      spdlog::level::level_enum fileLevel) {
        std::lock_guard<std::mutex> lock(s_InitMutex);
        spdlog::drop_all();
        s_GlobalSinks.clear();
        s_GlobalSinks.push_back(makeConsoleSink(consoleLevel));

        std::string fileError;
        if (!logDir.empty() && !logFileName.empty()) {
            try {
                std::filesystem::create_directories(logDir);
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (logDir / logFileName).string(), LOG_FILE_MAX_BYTES, LOG_FILE_COUNT);
                fileSink->set_level(fileLevel);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] [%n] [%l] %v");
                s_GlobalSinks.push_back(fileSink);
            } catch (const std::exception& ex) {
                // spdlog_ex and filesystem_error both land here; keep logging to the console
                fileError = ex.what();
            }
        }

        s_CoreLogger = makeLogger("Core", s_GlobalSinks);
        spdlog::register_logger(s_CoreLogger);

        if (!fileError.empty()) {
            std::cerr << "kiln: cannot open log file in " << logDir.string() << ": " << fileError << std::endl;
            s_CoreLogger->error("File logging disabled: {}", fileError);
        }
        s_CoreLogger->debug("Logging to {} sink(s), console level {}", s_GlobalSinks.size(),
                            spdlog::level::to_string_view(consoleLevel));
    }

    std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
        if (!s_CoreLogger) {
            Init("", "", spdlog::level::warn, spdlog::level::trace);
        }
        return s_CoreLogger;
    }

    std::shared_ptr<spdlog::logger> Logger::GetOrCreateLogger(const std::string& name) {
        std::lock_guard<std::mutex> lock(s_InitMutex);
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        // Init() was never called (unit tests): console only
        auto logger = s_GlobalSinks.empty() ? makeLogger(name, {makeConsoleSink(spdlog::level::warn)})
                                            : makeLogger(name, s_GlobalSinks);
        spdlog::register_logger(logger);
        return logger;
    }

    void Logger::Shutdown() {
        std::lock_guard<std::mutex> lock(s_InitMutex);
        s_CoreLogger.reset();
        s_GlobalSinks.clear();
        spdlog::shutdown();
    }

} // namespace Utils
} // namespace Kiln
