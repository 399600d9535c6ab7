// include/Kiln/GameLauncher.hpp
#ifndef KILN_GAME_LAUNCHER_HPP
#define KILN_GAME_LAUNCHER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/LaunchedInstances.hpp>
#include <Kiln/Types/Instance.hpp>
#include <Kiln/Utils/OS.hpp>

#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Kiln {

    using PlaceholderValues = std::map<std::string, std::string>;

    // Replaces every ${key} with a known value; unknown placeholders are left as they are.
    std::string substitutePlaceholders(const std::string& token, const PlaceholderValues& values);

    // Client jar followed by the libraries, joined by the platform separator.
    std::string buildClassPathString(const Config& config, const Instance& instance);

    PlaceholderValues buildPlaceholderValues(const Config& config, const Instance& instance, const Account& account);

    // -Xmx/-Xms, jvm arguments, main class, game arguments.
    std::vector<std::string> buildLaunchArguments(const Config& config, const Instance& instance, const Account& account,
                                                  bool keepOsVersionFlags = true);

    // Drops the -Dos* tokens that only describe Windows 10.
    std::vector<std::string> stripOsVersionFlags(const std::vector<std::string>& arguments);

    // major 10 with a build below 22000 (Windows 11 reports 10.0.22000+)
    bool isExactlyWindows10(const std::optional<Utils::OSVersion>& version);

    /**
     * Spawns an installed instance and watches its output.
     *
     * Stdout lines advance the instance's run state in the shared LaunchedInstances table.
     * Stderr lines and stdout lines flagged as internal errors are collected and returned once
     * the process exits; any failure on the way is folded into that list instead of thrown.
     */
    class GameLauncher {
    public:
        using JavaLocator = std::function<std::optional<std::filesystem::path>(unsigned int majorVersion)>;

        GameLauncher(const Config& config, JavaLocator javaLocator, std::shared_ptr<LaunchedInstances> launched);

        std::future<std::vector<std::string>> launch(const Instance& instance, const Account& account);

        LaunchedInstances& launchedInstances() { return *m_launched; }

    private:
        const Config& m_config;
        JavaLocator m_javaLocator;
        std::shared_ptr<LaunchedInstances> m_launched;
        std::shared_ptr<spdlog::logger> m_logger;

        std::vector<std::string> run(const Instance& instance, const Account& account);
        void runProcess(const Instance& instance, const std::filesystem::path& javaExecutable,
                        const std::vector<std::string>& arguments, std::vector<std::string>& diagnostics);
    };

} // namespace Kiln

#endif // KILN_GAME_LAUNCHER_HPP
