// include/Kiln/Config.hpp
#ifndef KILN_CONFIG_HPP
#define KILN_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kiln {

    constexpr const char* KILN_VERSION = "0.3.0";

    struct Settings {
        size_t maxConcurrentDownloads = 10;
        size_t maxParallelPerStream = 10;
        int httpRetries = 3;
        int httpRetryDelayMs = 2000;
        int httpTimeoutSeconds = 15;
        int connectTimeoutSeconds = 10;
        int installTimeoutMinutes = 60;
        std::vector<std::string> manifestUrls = {
            "https://piston-meta.mojang.com/mc/game/version_manifest_v2.json",
            "https://launchermeta.mojang.com/mc/game/version_manifest_v2.json"
        };
        std::string assetsBaseUrl = "https://resources.download.minecraft.net";
        std::string runtimeApiBase = "https://api.adoptium.net/v3";
        std::string minMemory = "2G";
        std::string maxMemory = "4G";
        std::string launcherName = "kiln";
        std::string launcherVersion = KILN_VERSION;
        std::string installationId;
        size_t workerThreads = 0; // raises the pool size, see resolvedWorkerThreads()

        // Pool threads that hold a whole install phase: the Java install and the asset and
        // library stream coordinators.
        static constexpr size_t INSTALL_COORDINATOR_THREADS = 3;

        // Enough threads for a full admission gate next to the install coordinators, never
        // fewer than the cores or an explicit workerThreads.
        size_t resolvedWorkerThreads() const;

        // Missing keys keep their defaults.
        static Settings from_json(const nlohmann::json& j);
        nlohmann::json to_json() const;
    };

    struct Config {
        std::filesystem::path baseDataPath;
        std::filesystem::path versionsDir;
        std::filesystem::path assetsDir;
        std::filesystem::path librariesDir;
        std::filesystem::path javaRuntimesDir;
        std::filesystem::path instancesDir;
        std::filesystem::path logsDir;
        std::filesystem::path databasePath;
        std::filesystem::path settingsPath;
        Settings settings;

        // Creates the directory layout under base and loads <base>/settings.json.
        // The file is written back when it was missing or had no installation id.
        explicit Config(const std::filesystem::path& base = defaultBasePath());

        void saveSettings() const;

        std::filesystem::path assetIndexesDir() const { return assetsDir / "indexes"; }
        std::filesystem::path assetObjectsDir() const { return assetsDir / "objects"; }
        std::filesystem::path versionDir(const std::string& versionId) const { return versionsDir / versionId; }
        std::filesystem::path instanceDir(const std::string& folder) const { return instancesDir / folder; }

        // $KILN_HOME, else the platform data directory, else ./.kiln
        static std::filesystem::path defaultBasePath();
    };

} // namespace Kiln

#endif // KILN_CONFIG_HPP
