// src/Config.cpp
#include <Kiln/Config.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <thread>

using json = nlohmann::json;

namespace Kiln {

    namespace {
        template <typename T>
        void readIfPresent(const json& j, const char* key, T& target) {
            if (j.contains(key) && !j.at(key).is_null()) {
                target = j.at(key).get<T>();
            }
        }

        void createDirIfNotExists(const std::filesystem::path& p, const char* name) {
            std::error_code ec;
            if (std::filesystem::is_directory(p, ec))
                return;
            if (!std::filesystem::create_directories(p, ec) && ec) {
                throw LauncherError(std::string("Failed to create ") + name + " directory " + p.string() + ": " +
                                    ec.message());
            }
        }
    } // namespace

    Settings Settings::from_json(const json& j) {
        Settings s;
        readIfPresent(j, "maxConcurrentDownloads", s.maxConcurrentDownloads);
        readIfPresent(j, "maxParallelPerStream", s.maxParallelPerStream);
        readIfPresent(j, "httpRetries", s.httpRetries);
        readIfPresent(j, "httpRetryDelayMs", s.httpRetryDelayMs);
        readIfPresent(j, "httpTimeoutSeconds", s.httpTimeoutSeconds);
        readIfPresent(j, "connectTimeoutSeconds", s.connectTimeoutSeconds);
        readIfPresent(j, "installTimeoutMinutes", s.installTimeoutMinutes);
        readIfPresent(j, "manifestUrls", s.manifestUrls);
        readIfPresent(j, "assetsBaseUrl", s.assetsBaseUrl);
        readIfPresent(j, "runtimeApiBase", s.runtimeApiBase);
        readIfPresent(j, "minMemory", s.minMemory);
        readIfPresent(j, "maxMemory", s.maxMemory);
        readIfPresent(j, "launcherName", s.launcherName);
        readIfPresent(j, "launcherVersion", s.launcherVersion);
        readIfPresent(j, "installationId", s.installationId);
        readIfPresent(j, "workerThreads", s.workerThreads);
        if (s.maxConcurrentDownloads == 0)
            s.maxConcurrentDownloads = 1;
        if (s.maxParallelPerStream == 0)
            s.maxParallelPerStream = 1;
        if (s.httpRetries < 0)
            s.httpRetries = 0;
        return s;
    }

    size_t Settings::resolvedWorkerThreads() const {
        const size_t downloads = maxConcurrentDownloads + INSTALL_COORDINATOR_THREADS;
        const size_t cores = std::thread::hardware_concurrency();
        return std::max({downloads, cores, workerThreads});
    }

    json Settings::to_json() const {
        return json{
            {"maxConcurrentDownloads", maxConcurrentDownloads},
            {"maxParallelPerStream", maxParallelPerStream},
            {"httpRetries", httpRetries},
            {"httpRetryDelayMs", httpRetryDelayMs},
            {"httpTimeoutSeconds", httpTimeoutSeconds},
            {"connectTimeoutSeconds", connectTimeoutSeconds},
            {"installTimeoutMinutes", installTimeoutMinutes},
            {"manifestUrls", manifestUrls},
            {"assetsBaseUrl", assetsBaseUrl},
            {"runtimeApiBase", runtimeApiBase},
            {"minMemory", minMemory},
            {"maxMemory", maxMemory},
            {"launcherName", launcherName},
            {"launcherVersion", launcherVersion},
            {"installationId", installationId},
            {"workerThreads", workerThreads}
        };
    }

    Config::Config(const std::filesystem::path& base) : baseDataPath(base) {
        versionsDir = baseDataPath / "versions";
        assetsDir = baseDataPath / "assets";
        librariesDir = baseDataPath / "libraries";
        javaRuntimesDir = baseDataPath / "java";
        instancesDir = baseDataPath / "instances";
        logsDir = baseDataPath / "logs";
        databasePath = baseDataPath / "kiln.sqlite";
        settingsPath = baseDataPath / "settings.json";

        createDirIfNotExists(baseDataPath, "base data");
        createDirIfNotExists(versionsDir, "versions");
        createDirIfNotExists(assetIndexesDir(), "asset indexes");
        createDirIfNotExists(assetObjectsDir(), "asset objects");
        createDirIfNotExists(librariesDir, "libraries");
        createDirIfNotExists(javaRuntimesDir, "java runtimes");
        createDirIfNotExists(instancesDir, "instances");
        createDirIfNotExists(logsDir, "logs");

        bool dirty = true;
        if (std::filesystem::exists(settingsPath)) {
            std::ifstream in(settingsPath);
            try {
                settings = Settings::from_json(json::parse(in));
                dirty = false;
            } catch (const json::exception& e) {
                KILN_LOG_WARN("Ignoring unreadable settings file {}: {}", settingsPath.string(), e.what());
                settings = Settings{};
            }
        }

        if (settings.installationId.empty()) {
            boost::uuids::random_generator generator;
            settings.installationId = boost::uuids::to_string(generator());
            dirty = true;
        }

        if (dirty) {
            saveSettings();
        }
    }

    void Config::saveSettings() const {
        std::ofstream out(settingsPath, std::ios::trunc);
        if (!out) {
            throw LauncherError("Failed to write settings file " + settingsPath.string());
        }
        out << settings.to_json().dump(4);
    }

    std::filesystem::path Config::defaultBasePath() {
        if (const char* home = std::getenv("KILN_HOME"); home && *home) {
            return home;
        }
#ifdef _WIN32
        if (const char* appData = std::getenv("APPDATA"); appData && *appData) {
            return std::filesystem::path(appData) / "Kiln";
        }
#elif defined(__APPLE__)
        if (const char* userHome = std::getenv("HOME"); userHome && *userHome) {
            return std::filesystem::path(userHome) / "Library" / "Application Support" / "Kiln";
        }
#else
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return std::filesystem::path(xdg) / "kiln";
        }
        if (const char* userHome = std::getenv("HOME"); userHome && *userHome) {
            return std::filesystem::path(userHome) / ".local" / "share" / "kiln";
        }
#endif
        return std::filesystem::current_path() / ".kiln";
    }

} // namespace Kiln
