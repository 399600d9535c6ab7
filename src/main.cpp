// src/main.cpp
#include <Kiln/Config.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/FileDownloader.hpp>
#include <Kiln/GameLauncher.hpp>
#include <Kiln/HttpManager.hpp>
#include <Kiln/InstanceManager.hpp>
#include <Kiln/JavaManager.hpp>
#include <Kiln/LaunchedInstances.hpp>
#include <Kiln/Repository.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/WorkerPool.hpp>
#include <Kiln/VersionManager.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

    void printUsage() {
        std::cout << "kiln " << KILN_VERSION << "\n"
                  << "Usage:\n"
                  << "  kiln versions [--reload]         list installable releases\n"
                  << "  kiln list                        list instances\n"
                  << "  kiln install <version> <name>    install a version as a named instance\n"
                  << "  kiln launch <name> [--user <n>]  launch an instance\n";
    }

    int listVersions(Kiln::InstanceManager& instances, bool reload) {
        for (const auto& version : instances.refreshAvailableVersions(reload)) {
            std::cout << version.id << "  " << version.releaseTime << "\n";
        }
        return 0;
    }

    int listInstances(Kiln::InstanceManager& instances) {
        for (const auto& instance : instances.getInstances()) {
            std::string state = instance.state == Kiln::InstanceState::Unknown
                                    ? "UNKNOWN"
                                    : Kiln::instance_state_to_string(instance.state);
            std::cout << instance.id << "  " << instance.versionId << "  " << state << "  " << instance.folder << "\n";
        }
        return 0;
    }

    int install(Kiln::InstanceManager& instances, const std::string& versionId, const std::string& name) {
        std::optional<Kiln::VersionInfo> target;
        for (const auto& version : instances.refreshAvailableVersions(false)) {
            if (version.id == versionId) {
                target = version;
                break;
            }
        }
        if (!target) {
            KILN_LOG_ERROR("Version {} is not available. Try 'kiln versions --reload'.", versionId);
            return 1;
        }

        Kiln::Instance instance = instances.createInstance(*target, name, [](const Kiln::InstallProgress& p) {
            std::cout << "\rclient " << p.client << "%  assets " << p.assets << "%  libraries " << p.libraries
                      << "%  java " << p.java << "%   " << std::flush;
        });
        std::cout << "\n";
        KILN_LOG_INFO("Installed '{}' ({}) into {}", instance.id, instance.versionId, instance.folder);
        return 0;
    }

    int launch(const Kiln::Config& config, Kiln::Repository& repository, Kiln::JavaManager& javaManager,
               const std::string& name, const std::optional<std::string>& user) {
        std::optional<Kiln::Instance> instance = repository.getInstance(name);
        if (!instance) {
            KILN_LOG_ERROR("No instance named '{}'", name);
            return 1;
        }

        std::optional<Kiln::Account> account;
        for (const auto& stored : repository.getAllAccounts()) {
            if (!user || stored.username == *user) {
                account = stored;
                break;
            }
        }
        if (!account) {
            account = Kiln::Account::offline(user.value_or("Player"));
            KILN_LOG_INFO("No stored account, playing offline as {}", account->username);
        }

        Kiln::GameLauncher launcher(
            config, [&javaManager](unsigned int major) { return javaManager.getJavaExecutablePath(major); },
            std::make_shared<Kiln::LaunchedInstances>());
        launcher.launchedInstances().addListener([](const std::string& id, std::optional<Kiln::RunState> state) {
            if (state)
                KILN_LOG_INFO("{} is {}", id, Kiln::run_state_to_string(*state));
        });

        std::vector<std::string> diagnostics = launcher.launch(*instance, *account).get();
        if (diagnostics.empty()) {
            KILN_LOG_INFO("'{}' exited normally", name);
            return 0;
        }
        std::cerr << "The game reported " << diagnostics.size() << " error line(s):\n";
        for (const auto& line : diagnostics) {
            std::cerr << "  " << line << "\n";
        }
        return 2;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage();
        return args.empty() ? 1 : 0;
    }

    int exitCode = 1;
    try {
        Kiln::Config config;
        Kiln::Utils::Logger::Init(config.logsDir, "kiln.log", spdlog::level::info, spdlog::level::trace);
        KILN_LOG_INFO("Kiln v{} starting, data directory {}", KILN_VERSION, config.baseDataPath.string());

        auto http = std::make_shared<Kiln::HttpManager>(Kiln::HttpOptions::from_settings(config.settings));
        auto downloader = std::make_shared<Kiln::FileDownloader>(http, config.settings.maxConcurrentDownloads);
        auto pool = std::make_shared<Kiln::Utils::WorkerPool>(config.settings.resolvedWorkerThreads());
        auto repository = std::make_shared<Kiln::Repository>(config.databasePath);
        auto versionManager = std::make_shared<Kiln::VersionManager>(config, downloader, pool);
        auto javaManager = std::make_shared<Kiln::JavaManager>(config, downloader);
        Kiln::InstanceManager instances(config, repository, versionManager, javaManager, pool);

        const std::string& command = args[0];
        if (command == "versions") {
            exitCode = listVersions(instances, args.size() > 1 && args[1] == "--reload");
        } else if (command == "list") {
            exitCode = listInstances(instances);
        } else if (command == "install" && args.size() == 3) {
            exitCode = install(instances, args[1], args[2]);
        } else if (command == "launch" && args.size() >= 2) {
            std::optional<std::string> user;
            if (args.size() == 4 && args[2] == "--user")
                user = args[3];
            exitCode = launch(config, *repository, *javaManager, args[1], user);
        } else {
            printUsage();
        }
    } catch (const Kiln::UnsupportedPlatformError& e) {
        KILN_LOG_CRITICAL("This platform is not supported: {}", e.what());
    } catch (const Kiln::InstanceExistsError& e) {
        KILN_LOG_CRITICAL("{}", e.what());
    } catch (const std::exception& e) {
        KILN_LOG_CRITICAL("{}", e.what());
        std::cerr << "kiln: " << e.what() << "\n";
    }

    Kiln::Utils::Logger::Shutdown();
    return exitCode;
}
