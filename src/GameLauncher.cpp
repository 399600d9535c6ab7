// src/GameLauncher.cpp
#include <Kiln/GameLauncher.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <boost/process.hpp>

#include <mutex>
#include <thread>

namespace Kiln {

namespace bp = boost::process;

std::string substitutePlaceholders(const std::string& token, const PlaceholderValues& values) {
    std::string result;
    result.reserve(token.size());
    size_t pos = 0;
    while (pos < token.size()) {
        size_t start = token.find("${", pos);
        if (start == std::string::npos) {
            result.append(token, pos, std::string::npos);
            break;
        }
        size_t end = token.find('}', start + 2);
        if (end == std::string::npos) {
            result.append(token, pos, std::string::npos);
            break;
        }
        result.append(token, pos, start - pos);
        auto it = values.find(token.substr(start + 2, end - start - 2));
        if (it != values.end()) {
            result += it->second;
        } else {
            result.append(token, start, end - start + 1);
        }
        pos = end + 1;
    }
    return result;
}

std::string buildClassPathString(const Config& config, const Instance& instance) {
    const std::string separator(1, Utils::getPathListSeparator());
    std::string classPath = instance.clientJarPath;
    for (const auto& entry : instance.classPath) {
        if (!classPath.empty())
            classPath += separator;
        classPath += (config.librariesDir / std::filesystem::path(entry)).make_preferred().string();
    }
    return classPath;
}

PlaceholderValues buildPlaceholderValues(const Config& config, const Instance& instance, const Account& account) {
    PlaceholderValues values;
    values["version_name"] = instance.versionId;
    values["game_directory"] = config.instanceDir(instance.folder).string();
    values["assets_root"] = config.assetsDir.string();
    values["assets_index_name"] = instance.assetIndex;
    values["auth_uuid"] = account.minecraftUserId;
    values["auth_player_name"] = account.username;
    values["auth_session"] = account.accessToken;
    values["auth_access_token"] = account.accessToken;
    values["auth_xuid"] = account.xboxUserId;
    values["user_type"] = "msa";
    values["version_type"] = instance.type;
    values["natives_directory"] = (config.versionDir(instance.versionId) / "natives").string();
    values["library_directory"] = config.librariesDir.string();
    values["classpath_separator"] = std::string(1, Utils::getPathListSeparator());
    values["launcher_name"] = config.settings.launcherName;
    values["launcher_version"] = config.settings.launcherVersion;
    values["classpath"] = buildClassPathString(config, instance);
    values["clientid"] = config.settings.installationId;
    return values;
}

std::vector<std::string> stripOsVersionFlags(const std::vector<std::string>& arguments) {
    std::vector<std::string> result;
    result.reserve(arguments.size());
    for (const auto& argument : arguments) {
        if (argument.rfind("-Dos", 0) == 0)
            continue;
        result.push_back(argument);
    }
    return result;
}

bool isExactlyWindows10(const std::optional<Utils::OSVersion>& version) {
    return version && version->major == 10 && version->build < 22000;
}

std::vector<std::string> buildLaunchArguments(const Config& config, const Instance& instance, const Account& account,
                                              bool keepOsVersionFlags) {
    const PlaceholderValues values = buildPlaceholderValues(config, instance, account);

    std::vector<std::string> arguments;
    arguments.push_back("-Xmx" + config.settings.maxMemory);
    arguments.push_back("-Xms" + config.settings.minMemory);

    std::vector<std::string> jvmArguments =
        keepOsVersionFlags ? instance.jvmArguments : stripOsVersionFlags(instance.jvmArguments);
    for (const auto& token : jvmArguments)
        arguments.push_back(substitutePlaceholders(token, values));

    arguments.push_back(instance.mainClass);

    for (const auto& token : instance.gameArguments)
        arguments.push_back(substitutePlaceholders(token, values));
    return arguments;
}

GameLauncher::GameLauncher(const Config& config, JavaLocator javaLocator, std::shared_ptr<LaunchedInstances> launched)
    : m_config(config), m_javaLocator(std::move(javaLocator)), m_launched(std::move(launched)) {
    m_logger = Utils::Logger::GetOrCreateLogger("GameLauncher");
}

std::future<std::vector<std::string>> GameLauncher::launch(const Instance& instance, const Account& account) {
    return std::async(std::launch::async, [this, instance, account]() { return run(instance, account); });
}

std::vector<std::string> GameLauncher::run(const Instance& instance, const Account& account) {
    std::vector<std::string> diagnostics;

    if (!m_launched->tryAdd(instance.id)) {
        m_logger->warn("Instance '{}' is already running", instance.id);
        diagnostics.push_back("Instance '" + instance.id + "' is already running");
        return diagnostics;
    }

    try {
        if (instance.state != InstanceState::Ready) {
            throw LaunchError("Instance '" + instance.id + "' is not ready (" +
                              (instance.state == InstanceState::Installing ? "still installing" : "unknown state") + ")");
        }

        auto javaExecutable = m_javaLocator(instance.requiredJavaVersion);
        if (!javaExecutable) {
            throw LaunchError("Java " + std::to_string(instance.requiredJavaVersion) + " is not installed");
        }

        bool keepOsFlags = true;
        if (Utils::getCurrentOS() == Utils::OperatingSystem::WINDOWS) {
            keepOsFlags = isExactlyWindows10(Utils::getCurrentOSVersion());
        }
        const std::vector<std::string> arguments = buildLaunchArguments(m_config, instance, account, keepOsFlags);

        runProcess(instance, *javaExecutable, arguments, diagnostics);
    } catch (const std::exception& e) {
        m_logger->error("[{}] Launch failed: {}", instance.id, e.what());
        diagnostics.push_back(std::string("Launch failed: ") + e.what());
    }

    m_launched->remove(instance.id);
    return diagnostics;
}

void GameLauncher::runProcess(const Instance& instance, const std::filesystem::path& javaExecutable,
                              const std::vector<std::string>& arguments, std::vector<std::string>& diagnostics) {
    const std::filesystem::path workingDirectory = m_config.instanceDir(instance.folder);
    std::error_code ec;
    std::filesystem::create_directories(workingDirectory, ec);
    if (ec) {
        throw LaunchError("Cannot create instance folder " + workingDirectory.string() + ": " + ec.message());
    }

    m_logger->info("[{}] Starting {} with {} arguments in {}", instance.id, javaExecutable.string(), arguments.size(),
                   workingDirectory.string());

    std::mutex diagnosticsMutex;
    bp::ipstream outStream;
    bp::ipstream errStream;

    bp::child process;
    try {
        process = bp::child(bp::exe = javaExecutable.string(), bp::args = arguments,
                            bp::start_dir = workingDirectory.string(),
                            bp::std_out > outStream, bp::std_err > errStream);
    } catch (const bp::process_error& e) {
        throw LaunchError(std::string("Failed to start the game: ") + e.what());
    }

    std::thread errReader([&]() {
        std::string line;
        while (std::getline(errStream, line)) {
            m_logger->error("[{}] {}", instance.id, line);
            std::lock_guard<std::mutex> lock(diagnosticsMutex);
            diagnostics.push_back(line);
        }
    });

    std::string line;
    while (std::getline(outStream, line)) {
        m_logger->info("[{}] {}", instance.id, line);
        if (isInternalErrorLine(line)) {
            std::lock_guard<std::mutex> lock(diagnosticsMutex);
            diagnostics.push_back(line);
        }
        auto current = m_launched->get(instance.id);
        if (!current)
            continue;
        if (auto next = classifyLine(*current, line)) {
            if (m_launched->advanceTo(instance.id, *next)) {
                m_logger->debug("[{}] Run state {}", instance.id, run_state_to_string(*next));
            }
        }
    }

    std::error_code waitError;
    process.wait(waitError);
    errReader.join();

    if (waitError) {
        throw LaunchError("Failed waiting for the game process: " + waitError.message());
    }
    const int exitCode = process.exit_code();
    m_logger->info("[{}] Process exited with code {}", instance.id, exitCode);
    if (exitCode != 0) {
        diagnostics.push_back("Process exited with code " + std::to_string(exitCode));
    }
}

} // namespace Kiln
