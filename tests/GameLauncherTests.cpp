// tests/GameLauncherTests.cpp
#include <doctest/doctest.h>

#include "TestSupport.hpp"
#include <Kiln/GameLauncher.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

using namespace Kiln;

namespace {

Instance readyInstance(const std::string& id = "vanilla") {
    Instance instance;
    instance.id = id;
    instance.versionId = "1.20.4";
    instance.state = InstanceState::Ready;
    instance.type = "release";
    instance.folder = id;
    instance.requiredJavaVersion = 17;
    instance.clientJarPath = "/data/versions/1.20.4/1.20.4.jar";
    instance.mainClass = "net.minecraft.client.main.Main";
    instance.assetIndex = "12";
    instance.classPath = {"com/mojang/brigadier/1.0.18/brigadier-1.0.18.jar"};
    instance.jvmArguments = {"-Dos.name=Windows 10", "-Dos.version=10.0", "-Djava.library.path=${natives_directory}",
                             "-cp", "${classpath}"};
    instance.gameArguments = {"--username", "${auth_player_name}", "--version", "${version_name}", "--assetIndex",
                              "${assets_index_name}", "--demo${unknown_flag}"};
    return instance;
}

bool contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

} // namespace

TEST_CASE("placeholders are substituted and unknown ones kept") {
    PlaceholderValues values{{"a", "1"}, {"name", "Steve"}};
    CHECK(substitutePlaceholders("${name}", values) == "Steve");
    CHECK(substitutePlaceholders("x${a}y${a}z", values) == "x1y1z");
    CHECK(substitutePlaceholders("${missing}", values) == "${missing}");
    CHECK(substitutePlaceholders("${unterminated", values) == "${unterminated");
    CHECK(substitutePlaceholders("plain", values) == "plain");
}

TEST_CASE("launch arguments put memory, jvm flags, main class and game flags in order") {
    KilnTest::TempDir dir;
    Config config(dir.path());
    config.settings.maxMemory = "6G";
    config.settings.minMemory = "1G";
    const Instance instance = readyInstance();
    const Account account = Account::offline("Steve");

    auto arguments = buildLaunchArguments(config, instance, account);
    REQUIRE(arguments.size() == 2 + instance.jvmArguments.size() + 1 + instance.gameArguments.size());
    CHECK(arguments[0] == "-Xmx6G");
    CHECK(arguments[1] == "-Xms1G");
    CHECK(arguments[2] == "-Dos.name=Windows 10");
    CHECK(arguments[4] == "-Djava.library.path=" + (config.versionDir("1.20.4") / "natives").string());
    CHECK(arguments[6] == buildClassPathString(config, instance));
    CHECK(arguments[7] == "net.minecraft.client.main.Main");
    CHECK(arguments[9] == "Steve");
    CHECK(arguments[11] == "1.20.4");
    CHECK(arguments[13] == "12");
    CHECK(arguments.back() == "--demo${unknown_flag}");

    auto stripped = buildLaunchArguments(config, instance, account, false);
    CHECK(stripped.size() == arguments.size() - 2);
    CHECK_FALSE(contains(stripped, "-Dos.name=Windows 10"));
    CHECK(contains(stripped, "-cp"));
}

TEST_CASE("class path starts with the client jar") {
    KilnTest::TempDir dir;
    Config config(dir.path());
    const Instance instance = readyInstance();
    const std::string classPath = buildClassPathString(config, instance);
    const std::string separator(1, Utils::getPathListSeparator());

    CHECK(classPath.rfind(instance.clientJarPath + separator, 0) == 0);
    const auto library =
        (config.librariesDir / "com/mojang/brigadier/1.0.18/brigadier-1.0.18.jar").make_preferred().string();
    CHECK(classPath.find(library) != std::string::npos);
}

TEST_CASE("placeholder values cover the launcher identity") {
    KilnTest::TempDir dir;
    Config config(dir.path());
    auto values = buildPlaceholderValues(config, readyInstance(), Account::offline("Alex"));
    CHECK(values.at("launcher_name") == config.settings.launcherName);
    CHECK(values.at("clientid") == config.settings.installationId);
    CHECK(values.at("user_type") == "msa");
    CHECK(values.at("game_directory") == config.instanceDir("vanilla").string());
    CHECK(values.at("assets_root") == config.assetsDir.string());
    CHECK(values.count("auth_uuid") == 1);
}

TEST_CASE("only exactly Windows 10 keeps the os version flags") {
    CHECK_FALSE(isExactlyWindows10(std::nullopt));
    CHECK(isExactlyWindows10(Utils::OSVersion{10, 0, 19045}));
    CHECK_FALSE(isExactlyWindows10(Utils::OSVersion{10, 0, 22631}));
    CHECK_FALSE(isExactlyWindows10(Utils::OSVersion{6, 3, 9600}));

    auto stripped = stripOsVersionFlags({"-Dos.name=Windows 10", "-Xss1M", "-Dos.version=10.0", "-Dother=1"});
    CHECK(stripped == std::vector<std::string>{"-Xss1M", "-Dother=1"});
}

TEST_CASE("launch refusals come back as diagnostics") {
    KilnTest::TempDir dir;
    Config config(dir.path());
    auto launched = std::make_shared<LaunchedInstances>();
    bool located = false;
    GameLauncher launcher(config, [&](unsigned int) -> std::optional<std::filesystem::path> {
        located = true;
        return std::nullopt;
    }, launched);

    SUBCASE("an installing instance") {
        Instance instance = readyInstance();
        instance.state = InstanceState::Installing;
        auto diagnostics = launcher.launch(instance, Account::offline("Steve")).get();
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].find("not ready") != std::string::npos);
        CHECK_FALSE(located);
    }
    SUBCASE("no runtime for the required java version") {
        auto diagnostics = launcher.launch(readyInstance(), Account::offline("Steve")).get();
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].find("Java 17") != std::string::npos);
        CHECK(located);
    }
    SUBCASE("an instance that is already running") {
        launched->tryAdd("vanilla", RunState::Running);
        auto diagnostics = launcher.launch(readyInstance(), Account::offline("Steve")).get();
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].find("already running") != std::string::npos);
        CHECK(launched->get("vanilla") == RunState::Running);
    }
    CHECK(launched->snapshot().size() <= 1);
}

#ifndef _WIN32
namespace {

// Stands in for the java binary: records its arguments and working directory, then talks
std::filesystem::path writeFakeJava(const std::filesystem::path& path, int exitCode) {
    KilnTest::writeFile(path,
                        "#!/bin/sh\n"
                        "printf '%s\\n' \"$@\" > args.txt\n"
                        "echo 'Loading Minecraft'\n"
                        "echo 'Backend library: LWJGL version 3.3.1'\n"
                        "echo 'Reloading ResourceManager: vanilla'\n"
                        "echo 'Sound engine started'\n"
                        "echo '[STDERR]: java.io.IOException: missing texture'\n"
                        "echo 'OpenGL warning' 1>&2\n"
                        "exit " + std::to_string(exitCode) + "\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
    return path;
}

} // namespace

TEST_CASE("a launched process is watched until it exits") {
    KilnTest::TempDir dir;
    Config config(dir.path());
    const auto java = writeFakeJava(dir / "fake-jdk" / "bin" / "java", 0);

    auto launched = std::make_shared<LaunchedInstances>();
    std::mutex statesMutex;
    std::vector<RunState> states;
    bool removed = false;
    launched->addListener([&](const std::string&, std::optional<RunState> state) {
        std::lock_guard<std::mutex> lock(statesMutex);
        if (state)
            states.push_back(*state);
        else
            removed = true;
    });

    unsigned int requestedMajor = 0;
    GameLauncher launcher(config, [&](unsigned int major) -> std::optional<std::filesystem::path> {
        requestedMajor = major;
        return java;
    }, launched);

    auto diagnostics = launcher.launch(readyInstance(), Account::offline("Steve")).get();

    CHECK(requestedMajor == 17);
    CHECK(contains(diagnostics, "OpenGL warning"));
    CHECK(contains(diagnostics, "[STDERR]: java.io.IOException: missing texture"));
    CHECK(diagnostics.size() == 2);
    CHECK_FALSE(launched->contains("vanilla"));

    {
        std::lock_guard<std::mutex> lock(statesMutex);
        CHECK(removed);
        CHECK(states == std::vector<RunState>{RunState::Launching, RunState::RendererReady, RunState::Splash,
                                              RunState::Running});
    }

    // The process ran in the instance folder with the built arguments
    const std::string recorded = KilnTest::readFile(config.instanceDir("vanilla") / "args.txt");
    CHECK(recorded.find("net.minecraft.client.main.Main\n") != std::string::npos);
    CHECK(recorded.find("Steve\n") != std::string::npos);
}

TEST_CASE("a non-zero exit is reported") {
    KilnTest::TempDir dir;
    Config config(dir.path());
    const auto java = writeFakeJava(dir / "fake-jdk" / "bin" / "java", 3);
    auto launched = std::make_shared<LaunchedInstances>();
    GameLauncher launcher(config, [&](unsigned int) -> std::optional<std::filesystem::path> { return java; },
                          launched);

    auto diagnostics = launcher.launch(readyInstance(), Account::offline("Steve")).get();
    CHECK(contains(diagnostics, "Process exited with code 3"));
    CHECK(launched->snapshot().empty());
}
#endif
