// tests/RepositoryTests.cpp
#include <doctest/doctest.h>

#include "TestSupport.hpp"
#include <Kiln/Errors.hpp>
#include <Kiln/Repository.hpp>

#include <stdexcept>

using namespace Kiln;

namespace {

Instance installingRecord(const std::string& id) {
    Instance instance;
    instance.id = id;
    instance.versionId = "1.20.4";
    instance.type = "release";
    instance.folder = id;
    return instance;
}

} // namespace

TEST_CASE("installing record survives reopening the store") {
    KilnTest::TempDir dir;
    const auto dbPath = dir / "kiln.sqlite";
    {
        Repository repository(dbPath);
        repository.insertInstallingInstance(installingRecord("vanilla"));
    }

    Repository reopened(dbPath);
    auto instance = reopened.getInstance("vanilla");
    REQUIRE(instance.has_value());
    CHECK(instance->state == InstanceState::Installing);
    CHECK(instance->versionId == "1.20.4");
    CHECK(instance->folder == "vanilla");
}

TEST_CASE("instance lifecycle") {
    KilnTest::TempDir dir;
    Repository repository(dir / "kiln.sqlite");

    Instance instance = installingRecord("vanilla");
    instance.state = InstanceState::Ready; // ignored, inserts are always INSTALLING
    repository.insertInstallingInstance(instance);
    CHECK(repository.instanceExists("vanilla"));
    CHECK_FALSE(repository.instanceExists("other"));
    CHECK(repository.getInstance("vanilla")->state == InstanceState::Installing);

    SUBCASE("duplicates are rejected") {
        CHECK_THROWS_AS(repository.insertInstallingInstance(installingRecord("vanilla")), InstanceExistsError);
    }

    SUBCASE("details are stored while installing, then the record turns ready") {
        instance.requiredJavaVersion = 17;
        instance.clientJarPath = "/data/versions/1.20.4/1.20.4.jar";
        instance.mainClass = "net.minecraft.client.main.Main";
        instance.assetIndex = "12";
        instance.classPath = {"com/mojang/brigadier/1.0.18/brigadier-1.0.18.jar", "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1.jar"};
        instance.gameArguments = {"--username", "${auth_player_name}"};
        instance.jvmArguments = {"-cp", "${classpath}"};
        repository.updateInstanceDetails(instance);

        repository.setInstanceReady("vanilla");
        auto stored = repository.getInstance("vanilla");
        REQUIRE(stored.has_value());
        CHECK(stored->state == InstanceState::Ready);
        CHECK(stored->requiredJavaVersion == 17);
        CHECK(stored->mainClass == "net.minecraft.client.main.Main");
        CHECK(stored->classPath == instance.classPath);
        CHECK(stored->gameArguments == instance.gameArguments);
        CHECK(stored->jvmArguments == instance.jvmArguments);

        // a ready record can no longer be rewritten
        CHECK_THROWS_AS(repository.updateInstanceDetails(instance), LauncherError);
    }

    SUBCASE("missing records cannot turn ready") {
        CHECK_THROWS_AS(repository.setInstanceReady("other"), LauncherError);
    }

    SUBCASE("delete") {
        CHECK(repository.deleteInstance("vanilla"));
        CHECK_FALSE(repository.deleteInstance("vanilla"));
        CHECK(repository.getAllInstances().empty());
    }
}

TEST_CASE("listing instances") {
    KilnTest::TempDir dir;
    Repository repository(dir / "kiln.sqlite");
    repository.insertInstallingInstance(installingRecord("b"));
    repository.insertInstallingInstance(installingRecord("a"));

    auto instances = repository.getAllInstances();
    REQUIRE(instances.size() == 2);
    CHECK(instances[0].id == "a");
    CHECK(instances[1].id == "b");
}

TEST_CASE("the unknown state cannot be written") {
    CHECK_THROWS_AS(instance_state_to_string(InstanceState::Unknown), std::invalid_argument);
    CHECK(instance_state_from_string("garbage") == InstanceState::Unknown);
    CHECK(instance_state_from_string("READY") == InstanceState::Ready);
}

TEST_CASE("accounts upsert by id") {
    KilnTest::TempDir dir;
    Repository repository(dir / "kiln.sqlite");

    Account account;
    account.id = "acc-1";
    account.username = "Steve";
    account.minecraftUserId = "069a79f4-44e9-4726-a5be-fca90e38aaf5";
    account.xboxAccountState = XboxAccountState::Ok;
    account.hasMinecraftLicense = true;
    account.accessToken = "token-1";
    account.expiresAt = 1700000000;
    repository.upsertAccount(account);

    account.accessToken = "token-2";
    repository.upsertAccount(account);

    auto accounts = repository.getAllAccounts();
    REQUIRE(accounts.size() == 1);
    CHECK(accounts[0].username == "Steve");
    CHECK(accounts[0].accessToken == "token-2");
    CHECK(accounts[0].xboxAccountState == XboxAccountState::Ok);
    CHECK(accounts[0].hasMinecraftLicense);
    CHECK(accounts[0].expiresAt == 1700000000);
}

TEST_CASE("offline accounts") {
    auto account = Account::offline("Alex");
    CHECK(account.username == "Alex");
    CHECK(account.minecraftUserId == "00000000-0000-0000-0000-000000000000");
    CHECK(account.accessToken == "0");
}
