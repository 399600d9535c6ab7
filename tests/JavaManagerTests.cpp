// tests/JavaManagerTests.cpp
#include <doctest/doctest.h>

#include "TestSupport.hpp"
#include <Kiln/Errors.hpp>
#include <Kiln/JavaManager.hpp>
#include <Kiln/Utils/Crypto.hpp>

#include <nlohmann/json.hpp>

#ifndef _WIN32
#include <boost/process.hpp>
#endif

#include <memory>
#include <stdexcept>
#include <vector>

using namespace Kiln;
using KilnTest::FakeHttpManager;

namespace {

constexpr const char* API_BASE = "https://api.test/v3";
constexpr const char* PACKAGE_URL = "https://github.test/temurin17/OpenJDK17U-jdk.tar.gz";

std::string temurinResponse(const std::string& link, const std::string& name, const std::string& checksum,
                            const std::string& imageType = "jdk") {
    nlohmann::json build = {
        {"binary", {
            {"image_type", imageType},
            {"package", {{"link", link}, {"name", name}, {"checksum", checksum}, {"size", 1234}}}
        }}
    };
    return nlohmann::json::array({build}).dump();
}

struct JavaManagerFixture {
    KilnTest::TempDir dir;
    Config config{dir.path()};
    std::shared_ptr<FakeHttpManager> http = std::make_shared<FakeHttpManager>();
    std::shared_ptr<FileDownloader> downloader;
    std::unique_ptr<JavaManager> java;

    JavaManagerFixture() {
        config.settings.runtimeApiBase = API_BASE;
        downloader = std::make_shared<FileDownloader>(http, 2);
        java = std::make_unique<JavaManager>(config, downloader);
    }

    static std::string latestUrl(unsigned major) {
        return std::string(API_BASE) + "/assets/latest/" + std::to_string(major) + "/hotspot";
    }
};

} // namespace

TEST_CASE_FIXTURE(JavaManagerFixture, "Temurin lookup sends the platform query and reads the first build") {
    http->serve(latestUrl(17), temurinResponse(PACKAGE_URL, "OpenJDK17U-jdk.tar.gz", std::string(64, 'a')));

    JavaDownloader lookup(http, std::string(API_BASE) + "/");
    JavaPackage package = lookup.resolveTemurinPackage(17, "linux", "x64");

    CHECK(package.link == PACKAGE_URL);
    CHECK(package.name == "OpenJDK17U-jdk.tar.gz");
    CHECK(package.size == 1234);
    const std::string query = http->lastParameters();
    CHECK(query.find("architecture=x64") != std::string::npos);
    CHECK(query.find("os=linux") != std::string::npos);
    CHECK(query.find("image_type=jdk") != std::string::npos);
    CHECK(query.find("vendor=eclipse") != std::string::npos);
}

TEST_CASE_FIXTURE(JavaManagerFixture, "missing Temurin builds are an unsupported platform") {
    JavaDownloader lookup(http, API_BASE);

    SUBCASE("404 from the API") {
        CHECK_THROWS_AS(lookup.resolveTemurinPackage(17, "linux", "x64"), UnsupportedPlatformError);
    }
    SUBCASE("empty build list") {
        http->serve(latestUrl(17), "[]");
        CHECK_THROWS_AS(lookup.resolveTemurinPackage(17, "linux", "x64"), UnsupportedPlatformError);
    }
    SUBCASE("unknown platform") {
        CHECK_THROWS_AS(lookup.resolveTemurinPackage(17, "", "x64"), UnsupportedPlatformError);
        CHECK(http->totalRequests() == 0);
    }
}

TEST_CASE_FIXTURE(JavaManagerFixture, "a JRE build is rejected") {
    http->serve(latestUrl(17), temurinResponse(PACKAGE_URL, "jre.tar.gz", std::string(64, 'a'), "jre"));
    JavaDownloader lookup(http, API_BASE);
    CHECK_THROWS_AS(lookup.resolveTemurinPackage(17, "linux", "x64"), LauncherError);
}

TEST_CASE("java executables are found in plain and macOS bundle layouts") {
    KilnTest::TempDir dir;
#ifdef _WIN32
    const char* exe = "java.exe";
#else
    const char* exe = "java";
#endif
    CHECK_FALSE(JavaManager::findJavaExecutable(dir.path()).has_value());

    KilnTest::writeFile(dir / "bundle" / "Contents" / "Home" / "bin" / exe, "#!");
    auto bundled = JavaManager::findJavaExecutable(dir / "bundle");
    REQUIRE(bundled.has_value());
    CHECK(bundled->filename() == exe);

    KilnTest::writeFile(dir / "plain" / "bin" / exe, "#!");
    auto plain = JavaManager::findJavaExecutable(dir / "plain");
    REQUIRE(plain.has_value());
    CHECK(*plain == dir / "plain" / "bin" / exe);
}

TEST_CASE_FIXTURE(JavaManagerFixture, "an existing installation is reused without network access") {
#ifdef _WIN32
    KilnTest::writeFile(java->getJavaInstallationPath(17) / "bin" / "java.exe", "#!");
#else
    KilnTest::writeFile(java->getJavaInstallationPath(17) / "bin" / "java", "#!");
#endif
    std::vector<double> reports;
    java->installJava(17, [&](double p) { reports.push_back(p); });

    CHECK(http->totalRequests() == 0);
    REQUIRE(reports.size() == 1);
    CHECK(reports.back() == doctest::Approx(1.0));
    CHECK(java->getJavaExecutablePath(17).has_value());
}

TEST_CASE_FIXTURE(JavaManagerFixture, "installation paths are keyed by major version and platform") {
    auto path17 = java->getJavaInstallationPath(17);
    CHECK(path17.parent_path() == config.javaRuntimesDir);
    CHECK(path17.filename().string().rfind("17-", 0) == 0);
    CHECK(path17 != java->getJavaInstallationPath(21));
    CHECK_FALSE(java->getJavaExecutablePath(21).has_value());
}

TEST_CASE_FIXTURE(JavaManagerFixture, "majors below 8 are refused") {
    CHECK_THROWS_AS(java->installJava(7), std::invalid_argument);
    CHECK(http->totalRequests() == 0);
}

TEST_CASE_FIXTURE(JavaManagerFixture, "a package with the wrong checksum is not installed") {
    http->serve(latestUrl(17), temurinResponse(PACKAGE_URL, "OpenJDK17U-jdk.tar.gz", std::string(64, '0')));
    http->serve(PACKAGE_URL, "not the archive you were looking for");

    CHECK_THROWS_AS(java->installJava(17), IntegrityError);
    CHECK_FALSE(java->getJavaExecutablePath(17).has_value());
}

TEST_CASE_FIXTURE(JavaManagerFixture, "an archive of an unknown format is an extraction error") {
    const std::string body = "rar bytes";
    http->serve(latestUrl(17), temurinResponse("https://github.test/jdk.rar", "jdk.rar",
                                               Utils::calculateHash(body, Utils::HashAlgorithm::SHA256)));
    http->serve("https://github.test/jdk.rar", body);

    CHECK_THROWS_AS(java->installJava(17), ExtractionError);
}

#ifndef _WIN32
TEST_CASE_FIXTURE(JavaManagerFixture, "a tarball is downloaded, verified, extracted and flattened") {
    namespace bp = boost::process;
    KilnTest::TempDir staging("kiln_jdk");
    KilnTest::writeFile(staging / "jdk-17.0.9+9" / "bin" / "java", "#!/bin/sh\n");
    KilnTest::writeFile(staging / "jdk-17.0.9+9" / "release", "JAVA_VERSION=\"17.0.9\"\n");

    const auto archive = staging / "jdk.tar.gz";
    int exitCode = bp::system(bp::search_path("tar"), "-czf", archive.string(), "-C", staging.path().string(),
                              "jdk-17.0.9+9");
    REQUIRE(exitCode == 0);
    const std::string bytes = KilnTest::readFile(archive);

    http->serve(latestUrl(17), temurinResponse(PACKAGE_URL, "OpenJDK17U-jdk.tar.gz",
                                               Utils::calculateHash(bytes, Utils::HashAlgorithm::SHA256)));
    http->serve(PACKAGE_URL, bytes);

    std::vector<double> reports;
    java->installJava(17, [&](double p) { reports.push_back(p); });

    auto executable = java->getJavaExecutablePath(17);
    REQUIRE(executable.has_value());
    CHECK(*executable == java->getJavaInstallationPath(17) / "bin" / "java");
    CHECK(std::filesystem::exists(java->getJavaInstallationPath(17) / "release"));
    CHECK_FALSE(std::filesystem::exists(config.javaRuntimesDir / "_downloads" /
                                        java->getJavaInstallationPath(17).filename()));

    REQUIRE_FALSE(reports.empty());
    CHECK(reports.back() == doctest::Approx(1.0));
    for (size_t i = 1; i < reports.size(); ++i) {
        CHECK(reports[i] >= reports[i - 1]);
    }

    // Second call finds the extracted runtime
    const int before = http->totalRequests();
    java->installJava(17);
    CHECK(http->totalRequests() == before);
}

TEST_CASE_FIXTURE(JavaManagerFixture, "a zip package keeps its layout and is flattened") {
    KilnTest::TempDir staging("kiln_jdk_zip");
    const auto root = staging / "content";
    KilnTest::writeFile(root / "jdk-17.0.9+9" / "bin" / "java", "#!/bin/sh\n");
    KilnTest::writeFile(root / "jdk-17.0.9+9" / "lib" / "security" / "cacerts", "certs");
    const std::string bytes = KilnTest::zipDirectory(root, staging / "jdk.zip");
    REQUIRE_FALSE(bytes.empty());

    const std::string zipUrl = "https://github.test/temurin17/OpenJDK17U-jdk_x64_windows_hotspot.zip";
    http->serve(latestUrl(17), temurinResponse(zipUrl, "OpenJDK17U-jdk_x64_windows_hotspot.zip",
                                               Utils::calculateHash(bytes, Utils::HashAlgorithm::SHA256)));
    http->serve(zipUrl, bytes);

    java->installJava(17);

    const auto installation = java->getJavaInstallationPath(17);
    CHECK(java->getJavaExecutablePath(17) == installation / "bin" / "java");
    CHECK(KilnTest::readFile(installation / "lib" / "security" / "cacerts") == "certs");
    CHECK_FALSE(std::filesystem::exists(installation / "jdk-17.0.9+9"));
}
#endif
