// tests/ZipFileTests.cpp
#include <doctest/doctest.h>

#include "TestSupport.hpp"
#include <Kiln/Utils/ZipFile.hpp>

#include <algorithm>
#include <string>
#include <vector>

using Kiln::Utils::ZipFile;

TEST_CASE("an unreadable archive reports why") {
    KilnTest::TempDir dir;

    SUBCASE("not a zip") {
        KilnTest::writeFile(dir / "broken.zip", "plain text");
        ZipFile zip(dir / "broken.zip");
        CHECK_FALSE(zip.extractAll(dir / "out"));
        CHECK_FALSE(zip.isOpen());
        CHECK_FALSE(zip.getLastError().empty());
    }
    SUBCASE("missing file") {
        ZipFile zip(dir / "absent.zip");
        CHECK_FALSE(zip.open());
        CHECK_FALSE(zip.getLastError().empty());
    }
}

#ifndef _WIN32
TEST_CASE("archives extract with or without their layout") {
    KilnTest::TempDir dir;
    const auto root = dir / "content";
    KilnTest::writeFile(root / "bin" / "java", "launcher");
    KilnTest::writeFile(root / "lib" / "amd64" / "libjvm.so", "jvm");
    KilnTest::writeFile(root / "release", "JAVA_VERSION=\"17\"\n");
    const std::string bytes = KilnTest::zipDirectory(root, dir / "archive.zip");
    REQUIRE_FALSE(bytes.empty());

    SUBCASE("everything keeps its folder") {
        ZipFile zip(dir / "archive.zip");
        REQUIRE(zip.extractAll(dir / "all"));
        CHECK(zip.isOpen());
        CHECK(KilnTest::readFile(dir / "all" / "bin" / "java") == "launcher");
        CHECK(KilnTest::readFile(dir / "all" / "lib" / "amd64" / "libjvm.so") == "jvm");
        CHECK(std::filesystem::exists(dir / "all" / "release"));
    }
    SUBCASE("a filter picks entries by their stored name") {
        std::vector<std::string> seen;
        ZipFile zip(dir / "archive.zip");
        REQUIRE(zip.extractMatching(dir / "picked", [&](const std::string& name) {
            seen.push_back(name);
            return name.rfind("lib/", 0) == 0;
        }, false));
        CHECK(KilnTest::readFile(dir / "picked" / "lib" / "amd64" / "libjvm.so") == "jvm");
        CHECK_FALSE(std::filesystem::exists(dir / "picked" / "bin"));
        CHECK_FALSE(std::filesystem::exists(dir / "picked" / "release"));
        // Directory entries never reach the filter
        CHECK(std::find(seen.begin(), seen.end(), "lib/") == seen.end());
        CHECK(seen.size() == 3);
    }
}
#endif
