// include/Kiln/Types/Version.hpp
#ifndef KILN_VERSION_HPP
#define KILN_VERSION_HPP

#include <Kiln/Types/AssetIndex.hpp>
#include <Kiln/Types/JavaVersion.hpp>
#include <Kiln/Types/Library.hpp>
#include <Kiln/Types/VersionDownloads.hpp>
#include <Kiln/Types/VersionArguments.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kiln {

    // Per-version detail document
    struct Version {
        std::optional<AssetIndex> assetIndex;
        std::string assets;
        std::optional<unsigned int> complianceLevel;
        std::map<DownloadKind, DownloadDetails> downloads;
        std::string id;
        std::optional<JavaVersion> javaVersion;
        std::vector<Library> libraries;
        std::string mainClass;
        std::optional<std::string> minecraftArguments; // For old versions
        std::string releaseTime;
        std::string time;
        std::string type; // e.g. "snapshot", "release", "old_alpha"

        // Either parsed from "arguments" or derived from "minecraftArguments"
        Arguments arguments;

        unsigned int requiredJavaMajorVersion() const {
            return javaVersion ? javaVersion->majorVersion : DEFAULT_JAVA_MAJOR_VERSION;
        }

        static Version from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_VERSION_HPP
