// include/Kiln/Types/VersionManifest.hpp
#ifndef KILN_VERSION_MANIFEST_HPP
#define KILN_VERSION_MANIFEST_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    // One catalog entry
    struct VersionInfo {
        std::string id;
        std::string type;
        std::string url;
        std::string time;
        std::string releaseTime;
        std::string sha1;
        std::optional<unsigned int> complianceLevel;

        static VersionInfo from_json(const json& j);
    };

    struct LatestVersions {
        std::string release;
        std::string snapshot;

        static LatestVersions from_json(const json& j);
    };

    struct VersionManifest {
        LatestVersions latest;
        std::vector<VersionInfo> versions;

        static VersionManifest from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_VERSION_MANIFEST_HPP
