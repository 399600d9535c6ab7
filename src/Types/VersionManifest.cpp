// src/Types/VersionManifest.cpp
#include <Kiln/Types/VersionManifest.hpp>

namespace Kiln {

VersionInfo VersionInfo::from_json(const json& j) {
    VersionInfo info;
    info.id = j.at("id").get<std::string>();
    info.type = j.value("type", std::string{});
    info.url = j.at("url").get<std::string>();
    info.time = j.value("time", std::string{});
    info.releaseTime = j.value("releaseTime", std::string{});
    info.sha1 = j.value("sha1", std::string{});
    if (j.contains("complianceLevel")) {
        info.complianceLevel = j.at("complianceLevel").get<unsigned int>();
    }
    return info;
}

LatestVersions LatestVersions::from_json(const json& j) {
    LatestVersions latest;
    latest.release = j.value("release", std::string{});
    latest.snapshot = j.value("snapshot", std::string{});
    return latest;
}

VersionManifest VersionManifest::from_json(const json& j) {
    VersionManifest manifest;
    if (j.contains("latest")) {
        manifest.latest = LatestVersions::from_json(j.at("latest"));
    }
    for (const auto& version_json : j.at("versions")) {
        manifest.versions.push_back(VersionInfo::from_json(version_json));
    }
    return manifest;
}

} // namespace Kiln
