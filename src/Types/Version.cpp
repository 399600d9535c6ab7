// src/Types/Version.cpp
#include <Kiln/Types/Version.hpp>
#include <Kiln/Utils/Logger.hpp>

namespace Kiln {

Version Version::from_json(const nlohmann::json& j) {
    Version version;
    version.id = j.at("id").get<std::string>();
    version.mainClass = j.at("mainClass").get<std::string>();
    version.type = j.value("type", std::string{});
    version.assets = j.value("assets", std::string{});
    version.releaseTime = j.value("releaseTime", std::string{});
    version.time = j.value("time", std::string{});

    if (auto it = j.find("complianceLevel"); it != j.end() && it->is_number_unsigned())
        version.complianceLevel = it->get<unsigned int>();
    if (auto it = j.find("assetIndex"); it != j.end())
        version.assetIndex = AssetIndex::from_json(*it);
    if (auto it = j.find("javaVersion"); it != j.end())
        version.javaVersion = JavaVersion::from_json(*it);

    if (auto it = j.find("downloads"); it != j.end() && it->is_object()) {
        for (const auto& [key, details] : it->items()) {
            if (auto kind = parseDownloadKind(key)) {
                version.downloads.emplace(*kind, DownloadDetails::from_json(details));
            } else {
                KILN_LOG_DEBUG("Version {} lists an unrecognised download '{}'", version.id, key);
            }
        }
    }

    if (auto it = j.find("libraries"); it != j.end() && it->is_array()) {
        version.libraries.reserve(it->size());
        for (const auto& library : *it)
            version.libraries.push_back(Library::from_json(library));
    }

    if (auto it = j.find("minecraftArguments"); it != j.end() && it->is_string())
        version.minecraftArguments = it->get<std::string>();

    // Documents from before 1.13 only carry the legacy flat string
    if (auto it = j.find("arguments"); it != j.end()) {
        version.arguments = Arguments::from_json(*it);
    } else if (version.minecraftArguments) {
        version.arguments = Arguments::from_legacy(*version.minecraftArguments);
    }

    KILN_LOG_TRACE("Parsed version {} with {} libraries", version.id, version.libraries.size());
    return version;
}

} // namespace Kiln
