// include/Kiln/Types/VersionDownloads.hpp
#ifndef KILN_VERSION_DOWNLOADS_HPP
#define KILN_VERSION_DOWNLOADS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    // Keys of the "downloads" object in a version detail document
    enum class DownloadKind {
        Client,
        Server,
        ClientMappings,
        ServerMappings,
    };

    std::optional<DownloadKind> parseDownloadKind(const std::string& key);
    const char* downloadKindName(DownloadKind kind);

    struct DownloadDetails {
        std::string sha1;
        uint64_t size = 0;
        std::string url;

        static DownloadDetails from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_VERSION_DOWNLOADS_HPP
