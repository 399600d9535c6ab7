// src/Types/VersionDownloads.cpp
#include <Kiln/Types/VersionDownloads.hpp>

namespace Kiln {

namespace {
    struct KindName {
        DownloadKind kind;
        const char* key;
    };

    constexpr KindName KIND_NAMES[] = {
        {DownloadKind::Client, "client"},
        {DownloadKind::Server, "server"},
        {DownloadKind::ClientMappings, "client_mappings"},
        {DownloadKind::ServerMappings, "server_mappings"},
    };
} // namespace

std::optional<DownloadKind> parseDownloadKind(const std::string& key) {
    for (const auto& entry : KIND_NAMES) {
        if (key == entry.key)
            return entry.kind;
    }
    return std::nullopt;
}

const char* downloadKindName(DownloadKind kind) {
    for (const auto& entry : KIND_NAMES) {
        if (entry.kind == kind)
            return entry.key;
    }
    return "unknown";
}

DownloadDetails DownloadDetails::from_json(const json& j) {
    DownloadDetails details;
    details.url = j.at("url").get<std::string>();
    details.sha1 = j.value("sha1", std::string{});
    details.size = j.value("size", uint64_t{0});
    return details;
}

} // namespace Kiln
