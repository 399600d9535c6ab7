// include/Kiln/VersionManager.hpp
#ifndef KILN_VERSION_MANAGER_HPP
#define KILN_VERSION_MANAGER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/FileDownloader.hpp>
#include <Kiln/Rules.hpp>
#include <Kiln/Types/Version.hpp>
#include <Kiln/Types/VersionDescriptor.hpp>
#include <Kiln/Types/VersionManifest.hpp>
#include <Kiln/Utils/Cancellation.hpp>
#include <Kiln/Utils/WorkerPool.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/logger.h>

namespace Kiln {

    /**
     * Version catalog and per-version artifacts.
     *
     * Layout under the data directory follows the official launcher: versions/<id>/<id>.json
     * and <id>.jar, natives extracted to versions/<id>/natives, while assets/ and libraries/
     * are shared by every version.
     */
    class VersionManager {
    public:
        using ProgressCallback = std::function<void(double)>;

        static constexpr const char* MANIFEST_FILENAME = "version_manifest_v2.json";
        static constexpr const char* NATIVES_FOLDER = "natives";

        VersionManager(const Config& config, std::shared_ptr<FileDownloader> downloader,
                       std::shared_ptr<Utils::WorkerPool> pool, PlatformState platform = PlatformState::current());

        // Cached catalog unless reload is set or no readable cache exists; mirrors are tried in order.
        VersionManifest getManifest(bool reload, const Utils::CancellationToken& token = {});

        // Catalog entries with type "release"
        std::vector<VersionInfo> getStableVersions(bool reload, const Utils::CancellationToken& token = {});

        // Fetches and stores the detail document, then resolves it for this platform.
        std::pair<Version, VersionDescriptor> downloadVersion(const VersionInfo& versionInfo,
                                                              const Utils::CancellationToken& token = {});

        // Resolves the stored detail document without touching the network.
        VersionDescriptor getCachedVersionDetails(const std::string& versionId) const;

        // Client jar, assets and libraries as three concurrent streams. The first failure
        // cancels the other streams and is rethrown once they stopped.
        void downloadAssetsAndLibraries(const Version& versionDetails,
                                        const ProgressCallback& clientProgress,
                                        const ProgressCallback& assetsProgress,
                                        const ProgressCallback& librariesProgress,
                                        const Utils::CancellationToken& token = {});

        bool isVersionInstalled(const std::string& versionId) const;

        VersionDescriptor describe(const Version& versionDetails) const;
        std::vector<std::string> createClassPath(const std::vector<Library>& libraries) const;

        std::filesystem::path getInstallationFolder(const std::string& versionId) const;
        std::filesystem::path getClientJsonPath(const std::string& versionId) const;
        std::filesystem::path getClientJarPath(const std::string& versionId) const;
        std::filesystem::path getNativeLibrariesFolder(const std::string& versionId) const;

        const PlatformState& platform() const { return m_platform; }

    private:
        const Config& m_config;
        std::shared_ptr<FileDownloader> m_downloader;
        std::shared_ptr<Utils::WorkerPool> m_pool;
        PlatformState m_platform;
        std::string m_archBitness;
        std::shared_ptr<spdlog::logger> m_logger;

        void downloadClient(const Version& versionDetails, const ProgressCallback& progress,
                            const Utils::CancellationToken& token);
        void downloadAssets(const AssetIndex& assetIndex, const ProgressCallback& progress,
                            const Utils::CancellationToken& token);
        void downloadLibraries(const std::vector<Library>& libraries, const std::filesystem::path& nativesFolder,
                               const ProgressCallback& progress, const Utils::CancellationToken& token);
        void extractNatives(const std::filesystem::path& archive, const std::filesystem::path& nativesFolder,
                            const std::vector<std::string>& exclude);
        std::vector<Library> allowedLibraries(const std::vector<Library>& libraries) const;
    };

    // Native binaries worth extracting from a classifier jar
    bool isNativeLibraryEntry(const std::string& entryName);

} // namespace Kiln

#endif // KILN_VERSION_MANAGER_HPP
