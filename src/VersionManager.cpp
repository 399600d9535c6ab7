// src/VersionManager.cpp
#include <Kiln/VersionManager.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/OS.hpp>
#include <Kiln/Utils/ZipFile.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <fstream>
#include <future>
#include <iterator>
#include <mutex>
#include <set>
#include <sstream>
#include <unordered_set>

namespace Kiln {

    namespace {
        std::string readTextFile(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                throw LauncherError("Failed to open " + path.string());
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

        // Written next to the target first, so a crash never leaves a truncated cache.
        void writeTextFileAtomically(const std::filesystem::path& path, const std::string& content) {
            std::filesystem::create_directories(path.parent_path());
            std::filesystem::path tmp = path;
            tmp += ".tmp";
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out || !out.write(content.data(), static_cast<std::streamsize>(content.size()))) {
                    throw LauncherError("Failed to write " + tmp.string());
                }
            }
            std::error_code ec;
            std::filesystem::rename(tmp, path, ec);
            if (ec) {
                std::filesystem::remove(tmp, ec);
                throw LauncherError("Failed to move " + tmp.string() + " to " + path.string());
            }
        }

        bool endsWithIgnoreCase(const std::string& value, const std::string& suffix) {
            if (value.size() < suffix.size())
                return false;
            return std::equal(suffix.rbegin(), suffix.rend(), value.rbegin(), [](unsigned char a, unsigned char b) {
                return std::tolower(a) == std::tolower(b);
            });
        }

        std::optional<std::string> usableSha1(const std::string& sha1) {
            if (sha1.size() == 40)
                return sha1;
            return std::nullopt;
        }

        // Counts finished items of one stream and reports done/total.
        class StreamProgress {
        public:
            StreamProgress(const VersionManager::ProgressCallback& callback, size_t total)
                : m_callback(callback), m_total(total) {}

            void itemDone() {
                size_t done = ++m_done;
                if (m_callback && m_total > 0)
                    m_callback(static_cast<double>(done) / static_cast<double>(m_total));
            }

            void finished() {
                if (m_callback)
                    m_callback(1.0);
            }

        private:
            const VersionManager::ProgressCallback& m_callback;
            const size_t m_total;
            std::atomic<size_t> m_done{0};
        };
    } // namespace

    bool isNativeLibraryEntry(const std::string& entryName) {
        return endsWithIgnoreCase(entryName, ".dll") || endsWithIgnoreCase(entryName, ".so") ||
               endsWithIgnoreCase(entryName, ".dylib") || endsWithIgnoreCase(entryName, ".jnilib");
    }

    VersionManager::VersionManager(const Config& config, std::shared_ptr<FileDownloader> downloader,
                                   std::shared_ptr<Utils::WorkerPool> pool, PlatformState platform)
        : m_config(config), m_downloader(std::move(downloader)), m_pool(std::move(pool)),
          m_platform(std::move(platform)) {
        m_logger = Utils::Logger::GetOrCreateLogger("VersionManager");
        m_archBitness = Utils::getArchBitness(m_platform.archName);
    }

    std::filesystem::path VersionManager::getInstallationFolder(const std::string& versionId) const {
        return m_config.versionDir(versionId);
    }

    std::filesystem::path VersionManager::getClientJsonPath(const std::string& versionId) const {
        return getInstallationFolder(versionId) / (versionId + ".json");
    }

    std::filesystem::path VersionManager::getClientJarPath(const std::string& versionId) const {
        return getInstallationFolder(versionId) / (versionId + ".jar");
    }

    std::filesystem::path VersionManager::getNativeLibrariesFolder(const std::string& versionId) const {
        return getInstallationFolder(versionId) / NATIVES_FOLDER;
    }

    bool VersionManager::isVersionInstalled(const std::string& versionId) const {
        std::error_code ec;
        return std::filesystem::is_regular_file(getClientJarPath(versionId), ec);
    }

    VersionManifest VersionManager::getManifest(bool reload, const Utils::CancellationToken& token) {
        const std::filesystem::path manifestPath = m_config.versionsDir / MANIFEST_FILENAME;

        if (!reload && std::filesystem::exists(manifestPath)) {
            try {
                return VersionManifest::from_json(json::parse(readTextFile(manifestPath)));
            } catch (const std::exception& e) {
                m_logger->warn("Problem loading the version manifest from disk, falling back to the network: {}",
                               e.what());
            }
        }

        std::string lastError = "no manifest URL configured";
        for (const auto& url : m_config.settings.manifestUrls) {
            token.throwIfCancelled();
            try {
                cpr::Response response = m_downloader->http().Get(cpr::Url{url}, {}, token);
                VersionManifest manifest = VersionManifest::from_json(json::parse(response.text));
                writeTextFileAtomically(manifestPath, response.text);
                m_logger->info("Loaded version manifest from {} ({} versions)", url, manifest.versions.size());
                return manifest;
            } catch (const OperationCancelledError&) {
                throw;
            } catch (const std::exception& e) {
                lastError = e.what();
                m_logger->error("Failed to fetch the version manifest from {}: {}", url, e.what());
            }
        }

        throw NetworkError("All manifest URLs failed, last error: " + lastError);
    }

    std::vector<VersionInfo> VersionManager::getStableVersions(bool reload, const Utils::CancellationToken& token) {
        VersionManifest manifest = getManifest(reload, token);
        std::vector<VersionInfo> releases;
        std::copy_if(manifest.versions.begin(), manifest.versions.end(), std::back_inserter(releases),
                     [](const VersionInfo& v) { return v.type == "release"; });
        return releases;
    }

    std::pair<Version, VersionDescriptor> VersionManager::downloadVersion(const VersionInfo& versionInfo,
                                                                          const Utils::CancellationToken& token) {
        m_logger->info("Fetching details of version {}", versionInfo.id);
        const std::filesystem::path jsonPath = getClientJsonPath(versionInfo.id);
        m_downloader->download(versionInfo.url, jsonPath, usableSha1(versionInfo.sha1), nullptr, token);

        Version details;
        try {
            details = Version::from_json(json::parse(readTextFile(jsonPath)));
        } catch (const json::exception& e) {
            throw LauncherError("Failed to parse details of version '" + versionInfo.id + "': " + e.what());
        }
        if (details.id != versionInfo.id) {
            m_logger->warn("Detail document of {} declares id {}", versionInfo.id, details.id);
            details.id = versionInfo.id;
        }

        VersionDescriptor descriptor = describe(details);
        return {std::move(details), std::move(descriptor)};
    }

    VersionDescriptor VersionManager::getCachedVersionDetails(const std::string& versionId) const {
        const std::filesystem::path jsonPath = getClientJsonPath(versionId);
        if (!std::filesystem::exists(jsonPath)) {
            throw LauncherError("Version '" + versionId + "' has no stored details at " + jsonPath.string());
        }
        try {
            Version details = Version::from_json(json::parse(readTextFile(jsonPath)));
            details.id = versionId;
            return describe(details);
        } catch (const json::exception& e) {
            throw LauncherError("Failed to parse stored details of version '" + versionId + "': " + e.what());
        }
    }

    VersionDescriptor VersionManager::describe(const Version& versionDetails) const {
        VersionDescriptor descriptor;
        descriptor.versionId = versionDetails.id;
        descriptor.type = versionDetails.type;
        descriptor.requiredJavaVersion = versionDetails.requiredJavaMajorVersion();
        descriptor.clientJarPath = getClientJarPath(versionDetails.id);
        descriptor.mainClass = versionDetails.mainClass;
        descriptor.installationFolder = getInstallationFolder(versionDetails.id);
        descriptor.librariesFolder = m_config.librariesDir;
        descriptor.nativeLibrariesFolder = getNativeLibrariesFolder(versionDetails.id);
        descriptor.assetsFolder = m_config.assetsDir;
        descriptor.assetIndex = versionDetails.assetIndex ? versionDetails.assetIndex->id : versionDetails.assets;
        descriptor.classPath = createClassPath(versionDetails.libraries);
        descriptor.gameArguments = flattenArguments(versionDetails.arguments.game, m_platform);
        descriptor.jvmArguments = flattenArguments(versionDetails.arguments.jvm, m_platform);
        return descriptor;
    }

    std::vector<Library> VersionManager::allowedLibraries(const std::vector<Library>& libraries) const {
        std::vector<Library> result;
        std::unordered_set<std::string> seen;
        for (const auto& library : libraries) {
            if (isLibraryAllowed(library, m_platform) && seen.insert(library.name).second) {
                result.push_back(library);
            }
        }
        return result;
    }

    std::vector<std::string> VersionManager::createClassPath(const std::vector<Library>& libraries) const {
        std::vector<std::string> classPath;
        for (const auto& library : allowedLibraries(libraries)) {
            if (library.downloads && library.downloads->artifact && !library.downloads->artifact->path.empty()) {
                classPath.push_back(library.downloads->artifact->path);
            }
        }
        return classPath;
    }

    void VersionManager::downloadAssetsAndLibraries(const Version& versionDetails,
                                                    const ProgressCallback& clientProgress,
                                                    const ProgressCallback& assetsProgress,
                                                    const ProgressCallback& librariesProgress,
                                                    const Utils::CancellationToken& token) {
        if (!versionDetails.assetIndex) {
            throw LauncherError("Version '" + versionDetails.id + "' has no asset index");
        }

        auto phase = Utils::CancellationSource::linked({token});
        const Utils::CancellationToken phaseToken = phase.token();
        const std::filesystem::path nativesFolder = getNativeLibrariesFolder(versionDetails.id);

        std::mutex errorMutex;
        std::exception_ptr firstError;
        // Errors caused by our own cancel() always arrive after the failure that triggered it
        auto record = [&](std::exception_ptr error) {
            {
                std::lock_guard<std::mutex> lock(errorMutex);
                if (!firstError)
                    firstError = error;
            }
            phase.cancel();
        };

        std::future<void> assets = m_pool->submit([&]() {
            try {
                downloadAssets(*versionDetails.assetIndex, assetsProgress, phaseToken);
            } catch (...) {
                record(std::current_exception());
            }
        });
        std::future<void> libraries = m_pool->submit([&]() {
            try {
                downloadLibraries(versionDetails.libraries, nativesFolder, librariesProgress, phaseToken);
            } catch (...) {
                record(std::current_exception());
            }
        });

        try {
            downloadClient(versionDetails, clientProgress, phaseToken);
        } catch (...) {
            record(std::current_exception());
        }
        assets.wait();
        libraries.wait();

        if (firstError) {
            std::rethrow_exception(firstError);
        }
        m_logger->info("Artifacts of version {} are complete", versionDetails.id);
    }

    void VersionManager::downloadClient(const Version& versionDetails, const ProgressCallback& progress,
                                        const Utils::CancellationToken& token) {
        auto it = versionDetails.downloads.find(DownloadKind::Client);
        if (it == versionDetails.downloads.end()) {
            throw LauncherError("Version '" + versionDetails.id + "' has no client download");
        }
        m_downloader->download(it->second.url, getClientJarPath(versionDetails.id), usableSha1(it->second.sha1),
                               progress, token);
    }

    void VersionManager::downloadAssets(const AssetIndex& assetIndex, const ProgressCallback& progress,
                                        const Utils::CancellationToken& token) {
        m_logger->info("Downloading asset index {}", assetIndex.url);
        const std::filesystem::path indexPath = m_config.assetIndexesDir() / (assetIndex.id + ".json");
        m_downloader->download(assetIndex.url, indexPath, usableSha1(assetIndex.sha1), nullptr, token);

        AssetIndexFile indexFile;
        try {
            indexFile = AssetIndexFile::from_json(json::parse(readTextFile(indexPath)));
        } catch (const json::exception& e) {
            throw LauncherError("Failed to parse asset index " + indexPath.string() + ": " + e.what());
        }

        // Several logical names can share one object
        std::vector<AssetObject> objects;
        std::set<std::string> seenHashes;
        for (const auto& [name, object] : indexFile.objects) {
            if (object.hash.size() == 40 && seenHashes.insert(object.hash).second) {
                objects.push_back(object);
            } else if (object.hash.size() != 40) {
                m_logger->warn("Skipping asset {} with malformed hash '{}'", name, object.hash);
            }
        }
        m_logger->info("Asset index {} lists {} unique objects", assetIndex.id, objects.size());

        StreamProgress tracker(progress, objects.size());
        const std::string baseUrl = m_config.settings.assetsBaseUrl;
        const std::filesystem::path objectsDir = m_config.assetObjectsDir();

        m_pool->parallelForEach(objects, m_config.settings.maxParallelPerStream, [&](const AssetObject& object) {
            const std::string relative = object.relativePath();
            m_downloader->download(baseUrl + "/" + relative, objectsDir / std::filesystem::u8path(relative),
                                   object.hash, nullptr, token);
            tracker.itemDone();
        }, token);

        tracker.finished();
    }

    void VersionManager::downloadLibraries(const std::vector<Library>& libraries,
                                           const std::filesystem::path& nativesFolder,
                                           const ProgressCallback& progress, const Utils::CancellationToken& token) {
        std::vector<Library> toDownload = allowedLibraries(libraries);
        std::filesystem::create_directories(m_config.librariesDir);
        std::filesystem::create_directories(nativesFolder);

        StreamProgress tracker(progress, toDownload.size());

        m_pool->parallelForEach(toDownload, m_config.settings.maxParallelPerStream, [&](const Library& library) {
            if (!library.downloads) {
                tracker.itemDone();
                return;
            }

            if (const auto& artifact = library.downloads->artifact; artifact && !artifact->url.empty()) {
                m_downloader->download(artifact->url, m_config.librariesDir / std::filesystem::u8path(artifact->path),
                                       usableSha1(artifact->sha1), nullptr, token);
            }

            auto nativeKeyIt = library.natives.find(m_platform.osName);
            if (nativeKeyIt != library.natives.end()) {
                std::string classifier = nativeKeyIt->second;
                if (auto pos = classifier.find("${arch}"); pos != std::string::npos) {
                    classifier.replace(pos, 7, m_archBitness);
                }

                auto classifierIt = library.downloads->classifiers.find(classifier);
                if (classifierIt != library.downloads->classifiers.end()) {
                    const LibraryArtifact& native = classifierIt->second;
                    std::filesystem::path archive =
                        nativesFolder / std::filesystem::u8path(native.path).filename();
                    m_downloader->download(native.url, archive, usableSha1(native.sha1), nullptr, token);

                    std::vector<std::string> exclude;
                    if (library.extract)
                        exclude = library.extract->exclude;
                    extractNatives(archive, nativesFolder, exclude);
                }
            }

            tracker.itemDone();
        }, token);

        tracker.finished();
    }

    void VersionManager::extractNatives(const std::filesystem::path& archive,
                                        const std::filesystem::path& nativesFolder,
                                        const std::vector<std::string>& exclude) {
        bool extracted;
        std::string error;
        {
            Utils::ZipFile zip(archive);
            extracted = zip.extractMatching(nativesFolder, [&](const std::string& entryName) {
                bool excluded = std::any_of(exclude.begin(), exclude.end(), [&](const std::string& prefix) {
                    return entryName.compare(0, prefix.size(), prefix) == 0;
                });
                return !excluded && isNativeLibraryEntry(entryName);
            }, true);
            if (!extracted)
                error = zip.getLastError();
        }

        std::error_code ec;
        std::filesystem::remove(archive, ec);
        if (ec) {
            m_logger->warn("Failed to delete native archive {}: {}", archive.string(), ec.message());
        }

        if (!extracted) {
            throw ExtractionError("Failed to extract natives from " + archive.filename().string() + ": " + error);
        }
    }

} // namespace Kiln
