// include/Kiln/JavaManager.hpp
#ifndef KILN_JAVA_MANAGER_HPP
#define KILN_JAVA_MANAGER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/FileDownloader.hpp>
#include <Kiln/JavaDownloader.hpp>
#include <Kiln/Utils/Cancellation.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Kiln {

    // Eclipse Temurin JDKs installed under <base>/java/<major>-<os>-<arch>
    class JavaManager {
    public:
        using ProgressCallback = std::function<void(double)>;

        static constexpr unsigned int MIN_JAVA_VERSION = 8;

        JavaManager(const Config& config, std::shared_ptr<FileDownloader> downloader);

        /**
         * Installs the JDK unless a valid installation exists. Progress: the download counts
         * for 95%, extraction brings it to 98% and cleanup to 100%.
         *
         * @throws std::invalid_argument for majors below MIN_JAVA_VERSION.
         * @throws UnsupportedPlatformError, NetworkError, IntegrityError, ExtractionError
         */
        void installJava(unsigned int majorVersion, const ProgressCallback& progress = nullptr,
                         const Utils::CancellationToken& token = {});

        std::optional<std::filesystem::path> getJavaExecutablePath(unsigned int majorVersion) const;

        std::filesystem::path getJavaInstallationPath(unsigned int majorVersion) const;
        bool isJavaInstallationValid(const std::filesystem::path& installationPath) const;

        // bin/java, or Contents/Home/bin/java for macOS bundles
        static std::optional<std::filesystem::path> findJavaExecutable(const std::filesystem::path& installationPath);

    private:
        const Config& m_config;
        std::shared_ptr<FileDownloader> m_downloader;
        JavaDownloader m_javaDownloader;
        std::string m_os;
        std::string m_arch;
        std::shared_ptr<spdlog::logger> m_logger;

        void extractJavaArchive(const std::filesystem::path& archivePath, const std::filesystem::path& installationPath);
        void extractTarGz(const std::filesystem::path& archivePath, const std::filesystem::path& extractionDir);
        void flattenSingleSubdirectory(const std::filesystem::path& installationPath);
    };

} // namespace Kiln

#endif // KILN_JAVA_MANAGER_HPP
