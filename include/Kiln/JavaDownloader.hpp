// include/Kiln/JavaDownloader.hpp
#ifndef KILN_JAVA_DOWNLOADER_HPP
#define KILN_JAVA_DOWNLOADER_HPP

#include <Kiln/HttpManager.hpp>
#include <Kiln/Utils/Cancellation.hpp>

#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Kiln {

    // One downloadable JDK archive
    struct JavaPackage {
        std::string link;
        std::string name;
        std::string checksum; // SHA256
        uint64_t size = 0;
    };

    // Looks up Eclipse Temurin builds through the Adoptium API.
    class JavaDownloader {
    public:
        JavaDownloader(std::shared_ptr<HttpManager> httpManager, std::string apiBase);

        /**
         * @brief Latest JDK package for the major version on the given os/arch (Adoptium names).
         * @throws UnsupportedPlatformError when Adoptium has no such build (404 or an empty list).
         * @throws NetworkError, LauncherError on other failures.
         */
        JavaPackage resolveTemurinPackage(unsigned int majorVersion, const std::string& os, const std::string& arch,
                                          const Utils::CancellationToken& token = {});

    private:
        std::shared_ptr<HttpManager> m_httpManager;
        std::string m_apiBase;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Kiln

#endif // KILN_JAVA_DOWNLOADER_HPP
