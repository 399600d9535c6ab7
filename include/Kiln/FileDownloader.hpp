// include/Kiln/FileDownloader.hpp
#ifndef KILN_FILE_DOWNLOADER_HPP
#define KILN_FILE_DOWNLOADER_HPP

#include <Kiln/HttpManager.hpp>
#include <Kiln/Utils/AdmissionGate.hpp>
#include <Kiln/Utils/Cancellation.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Kiln {

    /**
     * Fetches URLs into files with a bounded number of concurrent transfers.
     *
     * Bytes are streamed into "<destination>.tmp" and renamed over the destination only after
     * the optional hash verified, so a failed call leaves the destination either absent or
     * untouched. A destination that already matches the expected hash is not fetched again.
     */
    class FileDownloader {
    public:
        // Ratio in [0, 1]
        using ProgressCallback = std::function<void(double)>;

        FileDownloader(std::shared_ptr<HttpManager> http, size_t maxConcurrentDownloads);

        /**
         * @param expectedHash SHA1 (40 hex chars) or SHA256 (64 hex chars).
         * @throws std::invalid_argument for any other hash length, before anything is transferred.
         * @throws NetworkError, IntegrityError, OperationCancelledError
         */
        void download(const std::string& url, const std::filesystem::path& destination,
                      const std::optional<std::string>& expectedHash = std::nullopt,
                      const ProgressCallback& onProgress = nullptr,
                      const Utils::CancellationToken& token = {});

        // Stores the file under directory using the last URL path segment as the name.
        std::filesystem::path downloadToFolder(const std::string& url, const std::filesystem::path& directory,
                                               const std::optional<std::string>& expectedHash = std::nullopt,
                                               const ProgressCallback& onProgress = nullptr,
                                               const Utils::CancellationToken& token = {});

        static std::string fileNameFromUrl(const std::string& url);

        HttpManager& http() { return *m_http; }
        std::shared_ptr<HttpManager> sharedHttp() const { return m_http; }
        const Utils::AdmissionGate& gate() const { return m_gate; }

    private:
        std::shared_ptr<HttpManager> m_http;
        Utils::AdmissionGate m_gate;
        std::shared_ptr<spdlog::logger> m_logger;

        // Streams one attempt into tmpPath, retrying transient failures. Throws on final failure.
        void transferToTemporary(const std::string& url, const std::filesystem::path& tmpPath,
                                 const ProgressCallback& onProgress, const Utils::CancellationToken& token);
    };

} // namespace Kiln

#endif // KILN_FILE_DOWNLOADER_HPP
