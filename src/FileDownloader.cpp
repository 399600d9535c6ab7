// src/FileDownloader.cpp
#include <Kiln/FileDownloader.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Crypto.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>

namespace Kiln {

    namespace {
        void removeQuietly(const std::filesystem::path& path) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    } // namespace

    FileDownloader::FileDownloader(std::shared_ptr<HttpManager> http, size_t maxConcurrentDownloads)
        : m_http(std::move(http)), m_gate(maxConcurrentDownloads) {
        m_logger = Utils::Logger::GetOrCreateLogger("FileDownloader");
    }

    std::string FileDownloader::fileNameFromUrl(const std::string& url) {
        std::string path = url.substr(0, url.find_first_of("?#"));
        auto slash = path.find_last_of('/');
        std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
        if (auto scheme = path.find("://"); scheme != std::string::npos && slash != std::string::npos &&
                                            slash < scheme + 3) {
            name.clear();
        }

        for (char& c : name) {
            auto uc = static_cast<unsigned char>(c);
            bool safe = std::isalnum(uc) || c == '.' || c == '-' || c == '_' || c == '+';
            if (!safe)
                c = '_';
        }
        name.erase(0, name.find_first_not_of('.'));
        return name.empty() ? "download.bin" : name;
    }

    void FileDownloader::transferToTemporary(const std::string& url, const std::filesystem::path& tmpPath,
                                             const ProgressCallback& onProgress, const Utils::CancellationToken& token) {
        const int retries = std::max(m_http->options().retries, 0);
        std::chrono::milliseconds delay(std::max(m_http->options().retryDelayMs, 0));

        for (int attempt = 0;; ++attempt) {
            token.throwIfCancelled();

            cpr::Response response;
            {
                std::ofstream sink(tmpPath, std::ios::binary | std::ios::trunc);
                if (!sink) {
                    throw LauncherError("Failed to open temporary file for writing: " + tmpPath.string());
                }
                response = m_http->Download(sink, cpr::Url{url}, [&](int64_t downloaded, int64_t total) {
                    if (token.isCancelled())
                        return false;
                    if (onProgress && total > 0) {
                        onProgress(std::min(1.0, static_cast<double>(downloaded) / static_cast<double>(total)));
                    }
                    return true;
                });
                sink.flush();
                if (isSuccessStatus(response) && !sink) {
                    sink.close();
                    removeQuietly(tmpPath);
                    throw LauncherError("Failed to write " + tmpPath.string());
                }
            }

            if (isSuccessStatus(response)) {
                return;
            }

            removeQuietly(tmpPath);
            token.throwIfCancelled();

            long status = response.error.code == cpr::ErrorCode::OK ? response.status_code : 0;
            NetworkError error(status == 0 ? "Download of " + url + " failed: " + response.error.message
                                           : "Download of " + url + " returned HTTP " + std::to_string(status),
                               status);
            if (!error.isTransient() || attempt >= retries) {
                throw error;
            }

            m_logger->warn("{}; retry {}/{} in {} ms", error.what(), attempt + 1, retries, delay.count());
            if (!token.sleepFor(delay)) {
                token.throwIfCancelled();
            }
            delay *= 2;
        }
    }

    void FileDownloader::download(const std::string& url, const std::filesystem::path& destination,
                                  const std::optional<std::string>& expectedHash, const ProgressCallback& onProgress,
                                  const Utils::CancellationToken& token) {
        if (expectedHash) {
            // Rejects unsupported lengths before any slot is taken
            Utils::hashAlgorithmForHex(*expectedHash);
        }

        Utils::AdmissionGate::Slot slot(m_gate, token);

        std::error_code ec;
        if (expectedHash && std::filesystem::exists(destination, ec) && Utils::verifyFileHash(destination, *expectedHash)) {
            m_logger->trace("{} is up to date", destination.string());
            if (onProgress)
                onProgress(1.0);
            return;
        }

        removeQuietly(destination);
        if (destination.has_parent_path()) {
            std::filesystem::create_directories(destination.parent_path(), ec);
            if (ec) {
                throw LauncherError("Failed to create directory " + destination.parent_path().string() + ": " +
                                    ec.message());
            }
        }

        std::filesystem::path tmpPath = destination;
        tmpPath += ".tmp";

        // One fresh re-fetch after a hash mismatch
        for (int integrityAttempt = 0;; ++integrityAttempt) {
            transferToTemporary(url, tmpPath, onProgress, token);

            if (!expectedHash || Utils::verifyFileHash(tmpPath, *expectedHash)) {
                break;
            }

            removeQuietly(tmpPath);
            if (integrityAttempt >= 1) {
                m_logger->error("Hash mismatch for {} after re-fetch, expected {}", url, *expectedHash);
                throw IntegrityError("Hash mismatch for " + url + " (expected " + *expectedHash + ")");
            }
            m_logger->warn("Hash mismatch for {}, fetching it again", url);
        }

        std::filesystem::rename(tmpPath, destination, ec);
        if (ec) {
            removeQuietly(tmpPath);
            throw LauncherError("Failed to move " + tmpPath.string() + " to " + destination.string() + ": " +
                                ec.message());
        }

        if (onProgress)
            onProgress(1.0);
        m_logger->trace("Downloaded {} -> {}", url, destination.string());
    }

    std::filesystem::path FileDownloader::downloadToFolder(const std::string& url, const std::filesystem::path& directory,
                                                           const std::optional<std::string>& expectedHash,
                                                           const ProgressCallback& onProgress,
                                                           const Utils::CancellationToken& token) {
        std::filesystem::path destination = directory / fileNameFromUrl(url);
        download(url, destination, expectedHash, onProgress, token);
        return destination;
    }

} // namespace Kiln
