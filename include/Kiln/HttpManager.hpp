// include/Kiln/HttpManager.hpp
#ifndef KILN_HTTP_MANAGER_HPP
#define KILN_HTTP_MANAGER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/Utils/Cancellation.hpp>

#include <cpr/cpr.h>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Kiln {

    struct HttpOptions {
        std::string userAgent = std::string("kiln/") + KILN_VERSION;
        int retries = 3;
        int retryDelayMs = 2000;
        int timeoutSeconds = 15;
        int connectTimeoutSeconds = 10;

        static HttpOptions from_settings(const Settings& settings);
    };

    class HttpManager {
    public:
        // (bytesDownloaded, totalBytes); total is 0 when the server sent no length. Return false to abort.
        using TransferProgress = std::function<bool(int64_t downloaded, int64_t total)>;

        explicit HttpManager(HttpOptions options = {});
        virtual ~HttpManager();

        HttpManager(const HttpManager&) = delete;
        HttpManager& operator=(const HttpManager&) = delete;

        // GET with retries on transient failures. Throws NetworkError once retries are exhausted
        // or the status is not retryable.
        cpr::Response Get(const cpr::Url& url, const cpr::Parameters& parameters = {},
                          const Utils::CancellationToken& token = {});

        // Single attempt. Status and transport errors are reported in the response.
        cpr::Response Download(std::ofstream& sink, const cpr::Url& url, const TransferProgress& progress = nullptr);

        const HttpOptions& options() const { return m_options; }

    protected:
        virtual cpr::Response executeGet(const cpr::Url& url, const cpr::Parameters& parameters);
        virtual cpr::Response executeDownload(std::ofstream& sink, const cpr::Url& url, const TransferProgress& progress);

        std::shared_ptr<spdlog::logger> m_logger;

    private:
        HttpOptions m_options;

        cpr::Session CreateSession() const;
    };

    bool isSuccessStatus(const cpr::Response& response);

} // namespace Kiln

#endif // KILN_HTTP_MANAGER_HPP
