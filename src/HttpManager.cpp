// src/HttpManager.cpp
#include <Kiln/HttpManager.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <algorithm>
#include <chrono>
#include <random>

namespace Kiln {

    namespace {
        // Decorrelated jitter: next = min(cap, uniform(base, previous * 3))
        std::chrono::milliseconds nextBackoff(std::chrono::milliseconds base, std::chrono::milliseconds previous) {
            thread_local std::mt19937 rng{std::random_device{}()};
            const auto cap = std::chrono::milliseconds(30000);
            auto upper = std::max(base.count(), previous.count() * 3);
            std::uniform_int_distribution<long long> dist(base.count(), upper);
            return std::min(cap, std::chrono::milliseconds(dist(rng)));
        }
    } // namespace

    HttpOptions HttpOptions::from_settings(const Settings& settings) {
        HttpOptions options;
        options.userAgent = settings.launcherName + "/" + settings.launcherVersion;
        options.retries = settings.httpRetries;
        options.retryDelayMs = settings.httpRetryDelayMs;
        options.timeoutSeconds = settings.httpTimeoutSeconds;
        options.connectTimeoutSeconds = settings.connectTimeoutSeconds;
        return options;
    }

    bool isSuccessStatus(const cpr::Response& response) {
        return response.error.code == cpr::ErrorCode::OK && response.status_code >= 200 && response.status_code < 300;
    }

    HttpManager::HttpManager(HttpOptions options) : m_options(std::move(options)) {
        m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");
        m_logger->debug("HttpManager initialized (user agent '{}', {} retries).", m_options.userAgent, m_options.retries);
    }

    HttpManager::~HttpManager() = default;

    // One session per request, so concurrent callers never share curl state.
    cpr::Session HttpManager::CreateSession() const {
        cpr::Session session;
        session.SetUserAgent(cpr::UserAgent{m_options.userAgent});
        session.SetConnectTimeout(cpr::ConnectTimeout{std::chrono::seconds(m_options.connectTimeoutSeconds)});
        session.SetRedirect(cpr::Redirect{50L});
        return session;
    }

    cpr::Response HttpManager::executeGet(const cpr::Url& url, const cpr::Parameters& parameters) {
        cpr::Session session = CreateSession();
        session.SetUrl(url);
        session.SetParameters(parameters);
        session.SetTimeout(cpr::Timeout{std::chrono::seconds(m_options.timeoutSeconds)});
        return session.Get();
    }

    cpr::Response HttpManager::executeDownload(std::ofstream& sink, const cpr::Url& url, const TransferProgress& progress) {
        cpr::Session session = CreateSession();
        session.SetUrl(url);
        // No overall timeout for large bodies, but a transfer stalled below 1 B/s for the
        // request timeout is aborted as OPERATION_TIMEDOUT
        session.SetLowSpeed(cpr::LowSpeed{1, std::chrono::seconds(m_options.timeoutSeconds)});
        if (progress) {
            session.SetProgressCallback(cpr::ProgressCallback{
                [&progress](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow, cpr::cpr_off_t,
                            cpr::cpr_off_t, intptr_t) -> bool {
                    return progress(static_cast<int64_t>(downloadNow), static_cast<int64_t>(downloadTotal));
                }});
        }
        return session.Download(sink);
    }

    cpr::Response HttpManager::Get(const cpr::Url& url, const cpr::Parameters& parameters,
                                   const Utils::CancellationToken& token) {
        const std::chrono::milliseconds baseDelay(m_options.retryDelayMs);
        std::chrono::milliseconds delay = baseDelay;

        for (int attempt = 0;; ++attempt) {
            token.throwIfCancelled();
            m_logger->trace("GET: {} (attempt {})", url.str(), attempt + 1);
            cpr::Response response = executeGet(url, parameters);
            if (isSuccessStatus(response)) {
                return response;
            }

            long status = response.error.code == cpr::ErrorCode::OK ? response.status_code : 0;
            NetworkError error(status == 0
                                   ? "GET " + url.str() + " failed: " + response.error.message
                                   : "GET " + url.str() + " returned HTTP " + std::to_string(status),
                               status);

            if (!error.isTransient() || attempt >= m_options.retries) {
                m_logger->error("{}", error.what());
                throw error;
            }

            delay = nextBackoff(baseDelay, delay);
            m_logger->warn("{}; retrying in {} ms", error.what(), delay.count());
            if (!token.sleepFor(delay)) {
                token.throwIfCancelled();
            }
        }
    }

    cpr::Response HttpManager::Download(std::ofstream& sink, const cpr::Url& url, const TransferProgress& progress) {
        m_logger->trace("DOWNLOAD: {}", url.str());
        cpr::Response response = executeDownload(sink, url, progress);

        if (!isSuccessStatus(response)) {
            m_logger->warn("Download failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}", url.str(),
                           response.status_code, response.error.message, static_cast<int>(response.error.code));
        } else {
            m_logger->trace("Download successful for {}. Bytes: {}", url.str(), response.downloaded_bytes);
        }
        return response;
    }

} // namespace Kiln
