// tests/TestSupport.hpp
#ifndef KILN_TEST_SUPPORT_HPP
#define KILN_TEST_SUPPORT_HPP

#include <Kiln/HttpManager.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <boost/process.hpp>
#endif

namespace KilnTest {

// Unique directory under the system temp folder, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "kiln_test") {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        std::string unique = prefix + "_" + std::to_string(std::time(nullptr)) + "_" + std::to_string(rd()) + "_" +
                             std::to_string(counter++);
        root = std::filesystem::temp_directory_path() / unique;
        std::filesystem::create_directories(root);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path path() const { return root; }
    std::filesystem::path operator/(const std::string& child) const { return root / child; }

private:
    std::filesystem::path root;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

#ifndef _WIN32
// Zips the contents of `root` into `archive` with the system zip tool and returns the archive bytes.
// Entry names are relative to `root`. Empty when zip is missing or fails.
inline std::string zipDirectory(const std::filesystem::path& root, const std::filesystem::path& archive) {
    namespace bp = boost::process;
    const auto zip = bp::search_path("zip");
    if (zip.empty())
        return {};
    int exitCode = bp::system(zip, "-q", "-r", archive.string(), ".", bp::start_dir = root.string(),
                              bp::std_out > bp::null);
    if (exitCode != 0)
        return {};
    return readFile(archive);
}
#endif

// Serves canned bodies by URL and counts requests. Unknown URLs answer 404.
class FakeHttpManager : public Kiln::HttpManager {
public:
    struct Route {
        std::string body;
        long status = 200;
        // Number of leading requests that fail at the transport level
        int transportFailures = 0;
        // Bytes written before a simulated mid-stream disconnect (on failing requests)
        size_t truncateAt = 0;
        // Omit the content length from progress reports
        bool unknownLength = false;
        // Bodies served by successive requests before falling back to `body`
        std::vector<std::string> sequence;
    };

    FakeHttpManager() : Kiln::HttpManager(fastOptions()) {}

    static Kiln::HttpOptions fastOptions() {
        Kiln::HttpOptions options;
        options.retries = 2;
        options.retryDelayMs = 1;
        return options;
    }

    void serve(const std::string& url, std::string body, long status = 200) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Route route;
        route.body = std::move(body);
        route.status = status;
        m_routes[url] = std::move(route);
    }

    void route(const std::string& url, Route route) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_routes[url] = std::move(route);
    }

    int requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_counts.find(url);
        return it == m_counts.end() ? 0 : it->second;
    }

    int totalRequests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        int total = 0;
        for (const auto& [url, count] : m_counts)
            total += count;
        return total;
    }

    // Downloads under `prefix` wait for each other until `target` of them are in flight at once,
    // or until `patience` runs out. The first full house releases every later download.
    void gatherDownloads(const std::string& prefix, size_t target,
                         std::chrono::milliseconds patience = std::chrono::milliseconds(2000)) {
        std::lock_guard<std::mutex> lock(m_gatherMutex);
        m_gatherPrefix = prefix;
        m_gatherTarget = target;
        m_gatherPatience = patience;
        m_gathered = false;
        m_inFlight = 0;
        m_peakInFlight = 0;
    }

    // Most downloads under the gather prefix seen in flight together
    size_t peakInFlight() const {
        std::lock_guard<std::mutex> lock(m_gatherMutex);
        return m_peakInFlight;
    }

    // Last parameters passed to a GET
    std::string lastParameters() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastParameters;
    }

protected:
    cpr::Response executeGet(const cpr::Url& url, const cpr::Parameters& parameters) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastParameters = parameters.GetContent(cpr::CurlHolder());
        int attempt = m_counts[url.str()]++;

        cpr::Response response;
        auto it = m_routes.find(url.str());
        if (it == m_routes.end()) {
            response.status_code = 404;
            return response;
        }
        if (attempt < it->second.transportFailures) {
            response.error.code = cpr::ErrorCode::OPERATION_TIMEDOUT;
            response.error.message = "simulated timeout";
            return response;
        }
        response.status_code = it->second.status;
        response.text = bodyFor(it->second, attempt - it->second.transportFailures);
        return response;
    }

    cpr::Response executeDownload(std::ofstream& sink, const cpr::Url& url, const TransferProgress& progress) override {
        Route route;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            attempt = m_counts[url.str()]++;
            auto it = m_routes.find(url.str());
            if (it == m_routes.end()) {
                cpr::Response response;
                response.status_code = 404;
                return response;
            }
            route = it->second;
        }
        const bool gathering = enterGather(url.str());
        cpr::Response response = serveDownload(sink, route, attempt, progress);
        if (gathering)
            leaveGather();
        return response;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Route> m_routes;
    std::map<std::string, int> m_counts;
    std::string m_lastParameters;

    mutable std::mutex m_gatherMutex;
    std::condition_variable m_gatherCv;
    std::string m_gatherPrefix;
    size_t m_gatherTarget = 0;
    std::chrono::milliseconds m_gatherPatience{0};
    bool m_gathered = false;
    size_t m_inFlight = 0;
    size_t m_peakInFlight = 0;

    bool enterGather(const std::string& url) {
        std::unique_lock<std::mutex> lock(m_gatherMutex);
        if (m_gatherPrefix.empty() || url.rfind(m_gatherPrefix, 0) != 0)
            return false;
        ++m_inFlight;
        m_peakInFlight = std::max(m_peakInFlight, m_inFlight);
        if (m_inFlight >= m_gatherTarget) {
            m_gathered = true;
            m_gatherCv.notify_all();
        }
        m_gatherCv.wait_for(lock, m_gatherPatience, [this]() { return m_gathered; });
        return true;
    }

    void leaveGather() {
        std::lock_guard<std::mutex> lock(m_gatherMutex);
        --m_inFlight;
    }

    static cpr::Response serveDownload(std::ofstream& sink, const Route& route, int attempt,
                                       const TransferProgress& progress) {
        cpr::Response response;
        if (attempt < route.transportFailures) {
            const std::string partial = route.body.substr(0, route.truncateAt);
            sink.write(partial.data(), static_cast<std::streamsize>(partial.size()));
            response.error.code = cpr::ErrorCode::OPERATION_TIMEDOUT;
            response.error.message = "simulated disconnect";
            return response;
        }

        response.status_code = route.status;
        if (route.status < 200 || route.status >= 300) {
            return response;
        }

        const std::string body = bodyFor(route, attempt - route.transportFailures);
        const int64_t total = route.unknownLength ? 0 : static_cast<int64_t>(body.size());
        const size_t chunk = std::max<size_t>(1, body.size() / 4);
        for (size_t offset = 0; offset < body.size(); offset += chunk) {
            size_t n = std::min(chunk, body.size() - offset);
            sink.write(body.data() + offset, static_cast<std::streamsize>(n));
            if (progress && !progress(static_cast<int64_t>(offset + n), total)) {
                response.status_code = 0;
                response.error.code = cpr::ErrorCode::OPERATION_TIMEDOUT;
                response.error.message = "aborted by callback";
                return response;
            }
        }
        response.downloaded_bytes = static_cast<decltype(response.downloaded_bytes)>(body.size());
        return response;
    }

    static std::string bodyFor(const Route& route, int successfulAttempt) {
        if (successfulAttempt >= 0 && static_cast<size_t>(successfulAttempt) < route.sequence.size())
            return route.sequence[static_cast<size_t>(successfulAttempt)];
        return route.body;
    }
};

} // namespace KilnTest

#endif // KILN_TEST_SUPPORT_HPP
