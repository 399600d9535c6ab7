// src/JavaDownloader.cpp
#include <Kiln/JavaDownloader.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <nlohmann/json.hpp>

namespace Kiln {

JavaDownloader::JavaDownloader(std::shared_ptr<HttpManager> httpManager, std::string apiBase)
    : m_httpManager(std::move(httpManager)), m_apiBase(std::move(apiBase)) {
    m_logger = Utils::Logger::GetOrCreateLogger("JavaDownloader");
    while (!m_apiBase.empty() && m_apiBase.back() == '/')
        m_apiBase.pop_back();
}

JavaPackage JavaDownloader::resolveTemurinPackage(unsigned int majorVersion, const std::string& os,
                                                  const std::string& arch, const Utils::CancellationToken& token) {
    if (os.empty() || arch.empty()) {
        throw UnsupportedPlatformError("Could not determine the OS/architecture for Eclipse Temurin");
    }

    const std::string apiUrl = m_apiBase + "/assets/latest/" + std::to_string(majorVersion) + "/hotspot";
    cpr::Parameters params = {
        {"architecture", arch},
        {"image_type", "jdk"},
        {"os", os},
        {"vendor", "eclipse"}
    };
    m_logger->info("Adoptium API - Querying: {} (arch={}, os={})", apiUrl, arch, os);

    const std::string unsupported = "Java " + std::to_string(majorVersion) + " for " + os + "-" + arch +
                                    " is not available in Eclipse Temurin. This platform/architecture "
                                    "combination may not be supported.";

    cpr::Response response;
    try {
        response = m_httpManager->Get(cpr::Url{apiUrl}, params, token);
    } catch (const NetworkError& e) {
        if (e.statusCode() == 404) {
            throw UnsupportedPlatformError(unsupported);
        }
        throw;
    }

    nlohmann::json builds;
    try {
        builds = nlohmann::json::parse(response.text);
    } catch (const nlohmann::json::parse_error& e) {
        throw LauncherError(std::string("Adoptium API - Failed to parse response: ") + e.what());
    }

    if (!builds.is_array() || builds.empty()) {
        throw UnsupportedPlatformError(unsupported);
    }

    try {
        const auto& binary = builds.at(0).at("binary");
        const std::string imageType = binary.value("image_type", std::string{});
        if (imageType != "jdk") {
            throw LauncherError("Adoptium API - Expected a JDK binary but found image type '" + imageType + "'");
        }

        const auto& package = binary.at("package");
        JavaPackage result;
        result.link = package.at("link").get<std::string>();
        result.name = package.value("name", std::string{});
        result.checksum = package.at("checksum").get<std::string>();
        result.size = package.value("size", uint64_t{0});

        m_logger->info("Adoptium API - Found {} ({})", result.name, result.link);
        m_logger->debug("Adoptium API - Expected SHA256: {}", result.checksum);
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw LauncherError(std::string("Adoptium API - Response missing required fields: ") + e.what());
    }
}

} // namespace Kiln
