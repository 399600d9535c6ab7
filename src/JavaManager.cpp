// src/JavaManager.cpp
#include <Kiln/JavaManager.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/OS.hpp>
#include <Kiln/Utils/ZipFile.hpp>

#include <boost/process.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace Kiln {

namespace bp = boost::process;

namespace {
    bool endsWith(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
} // namespace

JavaManager::JavaManager(const Config& config, std::shared_ptr<FileDownloader> downloader)
    : m_config(config),
      m_downloader(downloader),
      m_javaDownloader(downloader->sharedHttp(), config.settings.runtimeApiBase) {
    m_logger = Utils::Logger::GetOrCreateLogger("JavaManager");
    m_os = Utils::getOSStringForAdoptium(Utils::getCurrentOS());
    m_arch = Utils::getArchStringForAdoptium(Utils::getCurrentArch());
}

std::filesystem::path JavaManager::getJavaInstallationPath(unsigned int majorVersion) const {
    std::string os = m_os.empty() ? "unknown" : m_os;
    std::string arch = m_arch.empty() ? "unknown" : m_arch;
    return m_config.javaRuntimesDir / (std::to_string(majorVersion) + "-" + os + "-" + arch);
}

std::optional<std::filesystem::path> JavaManager::findJavaExecutable(const std::filesystem::path& installationPath) {
#ifdef _WIN32
    const char* executableName = "java.exe";
#else
    const char* executableName = "java";
#endif
    std::error_code ec;
    for (const auto& candidate : {installationPath / "bin" / executableName,
                                  installationPath / "Contents" / "Home" / "bin" / executableName}) {
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool JavaManager::isJavaInstallationValid(const std::filesystem::path& installationPath) const {
    return findJavaExecutable(installationPath).has_value();
}

std::optional<std::filesystem::path> JavaManager::getJavaExecutablePath(unsigned int majorVersion) const {
    return findJavaExecutable(getJavaInstallationPath(majorVersion));
}

void JavaManager::installJava(unsigned int majorVersion, const ProgressCallback& progress,
                              const Utils::CancellationToken& token) {
    if (majorVersion < MIN_JAVA_VERSION) {
        throw std::invalid_argument("Only Java " + std::to_string(MIN_JAVA_VERSION) + " and above are supported, wanted " +
                                    std::to_string(majorVersion));
    }

    m_logger->info("Installing Java {} (Eclipse Temurin)", majorVersion);
    const std::filesystem::path installationPath = getJavaInstallationPath(majorVersion);
    if (isJavaInstallationValid(installationPath)) {
        m_logger->info("Java {} already installed at {}", majorVersion, installationPath.string());
        if (progress)
            progress(1.0);
        return;
    }

    JavaPackage package = m_javaDownloader.resolveTemurinPackage(majorVersion, m_os, m_arch, token);

    const std::filesystem::path downloadDir =
        m_config.javaRuntimesDir / "_downloads" / installationPath.filename();
    std::filesystem::path archivePath = downloadDir / (package.name.empty()
                                                           ? FileDownloader::fileNameFromUrl(package.link)
                                                           : package.name);

    m_downloader->download(package.link, archivePath, package.checksum, [&](double p) {
        if (progress)
            progress(p * 0.95);
    }, token);

    token.throwIfCancelled();
    extractJavaArchive(archivePath, installationPath);
    if (progress)
        progress(0.98);

    std::error_code ec;
    std::filesystem::remove_all(downloadDir, ec);
    if (ec) {
        m_logger->warn("Problem deleting temporary Java folder '{}': {}", downloadDir.string(), ec.message());
    }

    if (!isJavaInstallationValid(installationPath)) {
        throw ExtractionError("Java " + std::to_string(majorVersion) + " archive did not contain an executable at " +
                              installationPath.string());
    }

    m_logger->info("Successfully installed Java {} to {}", majorVersion, installationPath.string());
    if (progress)
        progress(1.0);
}

void JavaManager::extractJavaArchive(const std::filesystem::path& archivePath,
                                     const std::filesystem::path& installationPath) {
    m_logger->info("Extracting {} to {}", archivePath.string(), installationPath.string());
    std::error_code ec;
    if (std::filesystem::exists(installationPath, ec)) {
        std::filesystem::remove_all(installationPath, ec);
    }
    std::filesystem::create_directories(installationPath, ec);
    if (ec) {
        throw ExtractionError("Failed to create " + installationPath.string() + ": " + ec.message());
    }

    const std::string name = toLower(archivePath.filename().string());
    if (endsWith(name, ".zip")) {
        Utils::ZipFile zip(archivePath);
        if (!zip.extractAll(installationPath)) {
            throw ExtractionError("Failed to extract " + archivePath.filename().string() + ": " + zip.getLastError());
        }
    } else if (endsWith(name, ".tar.gz") || endsWith(name, ".tgz")) {
        extractTarGz(archivePath, installationPath);
    } else {
        throw ExtractionError("Unsupported archive format: " + archivePath.filename().string());
    }

    flattenSingleSubdirectory(installationPath);
}

void JavaManager::extractTarGz(const std::filesystem::path& archivePath, const std::filesystem::path& extractionDir) {
    auto tar = bp::search_path("tar");
    if (tar.empty()) {
        throw ExtractionError("tar is required to extract " + archivePath.filename().string() + " but was not found");
    }

    try {
        bp::ipstream errStream;
        bp::child c(tar,
                    bp::args({std::string("-xzf"), archivePath.string(), std::string("-C"), extractionDir.string()}),
                    bp::std_out > bp::null,
                    bp::std_err > errStream);

        std::string errors;
        std::string line;
        while (std::getline(errStream, line)) {
            errors += line + "\n";
        }
        c.wait();

        if (c.exit_code() != 0) {
            throw ExtractionError("tar extraction failed with exit code " + std::to_string(c.exit_code()) + ": " + errors);
        }
    } catch (const bp::process_error& e) {
        throw ExtractionError(std::string("Failed to run tar: ") + e.what());
    }
}

// Temurin archives wrap the JDK in one top-level folder
void JavaManager::flattenSingleSubdirectory(const std::filesystem::path& installationPath) {
    std::vector<std::filesystem::path> subdirs;
    for (const auto& entry : std::filesystem::directory_iterator(installationPath)) {
        if (entry.is_directory()) {
            subdirs.push_back(entry.path());
        }
    }
    if (subdirs.size() != 1) {
        return;
    }

    std::filesystem::path moveDir = installationPath;
    moveDir += "_move";
    std::error_code ec;
    std::filesystem::remove_all(moveDir, ec);
    std::filesystem::rename(subdirs[0], moveDir);

    for (const auto& entry : std::filesystem::directory_iterator(moveDir)) {
        std::filesystem::path dest = installationPath / entry.path().filename();
        if (std::filesystem::exists(dest)) {
            std::filesystem::remove_all(dest);
        }
        std::filesystem::rename(entry.path(), dest);
    }
    std::filesystem::remove_all(moveDir);
    m_logger->debug("Flattened {} into {}", subdirs[0].filename().string(), installationPath.string());
}

} // namespace Kiln
