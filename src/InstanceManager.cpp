// src/InstanceManager.cpp
#include <Kiln/InstanceManager.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/PathUtils.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <stdexcept>

namespace Kiln {

uint32_t progressToPercent(double ratio) {
    if (!(ratio > 0.0))
        return 0;
    if (ratio >= 1.0)
        return 100;
    return std::min<uint32_t>(static_cast<uint32_t>(std::floor(ratio * 100.0)), 99);
}

// Holds a name in the reservation table for the lifetime of one install.
class InstanceManager::Reservation {
public:
    Reservation(InstanceManager& owner, const std::string& name) : m_owner(owner), m_name(name) {
        std::lock_guard<std::mutex> lock(m_owner.m_reservationMutex);
        if (!m_owner.m_reservedNames.insert(m_name).second) {
            throw InstanceExistsError("Instance '" + m_name + "' is already being installed");
        }
    }

    ~Reservation() {
        std::lock_guard<std::mutex> lock(m_owner.m_reservationMutex);
        m_owner.m_reservedNames.erase(m_name);
    }

    Reservation(const Reservation&) = delete;
    Reservation& operator=(const Reservation&) = delete;

private:
    InstanceManager& m_owner;
    std::string m_name;
};

InstanceManager::InstanceManager(const Config& config, std::shared_ptr<Repository> repository,
                                 std::shared_ptr<VersionManager> versionManager,
                                 std::shared_ptr<JavaManager> javaManager, std::shared_ptr<Utils::WorkerPool> pool)
    : m_config(config),
      m_repository(std::move(repository)),
      m_versionManager(std::move(versionManager)),
      m_javaManager(std::move(javaManager)),
      m_pool(std::move(pool)) {
    m_logger = Utils::Logger::GetOrCreateLogger("InstanceManager");
    if (m_pool->threadCount() < m_config.settings.resolvedWorkerThreads()) {
        m_logger->warn("Worker pool has {} threads, installs need {} to keep every download slot busy",
                       m_pool->threadCount(), m_config.settings.resolvedWorkerThreads());
    }
}

std::vector<VersionInfo> InstanceManager::refreshAvailableVersions(bool reload, const Utils::CancellationToken& token) {
    std::vector<VersionInfo> versions;
    for (auto& info : m_versionManager->getStableVersions(reload, token)) {
        if (info.releaseTime > RELEASE_CUTOFF) {
            versions.push_back(std::move(info));
        }
    }
    m_logger->info("{} versions available", versions.size());

    std::vector<VersionsListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_availableVersions = versions;
        listeners = m_versionsListeners;
    }
    for (const auto& listener : listeners)
        listener(versions);
    return versions;
}

std::vector<VersionInfo> InstanceManager::getAvailableVersions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_availableVersions;
}

std::vector<Instance> InstanceManager::getInstances() {
    refreshInstances();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_instances;
}

void InstanceManager::addVersionsListener(VersionsListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_versionsListeners.push_back(std::move(listener));
}

void InstanceManager::addInstancesListener(InstancesListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_instancesListeners.push_back(std::move(listener));
}

void InstanceManager::refreshInstances() {
    std::vector<Instance> instances = m_repository->getAllInstances();
    std::vector<InstancesListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_instances = instances;
        listeners = m_instancesListeners;
    }
    for (const auto& listener : listeners) {
        try {
            listener(instances);
        } catch (const std::exception& e) {
            m_logger->warn("Instances listener failed: {}", e.what());
        }
    }
}

std::string InstanceManager::allocateFolder(const std::string& name) {
    std::vector<std::string> existing;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(m_config.instancesDir, ec)) {
        if (entry.is_directory())
            existing.push_back(entry.path().filename().string());
    }
    if (ec) {
        throw LauncherError("Cannot list " + m_config.instancesDir.string() + ": " + ec.message());
    }

    std::string folder = Utils::incrementNumberedFolderNameIfExistsAndSanitize(name, existing);
    const std::filesystem::path path = m_config.instanceDir(folder);
    if (!std::filesystem::create_directory(path, ec) || ec) {
        throw InstanceExistsError("Cannot create instance folder " + path.string() +
                                  (ec ? ": " + ec.message() : std::string(": already exists")));
    }
    return folder;
}

Instance InstanceManager::createInstance(const VersionInfo& version, const std::string& name,
                                         const InstallProgressReporter::Observer& onProgress,
                                         const Utils::CancellationToken& token) {
    if (name.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("Instance name must not be empty");
    }

    Reservation reservation(*this, name);
    if (m_repository->instanceExists(name)) {
        throw InstanceExistsError("Instance '" + name + "' already exists");
    }
    token.throwIfCancelled();

    const std::string folder = allocateFolder(name);
    if (m_repository->instanceExists(name)) {
        std::error_code ec;
        std::filesystem::remove(m_config.instanceDir(folder), ec);
        throw InstanceExistsError("Instance '" + name + "' already exists");
    }

    Instance instance;
    instance.id = name;
    instance.versionId = version.id;
    instance.state = InstanceState::Installing;
    instance.type = version.type;
    instance.folder = folder;
    m_repository->insertInstallingInstance(instance);
    m_logger->info("Installing '{}' ({}) into {}", name, version.id, folder);
    refreshInstances();

    InstallProgressReporter reporter(name, onProgress);
    reporter.reportStart();

    try {
        auto [details, descriptor] = m_versionManager->downloadVersion(version, token);

        instance.type = descriptor.type;
        instance.requiredJavaVersion = descriptor.requiredJavaVersion;
        instance.clientJarPath = descriptor.clientJarPath.string();
        instance.mainClass = descriptor.mainClass;
        instance.assetIndex = descriptor.assetIndex;
        instance.classPath = descriptor.classPath;
        instance.gameArguments = descriptor.gameArguments;
        instance.jvmArguments = descriptor.jvmArguments;
        m_repository->updateInstanceDetails(instance);

        downloadArtifactsAndJava(details, descriptor.requiredJavaVersion, reporter, token);

        m_repository->setInstanceReady(name);
        instance.state = InstanceState::Ready;
    } catch (const std::exception& e) {
        m_logger->error("Installation of '{}' failed: {}", name, e.what());
        reporter.dispose();
        refreshInstances();
        throw;
    }

    reporter.reportFinished();
    reporter.flush();
    m_logger->info("Instance '{}' is ready", name);
    refreshInstances();
    return instance;
}

void InstanceManager::downloadArtifactsAndJava(const Version& version, unsigned int javaMajor,
                                               InstallProgressReporter& reporter,
                                               const Utils::CancellationToken& userToken) {
    Utils::CancellationSource timeoutSource;
    if (m_config.settings.installTimeoutMinutes > 0) {
        timeoutSource.cancelAfter(std::chrono::minutes(m_config.settings.installTimeoutMinutes));
    }
    Utils::CancellationSource failureSource;
    Utils::CancellationSource linked =
        Utils::CancellationSource::linked({userToken, timeoutSource.token(), failureSource.token()});
    const Utils::CancellationToken token = linked.token();

    std::future<void> javaTask = m_pool->submit([&]() {
        try {
            m_javaManager->installJava(javaMajor, [&](double ratio) {
                reporter.reportJavaProgress(static_cast<uint32_t>(std::clamp(ratio, 0.0, 1.0) * 100.0));
            }, token);
        } catch (...) {
            failureSource.cancel();
            throw;
        }
    });

    std::exception_ptr artifactsError;
    try {
        m_versionManager->downloadAssetsAndLibraries(
            version,
            [&](double r) { reporter.reportClientProgress(progressToPercent(r)); },
            [&](double r) { reporter.reportAssetsProgress(progressToPercent(r)); },
            [&](double r) { reporter.reportLibrariesProgress(progressToPercent(r)); },
            token);
    } catch (...) {
        artifactsError = std::current_exception();
        failureSource.cancel();
    }

    std::exception_ptr javaError;
    try {
        javaTask.get();
    } catch (...) {
        javaError = std::current_exception();
    }

    // A real failure in either branch wins over the cancellation it caused in the other.
    for (const auto& error : {artifactsError, javaError}) {
        if (!error)
            continue;
        try {
            std::rethrow_exception(error);
        } catch (const OperationCancelledError&) {
        }
    }
    if (artifactsError || javaError) {
        if (timeoutSource.isCancelled() && !userToken.isCancelled()) {
            throw TimeoutError("Installation timed out after " +
                               std::to_string(m_config.settings.installTimeoutMinutes) + " minutes");
        }
        throw OperationCancelledError();
    }
}

} // namespace Kiln
