// include/Kiln/InstanceManager.hpp
#ifndef KILN_INSTANCE_MANAGER_HPP
#define KILN_INSTANCE_MANAGER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/InstallProgressReporter.hpp>
#include <Kiln/JavaManager.hpp>
#include <Kiln/Repository.hpp>
#include <Kiln/Types/Instance.hpp>
#include <Kiln/Types/VersionManifest.hpp>
#include <Kiln/Utils/Cancellation.hpp>
#include <Kiln/Utils/WorkerPool.hpp>
#include <Kiln/VersionManager.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Kiln {

    // Ratio in [0, 1] to a gauge value; stays at 99 until the ratio is exactly complete.
    uint32_t progressToPercent(double ratio);

    /**
     * Installs and lists named instances.
     *
     * An install allocates a folder, stores an INSTALLING record, fetches the version's
     * artifacts and its Java runtime in parallel and only then marks the record READY. A
     * failed install leaves the INSTALLING record behind for inspection.
     */
    class InstanceManager {
    public:
        using VersionsListener = std::function<void(const std::vector<VersionInfo>&)>;
        using InstancesListener = std::function<void(const std::vector<Instance>&)>;

        // Versions released before this date are not offered.
        static constexpr const char* RELEASE_CUTOFF = "2020-06-23";

        InstanceManager(const Config& config, std::shared_ptr<Repository> repository,
                        std::shared_ptr<VersionManager> versionManager, std::shared_ptr<JavaManager> javaManager,
                        std::shared_ptr<Utils::WorkerPool> pool);

        std::vector<VersionInfo> refreshAvailableVersions(bool reload, const Utils::CancellationToken& token = {});
        std::vector<VersionInfo> getAvailableVersions() const;

        // Re-reads the store.
        std::vector<Instance> getInstances();

        void addVersionsListener(VersionsListener listener);
        void addInstancesListener(InstancesListener listener);

        /**
         * @param name display name and record id.
         * @throws std::invalid_argument for an empty name.
         * @throws InstanceExistsError when the name is taken or already being installed.
         * @throws TimeoutError once installTimeoutMinutes elapsed.
         * @throws OperationCancelledError when the token is cancelled.
         * @throws LauncherError (and subclasses) for download, integrity and extraction failures.
         */
        Instance createInstance(const VersionInfo& version, const std::string& name,
                                const InstallProgressReporter::Observer& onProgress = nullptr,
                                const Utils::CancellationToken& token = {});

    private:
        const Config& m_config;
        std::shared_ptr<Repository> m_repository;
        std::shared_ptr<VersionManager> m_versionManager;
        std::shared_ptr<JavaManager> m_javaManager;
        std::shared_ptr<Utils::WorkerPool> m_pool;
        std::shared_ptr<spdlog::logger> m_logger;

        mutable std::mutex m_mutex;
        std::vector<VersionInfo> m_availableVersions;
        std::vector<Instance> m_instances;
        std::vector<VersionsListener> m_versionsListeners;
        std::vector<InstancesListener> m_instancesListeners;

        // Names with an install in progress
        std::mutex m_reservationMutex;
        std::set<std::string> m_reservedNames;

        class Reservation;

        std::string allocateFolder(const std::string& name);
        void downloadArtifactsAndJava(const Version& version, unsigned int javaMajor, InstallProgressReporter& reporter,
                                      const Utils::CancellationToken& userToken);
        void refreshInstances();
    };

} // namespace Kiln

#endif // KILN_INSTANCE_MANAGER_HPP
