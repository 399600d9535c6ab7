// include/Kiln/Repository.hpp
#ifndef KILN_REPOSITORY_HPP
#define KILN_REPOSITORY_HPP

#include <Kiln/Types/Instance.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <spdlog/logger.h>

struct sqlite3;

namespace Kiln {

    /**
     * SQLite store for accounts and instances. The only writer of persisted records;
     * everything it returns is a copy.
     *
     * Reads share the lock, writes take it exclusively. Failures throw LauncherError
     * carrying the sqlite message.
     */
    class Repository {
    public:
        explicit Repository(const std::filesystem::path& databasePath);
        ~Repository();

        Repository(const Repository&) = delete;
        Repository& operator=(const Repository&) = delete;

        std::vector<Account> getAllAccounts() const;
        void upsertAccount(const Account& account);

        std::vector<Instance> getAllInstances() const;
        std::optional<Instance> getInstance(const std::string& id) const;
        bool instanceExists(const std::string& id) const;

        // The record is stored with state INSTALLING regardless of instance.state.
        // @throws InstanceExistsError when the id is taken.
        void insertInstallingInstance(const Instance& instance);

        // Replaces the resolved fields; only allowed while the row is INSTALLING.
        // @throws LauncherError when no INSTALLING row with that id exists.
        void updateInstanceDetails(const Instance& instance);

        // @throws LauncherError when the row is missing.
        void setInstanceReady(const std::string& id);

        // Returns false when nothing was deleted.
        bool deleteInstance(const std::string& id);

    private:
        sqlite3* m_db = nullptr;
        mutable std::shared_mutex m_mutex;
        std::shared_ptr<spdlog::logger> m_logger;

        void exec(const char* sql);
        void createSchema();
    };

} // namespace Kiln

#endif // KILN_REPOSITORY_HPP
