// src/Repository.cpp
#include <Kiln/Repository.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sqlite3.h>

using json = nlohmann::json;

namespace Kiln {

namespace {

    // Finalizes on scope exit. Bind indices are 1-based, column indices 0-based.
    class Statement {
    public:
        Statement(sqlite3* db, const char* sql) : m_db(db) {
            if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
                throw LauncherError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
            }
        }

        ~Statement() { sqlite3_finalize(m_stmt); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind(int index, const std::string& value) {
            check(sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        }

        void bind(int index, int64_t value) { check(sqlite3_bind_int64(m_stmt, index, value)); }

        // true while a row is available
        bool step() {
            int rc = sqlite3_step(m_stmt);
            if (rc == SQLITE_ROW)
                return true;
            if (rc == SQLITE_DONE)
                return false;
            if (sqlite3_extended_errcode(m_db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
                throw InstanceExistsError(std::string("Constraint violation: ") + sqlite3_errmsg(m_db));
            }
            throw LauncherError(std::string("Failed to execute statement: ") + sqlite3_errmsg(m_db));
        }

        std::string text(int column) const {
            const unsigned char* value = sqlite3_column_text(m_stmt, column);
            return value ? reinterpret_cast<const char*>(value) : std::string();
        }

        int64_t integer(int column) const { return sqlite3_column_int64(m_stmt, column); }

    private:
        sqlite3* m_db;
        sqlite3_stmt* m_stmt = nullptr;

        void check(int rc) {
            if (rc != SQLITE_OK) {
                throw LauncherError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(m_db));
            }
        }
    };

    std::string listToJson(const std::vector<std::string>& values) { return json(values).dump(); }

    std::vector<std::string> listFromJson(const std::string& raw) {
        if (raw.empty())
            return {};
        json j = json::parse(raw, nullptr, false);
        if (j.is_discarded() || !j.is_array())
            return {};
        std::vector<std::string> values;
        for (const auto& item : j) {
            if (item.is_string())
                values.push_back(item.get<std::string>());
        }
        return values;
    }

    const char* INSTANCE_COLUMNS =
        "Id, VersionId, State, Type, Folder, RequiredJavaVersion, ClientJarPath, MainClass, AssetIndex, "
        "ClassPath, GameArguments, JvmArguments";

    Instance readInstance(const Statement& stmt) {
        Instance instance;
        instance.id = stmt.text(0);
        instance.versionId = stmt.text(1);
        instance.state = instance_state_from_string(stmt.text(2));
        instance.type = stmt.text(3);
        instance.folder = stmt.text(4);
        instance.requiredJavaVersion = static_cast<unsigned int>(stmt.integer(5));
        instance.clientJarPath = stmt.text(6);
        instance.mainClass = stmt.text(7);
        instance.assetIndex = stmt.text(8);
        instance.classPath = listFromJson(stmt.text(9));
        instance.gameArguments = listFromJson(stmt.text(10));
        instance.jvmArguments = listFromJson(stmt.text(11));
        return instance;
    }

} // namespace

Repository::Repository(const std::filesystem::path& databasePath) {
    m_logger = Utils::Logger::GetOrCreateLogger("Repository");

    int rc = sqlite3_open_v2(databasePath.string().c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw LauncherError("Failed to open database " + databasePath.string() + ": " + message);
    }

    try {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
        exec("PRAGMA foreign_keys=ON");
        sqlite3_busy_timeout(m_db, 5000);
        createSchema();
    } catch (...) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    m_logger->debug("Opened database {}", databasePath.string());
}

Repository::~Repository() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void Repository::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(m_db);
        sqlite3_free(error);
        throw LauncherError("SQL error: " + message);
    }
}

void Repository::createSchema() {
    exec("CREATE TABLE IF NOT EXISTS Accounts ("
         "Id TEXT PRIMARY KEY NOT NULL,"
         "XboxAccountState TEXT NOT NULL,"
         "MinecraftUserId TEXT NOT NULL,"
         "XboxUserId TEXT NOT NULL,"
         "Username TEXT NOT NULL,"
         "HasMinecraftLicense INTEGER NOT NULL,"
         "SkinUrl TEXT,"
         "CapeUrl TEXT,"
         "AccessToken TEXT NOT NULL,"
         "RefreshToken TEXT,"
         "ExpiresAt INTEGER NOT NULL)");
    exec("CREATE TABLE IF NOT EXISTS Instances ("
         "Id TEXT PRIMARY KEY NOT NULL,"
         "VersionId TEXT NOT NULL,"
         "State TEXT NOT NULL,"
         "Type TEXT NOT NULL,"
         "Folder TEXT NOT NULL,"
         "RequiredJavaVersion INTEGER NOT NULL,"
         "ClientJarPath TEXT NOT NULL,"
         "MainClass TEXT NOT NULL,"
         "AssetIndex TEXT NOT NULL,"
         "ClassPath TEXT NOT NULL,"
         "GameArguments TEXT NOT NULL,"
         "JvmArguments TEXT NOT NULL)");
}

std::vector<Account> Repository::getAllAccounts() const {
    std::shared_lock lock(m_mutex);
    Statement stmt(m_db,
                   "SELECT Id, XboxAccountState, MinecraftUserId, XboxUserId, Username, HasMinecraftLicense, "
                   "SkinUrl, CapeUrl, AccessToken, RefreshToken, ExpiresAt FROM Accounts ORDER BY Username");
    std::vector<Account> accounts;
    while (stmt.step()) {
        Account account;
        account.id = stmt.text(0);
        account.xboxAccountState = xbox_account_state_from_string(stmt.text(1));
        account.minecraftUserId = stmt.text(2);
        account.xboxUserId = stmt.text(3);
        account.username = stmt.text(4);
        account.hasMinecraftLicense = stmt.integer(5) != 0;
        account.skinUrl = stmt.text(6);
        account.capeUrl = stmt.text(7);
        account.accessToken = stmt.text(8);
        account.refreshToken = stmt.text(9);
        account.expiresAt = stmt.integer(10);
        accounts.push_back(std::move(account));
    }
    return accounts;
}

void Repository::upsertAccount(const Account& account) {
    std::unique_lock lock(m_mutex);
    Statement stmt(m_db,
                   "INSERT INTO Accounts (Id, XboxAccountState, MinecraftUserId, XboxUserId, Username, "
                   "HasMinecraftLicense, SkinUrl, CapeUrl, AccessToken, RefreshToken, ExpiresAt) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11) "
                   "ON CONFLICT(Id) DO UPDATE SET XboxAccountState=excluded.XboxAccountState, "
                   "MinecraftUserId=excluded.MinecraftUserId, XboxUserId=excluded.XboxUserId, "
                   "Username=excluded.Username, HasMinecraftLicense=excluded.HasMinecraftLicense, "
                   "SkinUrl=excluded.SkinUrl, CapeUrl=excluded.CapeUrl, AccessToken=excluded.AccessToken, "
                   "RefreshToken=excluded.RefreshToken, ExpiresAt=excluded.ExpiresAt");
    stmt.bind(1, account.id);
    stmt.bind(2, xbox_account_state_to_string(account.xboxAccountState));
    stmt.bind(3, account.minecraftUserId);
    stmt.bind(4, account.xboxUserId);
    stmt.bind(5, account.username);
    stmt.bind(6, static_cast<int64_t>(account.hasMinecraftLicense ? 1 : 0));
    stmt.bind(7, account.skinUrl);
    stmt.bind(8, account.capeUrl);
    stmt.bind(9, account.accessToken);
    stmt.bind(10, account.refreshToken);
    stmt.bind(11, account.expiresAt);
    stmt.step();
}

std::vector<Instance> Repository::getAllInstances() const {
    std::shared_lock lock(m_mutex);
    Statement stmt(m_db, (std::string("SELECT ") + INSTANCE_COLUMNS + " FROM Instances ORDER BY Id").c_str());
    std::vector<Instance> instances;
    while (stmt.step()) {
        instances.push_back(readInstance(stmt));
    }
    return instances;
}

std::optional<Instance> Repository::getInstance(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    Statement stmt(m_db, (std::string("SELECT ") + INSTANCE_COLUMNS + " FROM Instances WHERE Id = ?1").c_str());
    stmt.bind(1, id);
    if (!stmt.step())
        return std::nullopt;
    return readInstance(stmt);
}

bool Repository::instanceExists(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    Statement stmt(m_db, "SELECT 1 FROM Instances WHERE Id = ?1");
    stmt.bind(1, id);
    return stmt.step();
}

void Repository::insertInstallingInstance(const Instance& instance) {
    const std::string state = instance_state_to_string(InstanceState::Installing);
    std::unique_lock lock(m_mutex);
    Statement stmt(m_db, (std::string("INSERT INTO Instances (") + INSTANCE_COLUMNS +
                          ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)").c_str());
    stmt.bind(1, instance.id);
    stmt.bind(2, instance.versionId);
    stmt.bind(3, state);
    stmt.bind(4, instance.type);
    stmt.bind(5, instance.folder);
    stmt.bind(6, static_cast<int64_t>(instance.requiredJavaVersion));
    stmt.bind(7, instance.clientJarPath);
    stmt.bind(8, instance.mainClass);
    stmt.bind(9, instance.assetIndex);
    stmt.bind(10, listToJson(instance.classPath));
    stmt.bind(11, listToJson(instance.gameArguments));
    stmt.bind(12, listToJson(instance.jvmArguments));
    stmt.step();
    m_logger->info("Inserted instance '{}' ({}) as {}", instance.id, instance.versionId, state);
}

void Repository::updateInstanceDetails(const Instance& instance) {
    std::unique_lock lock(m_mutex);
    Statement stmt(m_db,
                   "UPDATE Instances SET VersionId=?2, Type=?3, Folder=?4, RequiredJavaVersion=?5, ClientJarPath=?6, "
                   "MainClass=?7, AssetIndex=?8, ClassPath=?9, GameArguments=?10, JvmArguments=?11 "
                   "WHERE Id=?1 AND State='INSTALLING'");
    stmt.bind(1, instance.id);
    stmt.bind(2, instance.versionId);
    stmt.bind(3, instance.type);
    stmt.bind(4, instance.folder);
    stmt.bind(5, static_cast<int64_t>(instance.requiredJavaVersion));
    stmt.bind(6, instance.clientJarPath);
    stmt.bind(7, instance.mainClass);
    stmt.bind(8, instance.assetIndex);
    stmt.bind(9, listToJson(instance.classPath));
    stmt.bind(10, listToJson(instance.gameArguments));
    stmt.bind(11, listToJson(instance.jvmArguments));
    stmt.step();
    if (sqlite3_changes(m_db) == 0) {
        throw LauncherError("Instance '" + instance.id + "' is not being installed");
    }
}

void Repository::setInstanceReady(const std::string& id) {
    const std::string state = instance_state_to_string(InstanceState::Ready);
    std::unique_lock lock(m_mutex);
    Statement stmt(m_db, "UPDATE Instances SET State=?2 WHERE Id=?1");
    stmt.bind(1, id);
    stmt.bind(2, state);
    stmt.step();
    if (sqlite3_changes(m_db) == 0) {
        throw LauncherError("Instance '" + id + "' does not exist");
    }
    m_logger->info("Instance '{}' is {}", id, state);
}

bool Repository::deleteInstance(const std::string& id) {
    std::unique_lock lock(m_mutex);
    Statement stmt(m_db, "DELETE FROM Instances WHERE Id=?1");
    stmt.bind(1, id);
    stmt.step();
    return sqlite3_changes(m_db) > 0;
}

} // namespace Kiln
