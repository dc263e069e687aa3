#pragma once

#include <neograph/storage/database.h>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace neograph::storage {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
    bool success;
    std::string error;
};

/**
 * @brief Applies versioned schema migrations to a local store
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version (0 when nothing was applied)
     */
    Result<int> getCurrentVersion();

    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations, each in its own transaction
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);

    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Built-in migrations for the SQLite graph store schema
 */
class GraphStoreMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    static Migration createInitialSchema();
    static Migration addConstraintTable();
};

} // namespace neograph::storage
