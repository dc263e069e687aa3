#include <neograph/storage/migration.h>

#include <spdlog/spdlog.h>

namespace neograph::storage {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    int targetVersion = getLatestVersion();

    if (currentVersion >= targetVersion) {
        spdlog::debug("Graph store schema already at version {}", currentVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Failed to record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY version ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);

        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (!migration.upSQL.empty()) {
            auto result = db_.execute(migration.upSQL);
            if (!result)
                return result;
        }
        if (migration.upFunc) {
            return migration.upFunc(db_);
        }
        return {};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();

    auto bindResult = stmt.bindAll(version, name, static_cast<int64_t>(now),
                                   static_cast<int64_t>(duration.count()), success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

std::vector<Migration> GraphStoreMigrations::getAllMigrations() {
    return {createInitialSchema(), addConstraintTable()};
}

Migration GraphStoreMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create graph node and relationship tables";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS graph_nodes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            label TEXT NOT NULL,
            properties TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_graph_nodes_label ON graph_nodes(label);

        CREATE TABLE IF NOT EXISTS graph_relationships (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL,
            src_id INTEGER NOT NULL REFERENCES graph_nodes(id) ON DELETE CASCADE,
            dst_id INTEGER NOT NULL REFERENCES graph_nodes(id) ON DELETE CASCADE,
            properties TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_graph_rel_endpoints
            ON graph_relationships(src_id, dst_id, type);
        CREATE INDEX IF NOT EXISTS idx_graph_rel_type ON graph_relationships(type);
    )";
    return m;
}

Migration GraphStoreMigrations::addConstraintTable() {
    Migration m;
    m.version = 2;
    m.name = "Create constraint table";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS graph_constraints (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            entity_type TEXT NOT NULL,
            label TEXT NOT NULL,
            property TEXT NOT NULL,
            kind TEXT NOT NULL,
            UNIQUE (entity_type, label, property, kind)
        );
    )";
    return m;
}

} // namespace neograph::storage
