#pragma once

#include <lore/metadata/database.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lore::metadata {

/**
 * @brief Database migration definition
 *
 * Migrations are forward-only; there is no down step.
 */
struct Migration {
    int version;        ///< Migration version number, stored in PRAGMA user_version
    std::string name;   ///< Human-readable name
    std::string upSQL;  ///< SQL to apply migration

    /**
     * @brief Custom migration function (for conditional migrations)
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
 * @brief Forward-only schema migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create history table)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version (PRAGMA user_version)
     */
    Result<int> getCurrentVersion();

    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     *
     * A database whose version is newer than the latest registered migration
     * is rejected with ErrorCode::NotSupported.
     */
    Result<void> migrate();

    Result<void> migrateTo(int targetVersion);

    Result<std::vector<MigrationHistory>> getHistory();

    /**
     * @brief Run PRAGMA quick_check and, when present, the FTS5 integrity check
     */
    Result<void> verifyIntegrity();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);

    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");

    Result<void> createMigrationTables();
};

/**
 * @brief Built-in migrations for the knowledge store schema
 */
class KnowledgeMigrations {
public:
    static std::vector<Migration> getAllMigrations();

    static constexpr int kSchemaVersion = 4;

private:
    // Version 1: knowledge table and indexes
    static Migration createInitialSchema();

    // Version 2: FTS5 external-content index kept in sync by triggers
    static Migration createFTS5Index();

    // Version 3: project_slug and ttl_category columns, canonical hash index
    static Migration addLifecycleColumns();

    // Version 4: store_settings key/value table
    static Migration createStoreSettings();
};

} // namespace lore::metadata
