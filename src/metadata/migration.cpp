#include <lore/metadata/migration.h>
#include <spdlog/spdlog.h>

namespace lore::metadata {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
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
    auto value = db_.pragmaValue("user_version");
    if (!value)
        return value.error();
    if (value.value().empty()) {
        return 0;
    }
    try {
        return std::stoi(value.value());
    } catch (const std::exception&) {
        return Error{ErrorCode::CorruptedData, "Unreadable user_version: " + value.value()};
    }
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
    return migrateTo(getLatestVersion());
}

Result<void> MigrationManager::migrateTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();

    if (currentVersion == targetVersion) {
        spdlog::debug("[Migration] Already at version {}", targetVersion);
        return {};
    }

    if (currentVersion > targetVersion) {
        return Error{ErrorCode::NotSupported,
                     "Schema version " + std::to_string(currentVersion) +
                         " is newer than supported version " + std::to_string(targetVersion)};
    }

    int totalMigrations = 0;
    for (const auto& [version, _] : migrations_) {
        if (version > currentVersion && version <= targetVersion) {
            totalMigrations++;
        }
    }

    int appliedMigrations = 0;

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion || version > targetVersion) {
            continue;
        }
        spdlog::debug("[Migration] Applying {} '{}' ({}/{})", version, migration.name,
                      ++appliedMigrations, totalMigrations);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            spdlog::error("[Migration] {} '{}' failed: {}", version, migration.name,
                          result.error().message);
            if (auto recordResult =
                    recordMigration(version, migration.name, duration, false, result.error().message);
                !recordResult) {
                spdlog::warn("[Migration] Could not record failure: {}",
                             recordResult.error().message);
            }
            return result;
        }

        currentVersion = version;
    }

    spdlog::info("[Migration] Schema now at version {}", currentVersion);
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
        entry.appliedAt = fromEpochMillis(stmt.getInt64(2));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);

        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::verifyIntegrity() {
    auto stmtResult = db_.prepare("PRAGMA quick_check");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (stepResult.value()) {
        auto verdict = stmt.getString(0);
        if (verdict != "ok") {
            return Error{ErrorCode::CorruptedData, "quick_check: " + verdict};
        }
    }

    auto ftsCheck = db_.tableExists("knowledge_fts");
    if (ftsCheck && ftsCheck.value()) {
        auto ftsResult =
            db_.execute("INSERT INTO knowledge_fts(knowledge_fts) VALUES('integrity-check')");
        if (!ftsResult) {
            return Error{ErrorCode::CorruptedData,
                         "FTS5 integrity check failed: " + ftsResult.error().message};
        }
    }

    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    auto start = std::chrono::steady_clock::now();
    return db_.transaction(
        [&]() -> Result<void> {
            // Another connection may have migrated between our version read and the write lock
            auto current = getCurrentVersion();
            if (!current)
                return current.error();
            if (current.value() >= migration.version) {
                spdlog::debug("[Migration] {} '{}' already applied by another connection",
                              migration.version, migration.name);
                return {};
            }

            Result<void> result;
            if (migration.upFunc) {
                result = migration.upFunc(db_);
            } else if (!migration.upSQL.empty()) {
                result = db_.execute(migration.upSQL);
            } else {
                return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
            }
            if (!result)
                return result;

            // PRAGMA does not accept bound parameters
            result = db_.execute("PRAGMA user_version = " + std::to_string(migration.version));
            if (!result)
                return result;

            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            return recordMigration(migration.version, migration.name, duration, true);
        },
        TransactionMode::Immediate);
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult =
        stmt.bindAll(version, name, toEpochMillis(std::chrono::system_clock::now()),
                     static_cast<int64_t>(duration.count()), success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

// KnowledgeMigrations implementation
std::vector<Migration> KnowledgeMigrations::getAllMigrations() {
    return {createInitialSchema(), createFTS5Index(), addLifecycleColumns(), createStoreSettings()};
}

Migration KnowledgeMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create knowledge table";

    // AUTOINCREMENT keeps ids from being reused, vector rows are keyed by the same id
    m.upSQL = R"(
        CREATE TABLE knowledge (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            content TEXT NOT NULL,
            type TEXT NOT NULL,
            scope TEXT NOT NULL DEFAULT 'global',
            created_at INTEGER NOT NULL,
            expires_at INTEGER,
            access_count INTEGER NOT NULL DEFAULT 0,
            last_accessed INTEGER,
            content_hash TEXT NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}'
        );

        CREATE INDEX idx_knowledge_type ON knowledge(type);
        CREATE INDEX idx_knowledge_scope ON knowledge(scope);
        CREATE INDEX idx_knowledge_expires ON knowledge(expires_at);
        CREATE INDEX idx_knowledge_hash ON knowledge(content_hash);
        CREATE INDEX idx_knowledge_access ON knowledge(access_count DESC, created_at DESC);
    )";

    return m;
}

Migration KnowledgeMigrations::createFTS5Index() {
    Migration m;
    m.version = 2;
    m.name = "Create FTS5 index";

    m.upFunc = [](Database& db) -> Result<void> {
        auto fts5Result = db.hasFTS5();
        if (!fts5Result)
            return fts5Result.error();

        if (!fts5Result.value()) {
            spdlog::warn("[Migration] FTS5 not available, keyword search disabled");
            return {};
        }

        return db.execute(R"(
            CREATE VIRTUAL TABLE knowledge_fts USING fts5(
                content,
                content='knowledge',
                content_rowid='id',
                tokenize='porter unicode61'
            );

            CREATE TRIGGER knowledge_fts_ai AFTER INSERT ON knowledge BEGIN
                INSERT INTO knowledge_fts(rowid, content) VALUES (new.id, new.content);
            END;

            CREATE TRIGGER knowledge_fts_ad AFTER DELETE ON knowledge BEGIN
                INSERT INTO knowledge_fts(knowledge_fts, rowid, content)
                VALUES ('delete', old.id, old.content);
            END;

            CREATE TRIGGER knowledge_fts_au AFTER UPDATE OF content ON knowledge BEGIN
                INSERT INTO knowledge_fts(knowledge_fts, rowid, content)
                VALUES ('delete', old.id, old.content);
                INSERT INTO knowledge_fts(rowid, content) VALUES (new.id, new.content);
            END;

            INSERT INTO knowledge_fts(knowledge_fts) VALUES ('rebuild');
        )");
    };

    return m;
}

Migration KnowledgeMigrations::addLifecycleColumns() {
    Migration m;
    m.version = 3;
    m.name = "Add project slug and TTL category";

    m.upSQL = R"(
        ALTER TABLE knowledge ADD COLUMN project_slug TEXT;
        ALTER TABLE knowledge ADD COLUMN ttl_category TEXT;

        UPDATE knowledge SET project_slug = json_extract(metadata, '$.project_slug')
        WHERE project_slug IS NULL AND json_valid(metadata);

        UPDATE knowledge SET ttl_category = CASE type
            WHEN 'lesson' THEN 'permanent'
            WHEN 'decision' THEN 'long_term'
            WHEN 'summary' THEN 'short_term'
            WHEN 'temp_note' THEN 'ephemeral'
            ELSE 'short_term' END
        WHERE ttl_category IS NULL;

        CREATE INDEX idx_knowledge_project ON knowledge(project_slug);
        CREATE INDEX idx_knowledge_canonical
            ON knowledge(json_extract(metadata, '$.canonical_hash'));
    )";

    return m;
}

Migration KnowledgeMigrations::createStoreSettings() {
    Migration m;
    m.version = 4;
    m.name = "Create store settings";

    m.upSQL = R"(
        CREATE TABLE store_settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    return m;
}

} // namespace lore::metadata
