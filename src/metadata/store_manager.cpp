#include <spdlog/spdlog.h>
#include <pwd.h>
#include <unistd.h>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <lore/config/config_helpers.h>
#include <lore/lifecycle/lifecycle_manager.h>
#include <lore/metadata/migration.h>
#include <lore/metadata/store_manager.h>

namespace lore::metadata {

namespace {

constexpr int kMinSqliteVersion = 3038000; // built-in JSON functions

std::string sanitizeFileStem(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        out.push_back(std::isalnum(c) || c == '-' || c == '_' || c == '.' ? static_cast<char>(c)
                                                                          : '_');
    }
    if (out.empty() || out.front() == '.') {
        out.insert(out.begin(), '_');
    }
    return out;
}

std::filesystem::path nearestExistingAncestor(std::filesystem::path dir) {
    std::error_code ec;
    while (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        auto parent = dir.parent_path();
        if (parent == dir)
            break;
        dir = parent;
    }
    return dir;
}

std::string cacheKey(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal().string() : canonical.string();
}

} // namespace

StoreManager::StoreManager(config::StoreConfig config) : config_(std::move(config)) {
    if (config_.globalDir.empty()) {
        config_.globalDir = config::resolve_global_dir_from_config(config::get_config_path());
    }
    config::configure_logging(config_.logLevel);
}

StoreManager::~StoreManager() {
    closeAll();
}

std::string StoreManager::username() const {
    if (!config_.username.empty()) {
        return sanitizeFileStem(config_.username);
    }
    if (const passwd* pw = ::getpwuid(::geteuid()); pw && pw->pw_name && *pw->pw_name) {
        return sanitizeFileStem(pw->pw_name);
    }
    if (const char* user = std::getenv("USER"); user && *user) {
        return sanitizeFileStem(user);
    }
    return "default";
}

std::filesystem::path StoreManager::resolvePath(Scope scope) const {
    const auto file = username() + ".db";
    if (scope == Scope::Global) {
        return config_.globalDir / file;
    }
    std::filesystem::path root = config_.projectRoot;
    if (root.empty()) {
        std::error_code ec;
        root = std::filesystem::current_path(ec);
        if (ec) {
            root = ".";
        }
    }
    return root / ".lore" / "knowledge" / file;
}

Availability StoreManager::isAvailable(Scope scope) const {
    Availability result;

    if (sqlite3_threadsafe() == 0) {
        result.reason = "SQLite built without thread safety";
        return result;
    }
    if (sqlite3_libversion_number() < kMinSqliteVersion) {
        result.reason = "SQLite " + Database::version() + " is older than 3.38.0";
        return result;
    }

    const auto dir = resolvePath(scope).parent_path();
    const auto existing = nearestExistingAncestor(dir);
    std::error_code ec;
    if (existing.empty() || !std::filesystem::is_directory(existing, ec)) {
        result.reason = "No usable directory for " + dir.string();
        return result;
    }
    if (::access(existing.c_str(), W_OK) != 0) {
        result.reason = "Directory not writable: " + existing.string();
        return result;
    }

    result.available = true;
    if (sqlite3_compileoption_used("ENABLE_FTS5") != 1) {
        result.reason = "FTS5 not compiled in; keyword search disabled";
    }
    return result;
}

Result<std::shared_ptr<StoreConnection>> StoreManager::open(Scope scope) {
    return openPath(resolvePath(scope), scope);
}

Result<std::shared_ptr<StoreConnection>> StoreManager::openPath(const std::filesystem::path& path,
                                                               Scope scope) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto key = cacheKey(path);
    if (auto it = connections_.find(key); it != connections_.end()) {
        return it->second;
    }

    auto connResult = openUncached(path, scope);
    if (!connResult)
        return connResult.error();

    auto conn = std::move(connResult).value();
    connections_.emplace(key, conn);
    return conn;
}

Result<std::shared_ptr<StoreConnection>>
StoreManager::openUncached(const std::filesystem::path& path, Scope scope) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied, "Cannot create store directory " +
                                                          path.parent_path().string() + ": " +
                                                          ec.message()};
        }
    }

    auto conn = std::make_shared<StoreConnection>();
    conn->scope = scope;
    conn->path = path;
    conn->config = config_;

    std::lock_guard<std::recursive_mutex> connLock(conn->mutex);

    auto openResult = conn->db.open(path.string(), ConnectionMode::Create);
    if (!openResult) {
        spdlog::error("[StoreManager] Failed to open {}: {}", path.string(),
                      openResult.error().message);
        return openResult.error();
    }

    auto timeoutResult = conn->db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult)
        return timeoutResult.error();

    // Integrity first: a damaged file must not be migrated or written to
    MigrationManager migrations(conn->db);
    auto integrity = migrations.verifyIntegrity();
    if (!integrity) {
        auto error = integrity.error();
        if (error.code == ErrorCode::CorruptedData) {
            error = Error{ErrorCode::CorruptedData,
                          "Store " + path.string() + " is corrupted: " + error.message};
        }
        spdlog::error("[StoreManager] {}", error.message);
        return error;
    }

    auto configResult = configureConnection(*conn);
    if (!configResult)
        return configResult.error();

    auto initResult = migrations.initialize();
    if (!initResult)
        return initResult.error();
    migrations.registerMigrations(KnowledgeMigrations::getAllMigrations());
    auto migrateResult = migrations.migrate();
    if (!migrateResult) {
        spdlog::error("[StoreManager] Migration of {} failed: {}", path.string(),
                      migrateResult.error().message);
        return migrateResult.error();
    }

    auto ftsResult = conn->db.tableExists("knowledge_fts");
    conn->ftsEnabled = ftsResult && ftsResult.value();
    if (!conn->ftsEnabled) {
        spdlog::warn("[StoreManager] {} has no FTS5 index; keyword search disabled",
                     path.string());
    }

    auto pinResult = pinEmbeddingDimension(*conn);
    if (!pinResult)
        return pinResult.error();

    initializeVectorIndex(*conn);

    if (config_.cleanupOnOpen) {
        lifecycle::LifecycleManager lifecycle(conn);
        auto swept = lifecycle.cleanupExpired();
        if (!swept) {
            spdlog::warn("[StoreManager] Expiry sweep on open failed: {}", swept.error().message);
        }
    }

    spdlog::info("[StoreManager] Opened {} store at {} (fts={}, vector={})",
                 scopeToString(scope), path.string(), conn->ftsEnabled,
                 conn->vectorEnabled ? conn->vectorIndex->backendName() : "disabled");
    return conn;
}

Result<void> StoreManager::configureConnection(StoreConnection& conn) {
    auto& db = conn.db;
    if (conn.config.cacheSizeKb <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "cache_size_kb must be positive, got " + std::to_string(conn.config.cacheSizeKb)};
    }

    auto walResult = db.enableWAL();
    if (!walResult) {
        if (walResult.error().code == ErrorCode::CorruptedData ||
            walResult.error().code == ErrorCode::Timeout) {
            return walResult.error();
        }
        spdlog::warn("[StoreManager] WAL enable failed: {}", walResult.error().message);
    }

    for (const std::string pragma :
         {std::string("PRAGMA synchronous = NORMAL"),
          "PRAGMA cache_size = -" + std::to_string(conn.config.cacheSizeKb),
          std::string("PRAGMA temp_store = MEMORY"), std::string("PRAGMA foreign_keys = ON")}) {
        auto result = db.execute(pragma);
        if (!result)
            return result.error();
    }
    return {};
}

Result<void> StoreManager::pinEmbeddingDimension(StoreConnection& conn) {
    // First writer wins; concurrent openers read back whatever was pinned
    auto insertResult = conn.db.prepare(
        "INSERT OR IGNORE INTO store_settings(key, value) VALUES ('embedding_dim', ?)");
    if (!insertResult)
        return insertResult.error();
    Statement insert = std::move(insertResult).value();
    auto bindResult = insert.bind(1, std::to_string(conn.config.embeddingDim));
    if (!bindResult)
        return bindResult;
    auto execResult = insert.execute();
    if (!execResult)
        return execResult;

    auto selectResult = conn.db.prepare("SELECT value FROM store_settings WHERE key = 'embedding_dim'");
    if (!selectResult)
        return selectResult.error();

    Statement select = std::move(selectResult).value();
    auto stepResult = select.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return Error{ErrorCode::CorruptedData, "embedding_dim missing from store_settings"};
    }

    const auto stored = select.getString(0);
    try {
        conn.embeddingDim = static_cast<std::size_t>(std::stoull(stored));
    } catch (const std::exception&) {
        return Error{ErrorCode::CorruptedData, "Invalid pinned embedding_dim '" + stored + "'"};
    }
    if (conn.embeddingDim != conn.config.embeddingDim) {
        spdlog::warn("[StoreManager] {} pinned to {} dimensions; ignoring configured {}",
                     conn.path.string(), conn.embeddingDim, conn.config.embeddingDim);
    }
    return {};
}

void StoreManager::initializeVectorIndex(StoreConnection& conn) {
    conn.vectorEnabled = false;
    if (conn.config.vectorBackend == config::VectorBackendType::None &&
        !conn.config.vectorIndexFactory) {
        spdlog::info("[StoreManager] Vector search disabled by configuration");
        return;
    }

    auto indexResult = conn.config.vectorIndexFactory
                           ? conn.config.vectorIndexFactory(conn.db, conn.config)
                           : vector::createVectorIndex(conn.db, conn.config);
    if (!indexResult) {
        spdlog::warn("[StoreManager] Vector index unavailable: {}", indexResult.error().message);
        return;
    }

    auto index = std::move(indexResult).value();
    auto initResult = index->initialize(conn.embeddingDim);
    if (!initResult) {
        spdlog::warn("[StoreManager] Vector capability disabled for {}: {}", conn.path.string(),
                     initResult.error().message);
        return;
    }

    // Rows deleted while the index was unavailable leave their vectors behind
    auto pruned = vector::pruneOrphanVectors(conn.db, *index);
    if (!pruned) {
        spdlog::warn("[StoreManager] Orphan vector cleanup failed for {}: {}", conn.path.string(),
                     pruned.error().message);
    } else if (pruned.value() > 0) {
        spdlog::info("[StoreManager] Removed {} orphaned vector rows from {}", pruned.value(),
                     conn.path.string());
    }

    conn.vectorIndex = std::move(index);
    conn.vectorEnabled = true;
}

void StoreManager::close(const std::shared_ptr<StoreConnection>& conn) {
    if (!conn)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = connections_.begin(); it != connections_.end(); ++it) {
        if (it->second == conn) {
            spdlog::debug("[StoreManager] Closing {}", conn->path.string());
            connections_.erase(it);
            return;
        }
    }
}

void StoreManager::closeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connections_.empty()) {
        spdlog::debug("[StoreManager] Closing {} store(s)", connections_.size());
    }
    connections_.clear();
}

std::size_t StoreManager::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace lore::metadata
